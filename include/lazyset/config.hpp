// SPDX-License-Identifier: GPL-3.0-or-later
// Lazyset - Lazy set operations over sequences for C++20

#ifndef LAZYSET_CONFIG_HPP
#define LAZYSET_CONFIG_HPP

// Version information
#define LAZYSET_VERSION_MAJOR 0
#define LAZYSET_VERSION_MINOR 1
#define LAZYSET_VERSION_PATCH 0
#define LAZYSET_VERSION_STRING "0.1.0"

// C++ standard detection
#if defined(_MSVC_LANG)
    #define LAZYSET_CPLUSPLUS _MSVC_LANG
#else
    #define LAZYSET_CPLUSPLUS __cplusplus
#endif

#if LAZYSET_CPLUSPLUS < 202002L
    #error "Lazyset requires C++20 or later"
#endif

// Coroutine support detection
#include <version>
#if defined(__cpp_impl_coroutine) && defined(__cpp_lib_coroutine)
    #define LAZYSET_HAS_COROUTINES 1
    #include <coroutine>
    namespace lazyset {
        using std::coroutine_handle;
        using std::suspend_always;
        using std::suspend_never;
    }
#endif

#if !defined(LAZYSET_HAS_COROUTINES)
    #error "Lazyset requires coroutine support. Compile with -std=c++20 (GCC 10 also needs -fcoroutines)"
#endif

// Utility macros
#define LAZYSET_NODISCARD [[nodiscard]]

// Assert configuration
#ifndef LAZYSET_ASSERT
    #include <cassert>
    #define LAZYSET_ASSERT(cond) assert(cond)
#endif

// Trace configuration. Define LAZYSET_ENABLE_TRACE to get traversal and
// argument-validation messages on std::clog, or define LAZYSET_TRACE
// yourself to route them elsewhere.
#ifndef LAZYSET_TRACE
    #if defined(LAZYSET_ENABLE_TRACE)
        #include <iostream>
        #define LAZYSET_TRACE(msg) (std::clog << "[lazyset] " << msg << '\n')
    #else
        #define LAZYSET_TRACE(msg) ((void)0)
    #endif
#endif

#endif // LAZYSET_CONFIG_HPP
