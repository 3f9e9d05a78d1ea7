// SPDX-License-Identifier: GPL-3.0-or-later
// Lazyset - Lazy set operations over sequences for C++20

#ifndef LAZYSET_GENERATOR_HPP
#define LAZYSET_GENERATOR_HPP

#include "config.hpp"

#include <cstddef>
#include <exception>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace lazyset {

// Forward declarations
template<typename T>
class Generator;

template<typename T>
class GeneratorPromise;

// Promise type for Generator. Yielded values are exposed read-only: the
// generators in this library only ever pass through elements they do not own.
template<typename T>
class GeneratorPromise {
public:
    using value_type = std::remove_cvref_t<T>;
    using reference = const value_type&;
    using pointer = const value_type*;
    using handle_type = coroutine_handle<GeneratorPromise>;

    GeneratorPromise() = default;

    Generator<T> get_return_object() noexcept;

    // Start suspended - lazy evaluation
    suspend_always initial_suspend() noexcept { return {}; }

    // Suspend at the end to allow final iteration check
    suspend_always final_suspend() noexcept { return {}; }

    // A temporary bound here lives until the co_yield full-expression ends,
    // which is after the consumer resumes us.
    suspend_always yield_value(const value_type& value) noexcept {
        current_value_ = std::addressof(value);
        return {};
    }

    suspend_always yield_value(value_type&& value) noexcept {
        current_value_ = std::addressof(value);
        return {};
    }

    void unhandled_exception() {
        exception_ = std::current_exception();
    }

    void return_void() noexcept {}

    reference value() const noexcept {
        return *current_value_;
    }

    void rethrow_if_exception() {
        if (exception_) {
            std::rethrow_exception(std::exchange(exception_, nullptr));
        }
    }

    template<typename U>
    suspend_never await_transform(U&&) = delete; // Generators cannot co_await

private:
    pointer current_value_{nullptr};
    std::exception_ptr exception_{nullptr};
};

// Sentinel type for Generator (more efficient than comparing iterators)
struct GeneratorSentinel {};

// Iterator for Generator
template<typename T>
class GeneratorIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = typename GeneratorPromise<T>::value_type;
    using reference = typename GeneratorPromise<T>::reference;
    using pointer = typename GeneratorPromise<T>::pointer;

    GeneratorIterator() noexcept = default;

    explicit GeneratorIterator(coroutine_handle<GeneratorPromise<T>> handle) noexcept
        : handle_(handle) {}

    reference operator*() const noexcept {
        LAZYSET_ASSERT(handle_ && !handle_.done());
        return handle_.promise().value();
    }

    pointer operator->() const noexcept {
        return std::addressof(operator*());
    }

    GeneratorIterator& operator++() {
        LAZYSET_ASSERT(handle_);
        LAZYSET_ASSERT(!handle_.done());
        handle_.resume();
        if (handle_.done()) {
            handle_.promise().rethrow_if_exception();
        }
        return *this;
    }

    void operator++(int) {
        ++*this;
    }

    bool operator==(const GeneratorIterator& other) const noexcept {
        // Both are end iterators if handle is done or null
        bool this_is_end = !handle_ || handle_.done();
        bool other_is_end = !other.handle_ || other.handle_.done();
        return this_is_end && other_is_end;
    }

    bool operator==(GeneratorSentinel) const noexcept {
        return !handle_ || handle_.done();
    }

private:
    coroutine_handle<GeneratorPromise<T>> handle_{nullptr};
};

// A synchronous coroutine that yields values lazily. Single pass: once
// exhausted it stays exhausted. Sequence<T> builds re-traversable handles
// on top of it.
template<typename T>
class Generator {
public:
    using promise_type = GeneratorPromise<T>;
    using handle_type = coroutine_handle<promise_type>;
    using iterator = GeneratorIterator<T>;
    using sentinel = GeneratorSentinel;
    using value_type = typename promise_type::value_type;
    using reference = typename promise_type::reference;

    Generator() noexcept = default;

    explicit Generator(handle_type h) noexcept : handle_(h) {}

    // Move-only semantics
    Generator(Generator&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Generator& operator=(Generator&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    // Destroying a suspended generator unwinds its frame, so abandoning a
    // traversal halfway releases everything the coroutine holds.
    ~Generator() {
        if (handle_) {
            handle_.destroy();
        }
    }

    LAZYSET_NODISCARD bool valid() const noexcept {
        return handle_ != nullptr;
    }

    LAZYSET_NODISCARD explicit operator bool() const noexcept {
        return valid();
    }

    LAZYSET_NODISCARD bool done() const noexcept {
        return !handle_ || handle_.done();
    }

    // Range interface
    iterator begin() {
        if (handle_) {
            handle_.resume();
            if (handle_.done()) {
                handle_.promise().rethrow_if_exception();
            }
        }
        return iterator{handle_};
    }

    sentinel end() noexcept {
        return sentinel{};
    }

    // Manual iteration interface
    bool next() {
        LAZYSET_ASSERT(handle_);
        if (handle_.done()) {
            return false;
        }
        handle_.resume();
        if (handle_.done()) {
            handle_.promise().rethrow_if_exception();
            return false;
        }
        return true;
    }

    reference value() const {
        LAZYSET_ASSERT(handle_ && !handle_.done());
        return handle_.promise().value();
    }

    handle_type handle() const noexcept {
        return handle_;
    }

private:
    handle_type handle_{nullptr};
};

template<typename T>
Generator<T> GeneratorPromise<T>::get_return_object() noexcept {
    return Generator<T>{handle_type::from_promise(*this)};
}

// Utility generators

// Walk a caller-owned range without copying it. The range must outlive
// the generator.
template<typename Range>
auto borrow_range(const Range* range) -> Generator<typename Range::value_type> {
    for (const auto& elem : *range) {
        co_yield elem;
    }
}

// Take first n elements from a generator
template<typename T>
Generator<T> take(Generator<T> gen, std::size_t n) {
    if (n == 0) {
        co_return;
    }
    std::size_t count = 0;
    for (const auto& value : gen) {
        co_yield value;
        if (++count >= n) {
            break;
        }
    }
}

} // namespace lazyset

#endif // LAZYSET_GENERATOR_HPP
