// SPDX-License-Identifier: GPL-3.0-or-later
// Lazyset - Lazy set operations over sequences for C++20
//
// A header-only library of set operators over ordered sequences:
//   - Sequence<T>: re-traversable lazy handle; nothing runs until iterated
//   - unite, intersect, except, concat, distinct (+ *_by key projections)
//   - Equality notions: DefaultEquality, make_equality, by_key,
//     CaseInsensitiveEquality
//   - Generator<T>: the single-pass coroutine underneath
//
// Quick Start:
//
//   #include <lazyset/lazyset.hpp>
//   #include <iostream>
//
//   int main() {
//       std::vector<std::string> mine{"Carrots", "Tofu", "Lettuce"};
//       std::vector<std::string> yours{"Tofu", "Pizza"};
//
//       auto shared = lazyset::intersect(lazyset::from(mine), lazyset::from(yours));
//       for (const auto& food : shared) {
//           std::cout << food << "\n";   // Tofu
//       }
//   }
//
// Requires C++20 with coroutine support.
// Compile with: -std=c++20 (GCC 10 also needs -fcoroutines)

#ifndef LAZYSET_HPP
#define LAZYSET_HPP

#include "config.hpp"
#include "generator.hpp"
#include "equality.hpp"
#include "sequence.hpp"
#include "operators.hpp"

#endif // LAZYSET_HPP
