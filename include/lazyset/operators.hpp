// SPDX-License-Identifier: GPL-3.0-or-later
// Lazyset - Lazy set operations over sequences for C++20

#ifndef LAZYSET_OPERATORS_HPP
#define LAZYSET_OPERATORS_HPP

#include "config.hpp"
#include "equality.hpp"
#include "generator.hpp"
#include "sequence.hpp"

#include <utility>

namespace lazyset {

// All operators validate their arguments immediately and return a Sequence
// without reading any source. Work happens per traversal, in the coroutines
// below; each traversal builds its own membership table.

namespace detail {

template<typename T, typename E>
Generator<T> unite_elements(Sequence<T> first, Sequence<T> second, E notion) {
    ElementSet<T, E> seen(notion);
    for (const auto& value : first) {
        if (seen.insert(value)) {
            co_yield value;
        }
    }
    for (const auto& value : second) {
        if (seen.insert(value)) {
            co_yield value;
        }
    }
}

// Removing a match from the table both tests membership in the second
// sequence and keeps a repeated element of the first from matching again.
template<typename T, typename E>
Generator<T> intersect_elements(Sequence<T> first, Sequence<T> second, E notion) {
    ElementSet<T, E> candidates(notion);
    for (const auto& value : second) {
        candidates.insert(value);
    }
    for (const auto& value : first) {
        if (candidates.remove(value)) {
            co_yield value;
        }
    }
}

// Seeded with the excluded elements; every yielded element joins them.
template<typename T, typename E>
Generator<T> except_elements(Sequence<T> first, Sequence<T> second, E notion) {
    ElementSet<T, E> excluded(notion);
    for (const auto& value : second) {
        excluded.insert(value);
    }
    for (const auto& value : first) {
        if (excluded.insert(value)) {
            co_yield value;
        }
    }
}

template<typename T>
Generator<T> concat_elements(Sequence<T> first, Sequence<T> second) {
    for (const auto& value : first) {
        co_yield value;
    }
    for (const auto& value : second) {
        co_yield value;
    }
}

template<typename T, typename E>
Generator<T> distinct_elements(Sequence<T> source, E notion) {
    ElementSet<T, E> seen(notion);
    for (const auto& value : source) {
        if (seen.insert(value)) {
            co_yield value;
        }
    }
}

} // namespace detail

// ============================================================================
// unite - set union (union is a keyword)
// ============================================================================

// Distinct elements of first in order, then those of second not seen yet.
template<typename T, typename E = DefaultEquality<T>>
Sequence<T> unite(Sequence<T> first, Sequence<T> second, E notion = {}) {
    detail::require(first.valid(), "unite", "first sequence");
    detail::require(second.valid(), "unite", "second sequence");
    return Sequence<T>{[first = std::move(first), second = std::move(second), notion = std::move(notion)]() {
        return detail::unite_elements<T, E>(first, second, notion);
    }};
}

// ============================================================================
// intersect - set intersection
// ============================================================================

// Elements of first that have an equivalent in second, in first's order,
// each equivalence class once. Reads all of second on the first pull.
template<typename T, typename E = DefaultEquality<T>>
Sequence<T> intersect(Sequence<T> first, Sequence<T> second, E notion = {}) {
    detail::require(first.valid(), "intersect", "first sequence");
    detail::require(second.valid(), "intersect", "second sequence");
    return Sequence<T>{[first = std::move(first), second = std::move(second), notion = std::move(notion)]() {
        return detail::intersect_elements<T, E>(first, second, notion);
    }};
}

// ============================================================================
// except - set difference
// ============================================================================

// Elements of first with no equivalent in second, in first's order, each
// equivalence class once. Reads all of second on the first pull.
template<typename T, typename E = DefaultEquality<T>>
Sequence<T> except(Sequence<T> first, Sequence<T> second, E notion = {}) {
    detail::require(first.valid(), "except", "first sequence");
    detail::require(second.valid(), "except", "second sequence");
    return Sequence<T>{[first = std::move(first), second = std::move(second), notion = std::move(notion)]() {
        return detail::except_elements<T, E>(first, second, notion);
    }};
}

// ============================================================================
// concat - concatenation, duplicates kept
// ============================================================================

template<typename T>
Sequence<T> concat(Sequence<T> first, Sequence<T> second) {
    detail::require(first.valid(), "concat", "first sequence");
    detail::require(second.valid(), "concat", "second sequence");
    return Sequence<T>{[first = std::move(first), second = std::move(second)]() {
        return detail::concat_elements<T>(first, second);
    }};
}

// ============================================================================
// distinct - first occurrence of each equivalence class
// ============================================================================

template<typename T, typename E = DefaultEquality<T>>
Sequence<T> distinct(Sequence<T> source, E notion = {}) {
    detail::require(source.valid(), "distinct", "source sequence");
    return Sequence<T>{[source = std::move(source), notion = std::move(notion)]() {
        return detail::distinct_elements<T, E>(source, notion);
    }};
}

// ============================================================================
// Key projections
// ============================================================================

template<typename T, typename KeyFn>
Sequence<T> distinct_by(Sequence<T> source, KeyFn key) {
    return lazyset::distinct(std::move(source), by_key(std::move(key)));
}

template<typename T, typename KeyFn>
Sequence<T> unite_by(Sequence<T> first, Sequence<T> second, KeyFn key) {
    return lazyset::unite(std::move(first), std::move(second), by_key(std::move(key)));
}

template<typename T, typename KeyFn>
Sequence<T> intersect_by(Sequence<T> first, Sequence<T> second, KeyFn key) {
    return lazyset::intersect(std::move(first), std::move(second), by_key(std::move(key)));
}

template<typename T, typename KeyFn>
Sequence<T> except_by(Sequence<T> first, Sequence<T> second, KeyFn key) {
    return lazyset::except(std::move(first), std::move(second), by_key(std::move(key)));
}

// ============================================================================
// Sequence members
// ============================================================================

template<typename T>
template<typename E>
Sequence<T> Sequence<T>::unite(const Sequence& other, E notion) const {
    return lazyset::unite(*this, other, std::move(notion));
}

template<typename T>
template<typename E>
Sequence<T> Sequence<T>::intersect(const Sequence& other, E notion) const {
    return lazyset::intersect(*this, other, std::move(notion));
}

template<typename T>
template<typename E>
Sequence<T> Sequence<T>::except(const Sequence& other, E notion) const {
    return lazyset::except(*this, other, std::move(notion));
}

template<typename T>
Sequence<T> Sequence<T>::concat(const Sequence& other) const {
    return lazyset::concat(*this, other);
}

template<typename T>
template<typename E>
Sequence<T> Sequence<T>::distinct(E notion) const {
    return lazyset::distinct(*this, std::move(notion));
}

} // namespace lazyset

#endif // LAZYSET_OPERATORS_HPP
