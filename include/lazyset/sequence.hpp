// SPDX-License-Identifier: GPL-3.0-or-later
// Lazyset - Lazy set operations over sequences for C++20

#ifndef LAZYSET_SEQUENCE_HPP
#define LAZYSET_SEQUENCE_HPP

#include "config.hpp"
#include "equality.hpp"
#include "generator.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazyset {

template<typename T>
class Sequence;

namespace detail {

inline void require(bool present, const char* operation, const char* argument) {
    if (!present) {
        LAZYSET_TRACE(operation << ": missing " << argument);
        throw std::invalid_argument(std::string("lazyset::") + operation + ": " + argument + " is absent");
    }
}

// Like borrow_range, but the frame co-owns the range so a running traversal
// survives the Sequence that started it.
template<typename Range>
auto share_range(std::shared_ptr<Range> range) -> Generator<typename std::remove_const_t<Range>::value_type> {
    for (const auto& elem : *range) {
        co_yield elem;
    }
}

} // namespace detail

// Iterator for Sequence. Owns the generator of one traversal; copies of the
// iterator share it, as input iterators do.
template<typename T>
class SequenceIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = T;
    using reference = const T&;
    using pointer = const T*;

    SequenceIterator() noexcept = default;

    explicit SequenceIterator(Generator<T> generator)
        : generator_(std::make_shared<Generator<T>>(std::move(generator))) {
        if (generator_->valid()) {
            generator_->next();
        }
    }

    reference operator*() const {
        return generator_->value();
    }

    pointer operator->() const {
        return std::addressof(operator*());
    }

    SequenceIterator& operator++() {
        LAZYSET_ASSERT(generator_);
        generator_->next();
        return *this;
    }

    void operator++(int) {
        ++*this;
    }

    bool operator==(const SequenceIterator& other) const noexcept {
        return at_end() && other.at_end();
    }

    bool operator==(GeneratorSentinel) const noexcept {
        return at_end();
    }

private:
    bool at_end() const noexcept {
        return !generator_ || generator_->done();
    }

    std::shared_ptr<Generator<T>> generator_;
};

// ============================================================================
// Sequence - a re-traversable lazy handle
// ============================================================================
//
// A Sequence stores how to produce its elements, never the elements
// themselves. Each begin() (or traverse()) calls the factory again, so a
// Sequence over a container sees whatever the container holds at that
// moment, and two traversals never share state.
//
//   std::vector<std::string> fridge{"Tofu", "Lettuce"};
//   auto seq = lazyset::from(fridge);   // nothing read yet
//   fridge.push_back("Carrots");
//   for (const auto& food : seq) { ... } // sees all three
//
template<typename T>
class Sequence {
public:
    using value_type = T;
    using reference = const T&;
    using factory_type = std::function<Generator<T>()>;
    using iterator = SequenceIterator<T>;
    using sentinel = GeneratorSentinel;

    // An absent sequence. Operators reject it with std::invalid_argument.
    Sequence() noexcept = default;

    explicit Sequence(factory_type factory)
        : factory_(std::move(factory)) {
        detail::require(static_cast<bool>(factory_), "Sequence", "factory");
    }

    LAZYSET_NODISCARD bool valid() const noexcept {
        return static_cast<bool>(factory_);
    }

    LAZYSET_NODISCARD explicit operator bool() const noexcept {
        return valid();
    }

    // Start a fresh single-pass traversal
    Generator<T> traverse() const {
        if (!factory_) {
            throw std::logic_error("lazyset::Sequence: traversal of an absent sequence");
        }
        LAZYSET_TRACE("traversal started");
        return factory_();
    }

    iterator begin() const {
        return iterator{traverse()};
    }

    sentinel end() const noexcept {
        return sentinel{};
    }

    // Materialize one full traversal
    std::vector<T> to_vector() const {
        std::vector<T> result;
        for (const auto& value : *this) {
            result.push_back(value);
        }
        return result;
    }

    LAZYSET_NODISCARD std::size_t count() const {
        std::size_t n = 0;
        for (auto it = begin(); it != end(); ++it) {
            ++n;
        }
        return n;
    }

    // Pulls at most one element
    LAZYSET_NODISCARD bool empty() const {
        return begin() == end();
    }

    // Lazy prefix; stops pulling from this sequence after n elements
    Sequence take(std::size_t n) const {
        detail::require(valid(), "take", "source");
        Sequence self = *this;
        return Sequence{[self, n]() { return lazyset::take(self.traverse(), n); }};
    }

    // Fluent forms of the free operators (defined in operators.hpp)
    template<typename E = DefaultEquality<T>>
    Sequence unite(const Sequence& other, E notion = {}) const;

    template<typename E = DefaultEquality<T>>
    Sequence intersect(const Sequence& other, E notion = {}) const;

    template<typename E = DefaultEquality<T>>
    Sequence except(const Sequence& other, E notion = {}) const;

    Sequence concat(const Sequence& other) const;

    template<typename E = DefaultEquality<T>>
    Sequence distinct(E notion = {}) const;

private:
    factory_type factory_;
};

// ============================================================================
// Sources
// ============================================================================

// Borrow a caller-owned container. It is read on every traversal and must
// outlive the Sequence and its iterators.
template<typename Range>
Sequence<typename Range::value_type> from(const Range& range) {
    const Range* source = std::addressof(range);
    return Sequence<typename Range::value_type>{[source]() { return borrow_range(source); }};
}

// A temporary would dangle; use of() or a shared_ptr instead.
template<typename Range>
void from(const Range&& range) = delete;

template<typename Range>
Sequence<typename std::remove_const_t<Range>::value_type> from(Range* range) {
    detail::require(range != nullptr, "from", "source range");
    return from(*range);
}

template<typename Range>
Sequence<typename std::remove_const_t<Range>::value_type> from(std::shared_ptr<Range> range) {
    detail::require(range != nullptr, "from", "source range");
    using value_type = typename std::remove_const_t<Range>::value_type;
    std::shared_ptr<const std::remove_const_t<Range>> shared = std::move(range);
    return Sequence<value_type>{[shared]() { return detail::share_range(shared); }};
}

// A source backed by a generator function, called once per traversal
template<typename Factory>
auto generate(Factory factory) -> Sequence<typename std::invoke_result_t<Factory&>::value_type> {
    using value_type = typename std::invoke_result_t<Factory&>::value_type;
    if constexpr (std::is_constructible_v<bool, Factory&>) {
        detail::require(static_cast<bool>(factory), "generate", "factory");
    }
    return Sequence<value_type>{std::move(factory)};
}

// An owned copy of the given values
template<typename T>
Sequence<T> of(std::initializer_list<T> values) {
    return from(std::make_shared<const std::vector<T>>(values));
}

} // namespace lazyset

#endif // LAZYSET_SEQUENCE_HPP
