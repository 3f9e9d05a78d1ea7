// SPDX-License-Identifier: GPL-3.0-or-later
// Lazyset - Lazy set operations over sequences for C++20

#ifndef LAZYSET_EQUALITY_HPP
#define LAZYSET_EQUALITY_HPP

#include "config.hpp"

#include <cctype>
#include <concepts>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace lazyset {

// An equality notion is any object answering equals(a, b) and hash(a) for
// elements of type T. The two must agree: equals(a, b) implies
// hash(a) == hash(b). The library cannot check that; breaking it gives
// unspecified (but memory safe) results.
template<typename E, typename T>
inline constexpr bool is_equality_notion_v = requires(const E& notion, const T& a, const T& b) {
    { notion.equals(a, b) } -> std::convertible_to<bool>;
    { notion.hash(a) } -> std::convertible_to<std::size_t>;
};

// ============================================================================
// DefaultEquality - the element type's own operator== and std::hash
// ============================================================================

template<typename T = void>
struct DefaultEquality {
    bool equals(const T& a, const T& b) const {
        return std::equal_to<T>{}(a, b);
    }

    std::size_t hash(const T& value) const {
        return std::hash<T>{}(value);
    }
};

// Deduces the element type at each call, like std::equal_to<void>.
template<>
struct DefaultEquality<void> {
    template<typename U>
    bool equals(const U& a, const U& b) const {
        return std::equal_to<U>{}(a, b);
    }

    template<typename U>
    std::size_t hash(const U& value) const {
        return std::hash<U>{}(value);
    }
};

// ============================================================================
// FunctionEquality - a pair of callables supplied together
// ============================================================================

template<typename T>
class FunctionEquality {
public:
    using equals_function = std::function<bool(const T&, const T&)>;
    using hash_function = std::function<std::size_t(const T&)>;

    FunctionEquality(equals_function equals, hash_function hash)
        : equals_(std::move(equals))
        , hash_(std::move(hash)) {
        if (!equals_ || !hash_) {
            LAZYSET_TRACE("rejected equality notion without "
                          << (!equals_ ? "equals" : "hash") << " function");
            throw std::invalid_argument("lazyset: an equality notion needs both an equals and a hash function");
        }
    }

    bool equals(const T& a, const T& b) const {
        return equals_(a, b);
    }

    std::size_t hash(const T& value) const {
        return hash_(value);
    }

private:
    equals_function equals_;
    hash_function hash_;
};

template<typename T, typename Equals, typename Hash>
FunctionEquality<T> make_equality(Equals&& equals, Hash&& hash) {
    return FunctionEquality<T>{std::forward<Equals>(equals), std::forward<Hash>(hash)};
}

// ============================================================================
// KeyEquality - compare elements through a projected key
// ============================================================================

template<typename KeyFn, typename KeyNotion = DefaultEquality<>>
class KeyEquality {
public:
    explicit KeyEquality(KeyFn key, KeyNotion key_notion = {})
        : key_(std::move(key))
        , key_notion_(std::move(key_notion)) {}

    template<typename U>
    bool equals(const U& a, const U& b) const {
        return key_notion_.equals(std::invoke(key_, a), std::invoke(key_, b));
    }

    template<typename U>
    std::size_t hash(const U& value) const {
        return key_notion_.hash(std::invoke(key_, value));
    }

private:
    KeyFn key_;
    KeyNotion key_notion_;
};

template<typename KeyFn>
KeyEquality<std::decay_t<KeyFn>> by_key(KeyFn&& key) {
    return KeyEquality<std::decay_t<KeyFn>>{std::forward<KeyFn>(key)};
}

template<typename KeyFn, typename KeyNotion>
KeyEquality<std::decay_t<KeyFn>, std::decay_t<KeyNotion>> by_key(KeyFn&& key, KeyNotion&& key_notion) {
    return KeyEquality<std::decay_t<KeyFn>, std::decay_t<KeyNotion>>{
        std::forward<KeyFn>(key), std::forward<KeyNotion>(key_notion)};
}

// ============================================================================
// CaseInsensitiveEquality - ASCII case folding for strings
// ============================================================================

struct CaseInsensitiveEquality {
    bool equals(std::string_view a, std::string_view b) const noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (fold(a[i]) != fold(b[i])) {
                return false;
            }
        }
        return true;
    }

    // FNV-1a over the folded bytes
    std::size_t hash(std::string_view value) const noexcept {
        std::size_t h = 14695981039346656037ull;
        for (char c : value) {
            h ^= static_cast<unsigned char>(fold(c));
            h *= 1099511628211ull;
        }
        return h;
    }

private:
    static char fold(char c) noexcept {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
};

namespace detail {

// Per-traversal membership table. Buckets come from hash(), membership is
// always settled by equals(), so colliding hashes stay correct.
template<typename T, typename E>
class ElementSet {
    static_assert(is_equality_notion_v<E, T>,
                  "equality notion must provide equals(const T&, const T&) and hash(const T&)");

    struct Hasher {
        const E* notion;
        std::size_t operator()(const T& value) const {
            return notion->hash(value);
        }
    };

    struct KeyEqual {
        const E* notion;
        bool operator()(const T& a, const T& b) const {
            return notion->equals(a, b);
        }
    };

public:
    // The notion must outlive the set; operators keep both in the same
    // coroutine frame.
    explicit ElementSet(const E& notion)
        : set_(0, Hasher{&notion}, KeyEqual{&notion}) {}

    // Returns false when an equivalent element is already present
    bool insert(const T& value) {
        return set_.insert(value).second;
    }

    bool remove(const T& value) {
        return set_.erase(value) > 0;
    }

    LAZYSET_NODISCARD bool contains(const T& value) const {
        return set_.find(value) != set_.end();
    }

    LAZYSET_NODISCARD std::size_t size() const noexcept {
        return set_.size();
    }

private:
    std::unordered_set<T, Hasher, KeyEqual> set_;
};

} // namespace detail

} // namespace lazyset

#endif // LAZYSET_EQUALITY_HPP
