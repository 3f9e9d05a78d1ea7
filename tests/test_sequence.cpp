// Tests for Sequence<T> and the source adapters

#include <lazyset/lazyset.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Test framework declarations
namespace test {
    int register_test(const std::string& name, std::function<void()> func);
    void check(bool condition, const std::string& message, const char* file, int line);
}

#define TEST(name) \
    void test_##name(); \
    static int test_##name##_registered = test::register_test(#name, test_##name); \
    void test_##name()

#define CHECK(cond) test::check(cond, #cond, __FILE__, __LINE__)
#define CHECK_EQ(a, b) test::check((a) == (b), std::string(#a " == " #b), __FILE__, __LINE__)
#define CHECK_THROWS_AS(expr, type) \
    do { \
        bool threw = false; \
        try { expr; } catch (const type&) { threw = true; } \
        test::check(threw, #expr " should throw " #type, __FILE__, __LINE__); \
    } while(0)

namespace {

lazyset::Generator<int> counted(int count, int* pulls) {
    for (int i = 0; i < count; ++i) {
        ++*pulls;
        co_yield i;
    }
}

lazyset::Generator<int> fails_after_first(bool fail) {
    co_yield 1;
    if (fail) {
        throw std::runtime_error("source failed");
    }
    co_yield 2;
}

struct ReleaseFlag {
    bool* released;
    ~ReleaseFlag() { *released = true; }
};

lazyset::Generator<int> endless(bool* released) {
    ReleaseFlag flag{released};
    for (int i = 0;; ++i) {
        co_yield i;
    }
}

} // namespace

TEST(sequence_borrows_container) {
    std::vector<std::string> fridge{"Tofu", "Lettuce"};
    auto seq = lazyset::from(fridge);

    fridge.push_back("Carrots");

    auto values = seq.to_vector();
    CHECK_EQ(values.size(), 3u);
    CHECK(values[2] == "Carrots");
}

TEST(sequence_retraversal_sees_mutation) {
    std::vector<int> numbers{1, 2, 3};
    auto seq = lazyset::from(numbers);

    CHECK_EQ(seq.count(), 3u);
    numbers.push_back(4);
    CHECK_EQ(seq.count(), 4u);
    numbers.clear();
    CHECK(seq.empty());
}

TEST(sequence_factory_called_per_traversal) {
    int calls = 0;
    int pulls = 0;
    auto seq = lazyset::generate([&calls, &pulls]() {
        ++calls;
        return counted(3, &pulls);
    });

    CHECK_EQ(calls, 0);
    CHECK_EQ(seq.count(), 3u);
    CHECK_EQ(seq.count(), 3u);
    CHECK_EQ(calls, 2);
    CHECK_EQ(pulls, 6);
}

TEST(sequence_traversals_are_independent) {
    std::vector<int> numbers{10, 20, 30};
    auto seq = lazyset::from(numbers);

    auto a = seq.begin();
    auto b = seq.begin();
    CHECK_EQ(*a, 10);
    ++a;
    ++a;
    CHECK_EQ(*a, 30);
    CHECK_EQ(*b, 10);
    ++b;
    CHECK_EQ(*b, 20);
    ++a;
    CHECK(a == seq.end());
    CHECK(b != seq.end());
}

TEST(sequence_take_pulls_only_prefix) {
    int pulls = 0;
    auto seq = lazyset::generate([&pulls]() { return counted(100, &pulls); });

    auto prefix = seq.take(3).to_vector();
    CHECK_EQ(prefix.size(), 3u);
    CHECK_EQ(prefix[2], 2);
    CHECK_EQ(pulls, 3);
}

TEST(sequence_abandoned_traversal_releases_source) {
    bool released = false;
    auto seq = lazyset::generate([&released]() { return endless(&released); });

    for (int v : seq) {
        if (v == 5) {
            break;
        }
    }
    CHECK(released);

    released = false;
    auto firsts = seq.take(2).to_vector();
    CHECK_EQ(firsts.size(), 2u);
    CHECK(released);
}

TEST(sequence_source_failure_leaves_sequence_reusable) {
    int attempt = 0;
    auto seq = lazyset::generate([&attempt]() { return fails_after_first(++attempt == 1); });

    std::vector<int> seen;
    bool caught = false;
    try {
        for (int v : seq) {
            seen.push_back(v);
        }
    } catch (const std::runtime_error&) {
        caught = true;
    }

    CHECK(caught);
    CHECK_EQ(seen.size(), 1u);

    auto retry = seq.to_vector();
    CHECK_EQ(retry.size(), 2u);
    CHECK_EQ(retry[1], 2);
}

TEST(sequence_of_owns_its_values) {
    auto seq = lazyset::of({3, 1, 4, 1, 5});
    CHECK_EQ(seq.count(), 5u);
    CHECK_EQ(seq.count(), 5u);
}

TEST(sequence_shared_source_outlives_handle) {
    auto data = std::make_shared<std::vector<std::string>>(std::vector<std::string>{"Pizza", "Bacon"});
    lazyset::Sequence<std::string>::iterator it;
    {
        auto seq = lazyset::from(data);
        data.reset();
        it = seq.begin();
    }
    CHECK(*it == "Pizza");
    ++it;
    CHECK(*it == "Bacon");
    ++it;
    CHECK(it == lazyset::GeneratorSentinel{});
}

TEST(sequence_from_pointer) {
    std::vector<int> numbers{1, 2};
    const std::vector<int>* pointer = &numbers;
    CHECK_EQ(lazyset::from(pointer).count(), 2u);
}

TEST(sequence_rejects_absent_sources) {
    const std::vector<int>* missing = nullptr;
    CHECK_THROWS_AS(lazyset::from(missing), std::invalid_argument);

    std::shared_ptr<const std::vector<int>> no_data;
    CHECK_THROWS_AS(lazyset::from(no_data), std::invalid_argument);

    std::function<lazyset::Generator<int>()> no_factory;
    CHECK_THROWS_AS(lazyset::generate(no_factory), std::invalid_argument);
    CHECK_THROWS_AS(lazyset::Sequence<int>{no_factory}, std::invalid_argument);

    lazyset::Sequence<int> absent;
    CHECK(!absent.valid());
    CHECK_THROWS_AS(absent.take(1), std::invalid_argument);
    CHECK_THROWS_AS(absent.begin(), std::logic_error);
}
