// Tests for Generator<T>

#include <lazyset/lazyset.hpp>
#include <functional>
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

namespace {

lazyset::Generator<int> range(int start, int end) {
    for (int i = start; i < end; ++i) {
        co_yield i;
    }
}

lazyset::Generator<std::string> strings() {
    co_yield "one";
    co_yield "two";
    co_yield "three";
}

lazyset::Generator<int> empty_generator() {
    co_return;
}

lazyset::Generator<int> throws_exception() {
    co_yield 1;
    co_yield 2;
    throw std::runtime_error("generator error");
}

lazyset::Generator<int> count_start(int* started) {
    ++*started;
    co_yield 7;
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

TEST(generator_basic_iteration) {
    auto gen = range(0, 5);
    std::vector<int> values;

    for (int v : gen) {
        values.push_back(v);
    }

    CHECK_EQ(values.size(), 5u);
    CHECK_EQ(values[0], 0);
    CHECK_EQ(values[4], 4);
}

TEST(generator_strings) {
    auto gen = strings();
    std::vector<std::string> values;

    for (const auto& s : gen) {
        values.push_back(s);
    }

    CHECK_EQ(values.size(), 3u);
    CHECK(values[0] == "one");
    CHECK(values[1] == "two");
    CHECK(values[2] == "three");
}

TEST(generator_empty) {
    auto gen = empty_generator();
    std::vector<int> values;

    for (int v : gen) {
        values.push_back(v);
    }

    CHECK_EQ(values.size(), 0u);
    CHECK(gen.done());
}

TEST(generator_move_semantics) {
    auto gen1 = range(0, 3);
    CHECK(gen1.valid());

    auto gen2 = std::move(gen1);
    CHECK(!gen1.valid());
    CHECK(gen2.valid());

    std::vector<int> values;
    for (int v : gen2) {
        values.push_back(v);
    }
    CHECK_EQ(values.size(), 3u);
}

TEST(generator_does_not_start_before_first_pull) {
    int started = 0;
    auto gen = count_start(&started);

    CHECK_EQ(started, 0);
    CHECK(gen.next());
    CHECK_EQ(started, 1);
    CHECK_EQ(gen.value(), 7);
}

TEST(generator_manual_iteration) {
    auto gen = range(10, 13);

    CHECK(gen.next());
    CHECK_EQ(gen.value(), 10);

    CHECK(gen.next());
    CHECK_EQ(gen.value(), 11);

    CHECK(gen.next());
    CHECK_EQ(gen.value(), 12);

    CHECK(!gen.next());
    CHECK(gen.done());
    CHECK(!gen.next());
}

TEST(generator_exception_propagates) {
    auto gen = throws_exception();
    std::vector<int> values;
    bool caught = false;

    try {
        for (int v : gen) {
            values.push_back(v);
        }
    } catch (const std::runtime_error&) {
        caught = true;
    }

    CHECK(caught);
    CHECK_EQ(values.size(), 2u);  // Should have gotten 1 and 2 before exception
}

TEST(generator_destroyed_midway_releases_frame) {
    bool released = false;
    {
        auto gen = endless(&released);
        for (int v : gen) {
            if (v == 3) {
                break;
            }
        }
        CHECK(!released);
    }
    CHECK(released);
}

TEST(generator_take) {
    bool released = false;
    std::vector<int> values;
    for (int v : lazyset::take(endless(&released), 5)) {
        values.push_back(v);
    }

    CHECK_EQ(values.size(), 5u);
    CHECK_EQ(values[4], 4);
    CHECK(released);
}

TEST(generator_take_zero) {
    std::vector<int> values;
    for (int v : lazyset::take(range(0, 10), 0)) {
        values.push_back(v);
    }

    CHECK(values.empty());
}

TEST(generator_borrow_range_reads_caller_container) {
    std::vector<std::string> pantry{"Rice", "Beans"};
    auto gen = lazyset::borrow_range(&pantry);
    pantry.push_back("Salt");

    std::vector<std::string> values;
    for (const auto& s : gen) {
        values.push_back(s);
    }

    CHECK_EQ(values.size(), 3u);
    CHECK(values[2] == "Salt");
    CHECK_EQ(pantry.size(), 3u);
}
