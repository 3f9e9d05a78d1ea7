// Custom equality notions
// Compile: g++ -std=c++20 -I../include custom_equality.cpp -o custom_equality

#include <lazyset/lazyset.hpp>
#include <cctype>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

struct Food {
    std::string name;
    int calories;
};

std::ostream& operator<<(std::ostream& os, const Food& food) {
    return os << "(" << food.name << ", " << food.calories << ")";
}

// Hand-written notion: name only, ignoring case
struct SameName {
    bool equals(const Food& a, const Food& b) const {
        return lazyset::CaseInsensitiveEquality{}.equals(a.name, b.name);
    }

    std::size_t hash(const Food& food) const {
        return lazyset::CaseInsensitiveEquality{}.hash(food.name);
    }
};

int main() {
    std::cout << "=== Lazyset Custom Equality ===\n\n";

    std::vector<Food> foods{
        {"Carrot", 100},
        {"Celery", -10},
        {"Cucumber", 201},
        {"cucumber", 202},
        {"CUCUMBER", 203},
    };

    // Example 1: Equality notion as a struct
    std::cout << "1. distinct by name (struct):\n   ";
    for (const auto& food : lazyset::distinct(lazyset::from(foods), SameName{})) {
        std::cout << food << " ";
    }
    std::cout << "\n\n";

    // Example 2: Same thing through a key projection
    std::cout << "2. distinct_by name, case-insensitive:\n   ";
    auto by_name = lazyset::by_key(&Food::name, lazyset::CaseInsensitiveEquality{});
    for (const auto& food : lazyset::from(foods).distinct(by_name)) {
        std::cout << food << " ";
    }
    std::cout << "\n\n";

    // Example 3: A pair of functions, supplied together
    std::cout << "3. distinct by calorie bracket of 100:\n   ";
    auto bracket = lazyset::make_equality<Food>(
        [](const Food& a, const Food& b) { return a.calories / 100 == b.calories / 100; },
        [](const Food& f) { return static_cast<std::size_t>(f.calories / 100); });
    for (const auto& food : lazyset::distinct(lazyset::from(foods), bracket)) {
        std::cout << food << " ";
    }
    std::cout << "\n\n";

    // Example 4: Key projection variants
    std::vector<Food> menu{{"celery", 15}, {"Pizza", 266}};
    std::cout << "4. foods also on the menu (by name):\n   ";
    for (const auto& food : lazyset::intersect_by(lazyset::from(foods), lazyset::from(menu),
                                                  [](const Food& f) {
                                                      std::string key;
                                                      for (char c : f.name) {
                                                          key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                                                      }
                                                      return key;
                                                  })) {
        std::cout << food << " ";
    }
    std::cout << "\n\n";

    std::cout << "=== All examples completed ===\n";
    return 0;
}
