// Set operators over two shopping lists
// Compile: g++ -std=c++20 -I../include set_operations.cpp -o set_operations

#include <lazyset/lazyset.hpp>
#include <iostream>
#include <string>
#include <vector>

template<typename Seq>
void print(const Seq& seq) {
    std::cout << "   ";
    for (const auto& item : seq) {
        std::cout << item << " ";
    }
    std::cout << "\n\n";
}

// Pretend this is a file read one line at a time
lazyset::Generator<std::string> read_pantry() {
    co_yield "Rice";
    co_yield "Tofu";
    co_yield "Salt";
}

int main() {
    std::cout << "=== Lazyset Set Operations ===\n\n";

    std::vector<std::string> healthy{"Carrots", "Tofu", "Lettuce", "Cucumbers"};
    std::vector<std::string> favorites{"Cucumbers", "Cheeseburgers", "Tofu", "Pizza", "Bacon"};

    auto mine = lazyset::from(healthy);
    auto yours = lazyset::from(favorites);

    // Example 1: Union
    std::cout << "1. unite(healthy, favorites):\n";
    print(lazyset::unite(mine, yours));

    // Example 2: Intersection
    std::cout << "2. intersect(healthy, favorites):\n";
    print(lazyset::intersect(mine, yours));

    // Example 3: Difference, both ways
    std::cout << "3. except(healthy, favorites):\n";
    print(lazyset::except(mine, yours));
    std::cout << "   except(favorites, healthy):\n";
    print(lazyset::except(yours, mine));

    // Example 4: Concatenation keeps duplicates
    auto everything = lazyset::concat(mine, yours);
    std::cout << "4. concat(healthy, favorites) has " << everything.count() << " items:\n";
    print(everything);

    // Example 5: Distinct
    std::cout << "5. distinct(concat(healthy, favorites)):\n";
    print(everything.distinct());

    // Example 6: Deferred execution - the query sees later edits
    auto shared = mine.intersect(yours);
    std::cout << "6. Shared before edit: " << shared.count() << "\n";
    healthy.push_back("Pizza");
    std::cout << "   Shared after adding Pizza: " << shared.count() << "\n";
    print(shared);

    // Example 7: Generator-backed source
    auto pantry = lazyset::generate(read_pantry);
    std::cout << "7. Pantry items not on the healthy list:\n";
    print(pantry.except(mine));

    // Example 8: Stop early
    std::cout << "8. First two of the union:\n";
    print(lazyset::unite(mine, yours).take(2));

    std::cout << "=== All examples completed ===\n";
    return 0;
}
