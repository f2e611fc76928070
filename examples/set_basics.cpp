/**
 * Basic Set Usage Example
 *
 * Demonstrates the set view over the hash trie:
 * - Creating an empty set and adding elements
 * - Membership queries
 * - Order-independent equality
 */

#include <inctrie/set.hpp>
#include <iostream>

using namespace inctrie;

int main() {
    std::cout << "=== Basic Set Usage Example ===\n\n";

    Set<int> s = set::empty<int>(Meta(1));
    std::cout << "Created empty set, is_empty: " << std::boolalpha << set::is_empty(s) << "\n\n";

    std::cout << "Adding 7, 1, 8\n";
    s = set::add(s, 7);
    s = set::add(s, 1);
    s = set::add(s, 8);

    for (int x : {7, 1, 8, 0}) {
        std::cout << "  mem(" << x << ") = " << set::mem(s, x) << "\n";
    }
    std::cout << "\n";

    std::cout << "Elements in trie order:";
    for (int x : set::elements(s)) {
        std::cout << " " << x;
    }
    std::cout << "\n";
    std::cout << "Element count: " << element_count(s) << "\n\n";

    Set<int> other = set::empty<int>(Meta(1));
    other = set::add(other, 8);
    other = set::add(other, 7);
    other = set::add(other, 1);
    std::cout << "Same elements added as 8, 7, 1; equal: " << (s == other) << "\n";

    Set<int> again = set::add(s, 7);
    std::cout << "Re-adding 7 changes nothing: " << (again == s) << "\n";

    std::cout << "\n=== Example completed successfully ===\n";
    return 0;
}
