/**
 * Incremental Fold Example
 *
 * Demonstrates memoized folding over named subtrees:
 * - Folding the same trie twice through an incremental engine
 * - Comparing memo statistics against a naive engine
 */

#include <inctrie/engine.hpp>
#include <inctrie/set.hpp>
#include <inctrie/trie_fold.hpp>
#include <iostream>
#include <vector>

using namespace inctrie;

static long sum(const Set<int>& s, Engine& engine) {
    return fold_seq(s, 0L,
        [](const std::pair<int, Unit>& e, long acc) { return acc + e.first; },
        [](long acc) { return acc; },
        [](const Name&, long acc) { return acc; },
        &engine);
}

static void report(const char* label, const Engine& engine) {
    const EngineStats& stats = engine.stats();
    std::cout << "  " << label << ": memo hits " << stats.memo_hits
              << ", misses " << stats.memo_misses
              << ", table entries " << engine.table_size() << "\n";
}

int main() {
    std::cout << "=== Incremental Fold Example ===\n\n";

    Set<int> s = set::empty<int>(Meta(2));
    for (int i = 1; i <= 1000; ++i) {
        s = set::add_named(s, Name::of_usize(static_cast<std::size_t>(i)), i);
    }
    std::cout << "Built a set of " << element_count(s) << " elements\n\n";

    Engine naive(EngineConfig{EngineMode::NAIVE});
    Engine incremental(EngineConfig{EngineMode::INCREMENTAL});

    for (int pass = 1; pass <= 3; ++pass) {
        long a = sum(s, naive);
        long b = sum(s, incremental);
        std::cout << "Pass " << pass << ": naive sum " << a << ", incremental sum " << b << "\n";
    }
    std::cout << "\n";

    report("naive", naive);
    report("incremental", incremental);

    std::cout << "\n=== Example completed successfully ===\n";
    return 0;
}
