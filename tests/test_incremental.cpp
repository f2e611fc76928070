#include <gtest/gtest.h>
#include <inctrie/engine.hpp>
#include <inctrie/set.hpp>
#include <inctrie/trie.hpp>
#include <inctrie/trie_fold.hpp>
#include <vector>

using namespace inctrie;

namespace {

using T = Trie<int>;

BitString bits(std::initializer_list<unsigned> path) {
    BitString bs;
    for (unsigned b : path) bs = BitString::prepend(b, bs);
    return bs;
}

// Root(Bin(Name("left", Art(left)), Name("right", Art(right))))
T two_named_halves(const T& left_named, const T& right_subtree) {
    T right_named = T::name(Name::of_str("right"), T::art(Art<T>::put(right_subtree)));
    return T::root(Meta(1), T::bin(bits({}), left_named, right_named));
}

int counted_sum(const T& t, Engine* engine, int& leaf_calls) {
    return fold_seq(t, 0,
        [&leaf_calls](int x, int acc) { ++leaf_calls; return acc + x; },
        [](int acc) { return acc; },
        [](const Name&, int acc) { return acc; },
        engine);
}

} // namespace

TEST(IncrementalTest, UntouchedNamedSubtreeHitsMemo) {
    T left_subtree = T::bin(bits({0}), T::leaf(bits({0, 0}), 1), T::leaf(bits({0, 1}), 2));
    T left_named = T::name(Name::of_str("left"), T::art(Art<T>::put(left_subtree)));

    T before = two_named_halves(left_named, T::leaf(bits({1}), 10));
    T after = two_named_halves(left_named, T::leaf(bits({1}), 20));

    Engine engine(EngineConfig{EngineMode::INCREMENTAL});
    int leaf_calls = 0;
    EXPECT_EQ(counted_sum(before, &engine, leaf_calls), 13);
    EXPECT_EQ(leaf_calls, 3);
    EXPECT_EQ(engine.stats().memo_misses, 2u);

    leaf_calls = 0;
    EXPECT_EQ(counted_sum(after, &engine, leaf_calls), 23);
    EXPECT_EQ(leaf_calls, 1) << "only the edited half is re-folded";
    EXPECT_EQ(engine.stats().memo_hits, 1u);
    EXPECT_EQ(engine.stats().memo_misses, 3u);
}

TEST(IncrementalTest, ChangedAccumulatorInvalidatesEntry) {
    T left_named = T::name(Name::of_str("left"), T::art(Art<T>::put(T::leaf(bits({0}), 1))));
    T t = T::root(Meta(1), T::bin(bits({}), left_named, T::nil(bits({1}))));

    Engine engine;
    auto run = [&](int init) {
        return fold_seq(t, init,
            [](int x, int acc) { return acc + x; },
            [](int acc) { return acc; },
            [](const Name&, int acc) { return acc; },
            &engine);
    };
    EXPECT_EQ(run(0), 1);
    EXPECT_EQ(run(100), 101);
    EXPECT_EQ(engine.stats().memo_hits, 0u);
    EXPECT_EQ(run(100), 101);
    EXPECT_EQ(engine.stats().memo_hits, 1u);
}

TEST(IncrementalTest, NaiveAndIncrementalAgree) {
    Engine naive(EngineConfig{EngineMode::NAIVE});
    Engine incremental(EngineConfig{EngineMode::INCREMENTAL});

    auto in_order = [](const Set<int>& s, Engine& engine) {
        return fold_seq(s, std::vector<int>{},
            [](const std::pair<int, Unit>& e, std::vector<int> acc) { acc.push_back(e.first); return acc; },
            [](std::vector<int> acc) { return acc; },
            [](const Name&, std::vector<int> acc) { return acc; },
            &engine);
    };

    Set<int> s = set::empty<int>(Meta(2));
    for (int i = 0; i < 40; ++i) {
        s = set::add_named(s, Name::of_usize(static_cast<std::size_t>(i)), i * 3 - 17);
        EXPECT_EQ(in_order(s, naive), in_order(s, incremental)) << "after " << i + 1 << " insertions";
        EXPECT_EQ(in_order(s, incremental), set::elements(s));
    }
    EXPECT_EQ(naive.stats().memo_hits, 0u);
    EXPECT_GT(incremental.stats().memo_hits, 0u) << "each set is folded twice by the incremental engine";
}

TEST(IncrementalTest, NamespacedFoldsDoNotShareEntries) {
    T t = T::singleton(Meta(1), Name::of_str("s"), 5);
    Engine engine;
    auto run = [&]() {
        return fold_seq(t, 0,
            [](int x, int acc) { return acc + x; },
            [](int acc) { return acc; },
            [](const Name&, int acc) { return acc; },
            &engine);
    };

    EXPECT_EQ(engine.ns(Name::of_str("a"), run), 5);
    EXPECT_EQ(engine.ns(Name::of_str("b"), run), 5);
    EXPECT_EQ(engine.stats().memo_hits, 0u);
    EXPECT_EQ(engine.ns(Name::of_str("a"), run), 5);
    EXPECT_GT(engine.stats().memo_hits, 0u);
}

TEST(IncrementalTest, CanonicalFormsMatchAcrossEngines) {
    Engine naive(EngineConfig{EngineMode::NAIVE});
    Engine incremental(EngineConfig{EngineMode::INCREMENTAL});

    // Build the same set through engine cells in both modes
    auto build = [](Engine& engine) {
        T t = T::empty(Meta(1));
        for (int i = 0; i < 10; ++i) {
            T next = T::extend(Name::of_usize(static_cast<std::size_t>(i)), t, i * i);
            t = T::name(Name::of_usize(static_cast<std::size_t>(i)),
                        T::art(engine.cell(Name::of_usize(static_cast<std::size_t>(i)), next)));
        }
        return t;
    };

    T from_naive = build(naive);
    T from_incremental = build(incremental);
    EXPECT_EQ(canonical(from_naive), canonical(from_incremental));
    EXPECT_EQ(naive.stats().cells_created, 10u);
    EXPECT_EQ(incremental.stats().cells_created, 10u);

    // Rebuilding the same sequence reuses every incremental cell
    build(incremental);
    EXPECT_EQ(incremental.stats().cells_reused, 10u);
}
