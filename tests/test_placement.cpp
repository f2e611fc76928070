#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <inctrie/errors.hpp>
#include <inctrie/trie.hpp>
#include <inctrie/trie_fold.hpp>
#include <random>
#include <vector>

using namespace inctrie;

class PlacementTest : public ::testing::Test {
protected:
    using T = Trie<int>;
    using P = Trie<HashedItem>;

    static T build(const Meta& meta, const std::vector<int>& values) {
        T t = T::empty(meta);
        for (int v : values) {
            t = T::extend(Name::unit(), t, v);
        }
        return t;
    }
};

TEST_F(PlacementTest, MinDepthHoldsForEveryLeaf) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> dist(-100000, 100000);

    for (int depth : {0, 1, 3, 6}) {
        std::vector<int> values;
        for (int i = 0; i < 200; ++i) values.push_back(dist(rng));

        T t = build(Meta(depth), values);
        test_utils::expect_well_placed(t, static_cast<std::size_t>(depth));
        for (int v : values) {
            EXPECT_TRUE(T::find(t, v, TrieKey<int>::hash(v)).has_value()) << "missing " << v;
        }
    }
}

TEST_F(PlacementTest, MinDepthZeroAllowsLeafAtRoot) {
    T t = build(Meta(0), {5});
    auto leaves = test_utils::leaves(t);
    ASSERT_EQ(leaves.size(), 1u);
    EXPECT_EQ(leaves[0].first.length, 0u);
}

TEST_F(PlacementTest, MinDepthForcesBranchesOnSingleton) {
    T t = build(Meta(5), {5});
    auto leaves = test_utils::leaves(t);
    ASSERT_EQ(leaves.size(), 1u);
    EXPECT_EQ(leaves[0].first.length, 5u);
}

TEST_F(PlacementTest, CollidingPrefixesSplitUntilTheyDiffer) {
    // Hashes agree on the low three bits, differ at bit 3
    HashedItem a{0b0101, 1};
    HashedItem b{0b1101, 2};

    P t = P::extend(Name::unit(), P::empty(Meta(1)), a);
    t = P::extend(Name::unit(), t, b);

    auto leaves = test_utils::leaves(t);
    ASSERT_EQ(leaves.size(), 2u);
    EXPECT_EQ(leaves[0].first.length, 4u);
    EXPECT_EQ(leaves[1].first.length, 4u);
    test_utils::expect_well_placed(t, 1);
}

TEST_F(PlacementTest, EqualElementIsNoOp) {
    P t = P::extend(Name::unit(), P::empty(Meta(1)), HashedItem{0b10, 1});
    P again = P::extend(Name::unit(), t, HashedItem{0b10, 1});
    EXPECT_EQ(t, again);
    EXPECT_EQ(element_count(again), 1u);
}

TEST_F(PlacementTest, SameKeyReplacesElement) {
    // Same id, so same key, but a different payload
    using M = Trie<std::pair<int, int>>;
    M t = M::extend(Name::unit(), M::empty(Meta(1)), {3, 30});
    t = M::extend(Name::unit(), t, {3, 31});
    auto leaves = test_utils::leaves(t);
    ASSERT_EQ(leaves.size(), 1u);
    EXPECT_EQ(leaves[0].second, (std::pair<int, int>{3, 31}));
}

TEST_F(PlacementTest, FullCollisionThrowsHashExhausted) {
    P t = P::extend(Name::unit(), P::empty(Meta(1)), HashedItem{0x5555, 1});
    try {
        P::extend(Name::unit(), t, HashedItem{0x5555, 2});
        FAIL() << "expected HashExhaustedError";
    } catch (const HashExhaustedError& e) {
        EXPECT_EQ(e.depth(), MAX_LEN);
    }

    // The original trie is untouched
    EXPECT_EQ(element_count(t), 1u);
}

TEST_F(PlacementTest, NestedNamedArticulationsReachRoot) {
    T inner = T::name(Name::of_str("b"), T::art(Art<T>::put(T::root(Meta(1), T::nil(BitString::empty())))));
    T outer = T::name(Name::of_str("a"), T::art(Art<T>::put(inner)));
    T t = T::extend(Name::unit(), outer, 9);
    EXPECT_TRUE(T::find(t, 9, TrieKey<int>::hash(9)).has_value());
}

TEST_F(PlacementTest, ExtendResultHasForkedNames) {
    Name nm = Name::of_str("insert");
    auto names = nm.fork();
    T t = T::extend(nm, T::empty(Meta(1)), 4);

    ASSERT_EQ(t.kind(), NodeKind::NAME);
    const auto& outer = std::get<T::NameNode>(t.node().value);
    EXPECT_EQ(outer.name, names.first);
    const auto& root = std::get<T::RootNode>(outer.trie.forced().node().value);
    EXPECT_EQ(root.meta, Meta(1));
    EXPECT_EQ(std::get<T::NameNode>(root.trie.node().value).name, names.second);
}

TEST_F(PlacementTest, MalformedEntryShapesAreRejected) {
    T nil = T::nil(BitString::empty());
    EXPECT_THROW(T::extend(Name::unit(), nil, 1), MalformedTrieError);
    EXPECT_THROW(T::extend(Name::unit(), T::root(Meta(), nil), 1), MalformedTrieError);
    EXPECT_THROW(T::extend(Name::unit(), T::name(Name::unit(), nil), 1), MalformedTrieError)
        << "Name without an articulation";
    EXPECT_THROW(T::extend(Name::unit(), T::name(Name::unit(), T::art(Art<T>::put(nil))), 1),
                 MalformedTrieError) << "articulation without a Root";
}

TEST_F(PlacementTest, RootBelowTopIsRejected) {
    T nested = T::root(Meta(1), T::root(Meta(1), T::nil(BitString::empty())));
    T t = T::name(Name::unit(), T::art(Art<T>::put(nested)));
    EXPECT_THROW(T::extend(Name::unit(), t, 1), MalformedTrieError);
}
