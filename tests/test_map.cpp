#include <gtest/gtest.h>
#include <inctrie/errors.hpp>
#include <inctrie/map.hpp>
#include <map>
#include <string>

using namespace inctrie;

namespace {

// Account key: only the number identifies the account, the label is carried along
struct Account {
    int number;
    std::string label;

    bool operator==(const Account& other) const { return number == other.number && label == other.label; }
};

} // namespace

namespace inctrie {
    template<typename V>
    struct TrieKey<std::pair<Account, V>> {
        static HashValue key_hash(const Account& a) { return fnv_mix(static_cast<uint64_t>(a.number)); }
        static bool key_matches(const std::pair<Account, V>& kv, const Account& a) {
            return kv.first.number == a.number;
        }

        static HashValue hash(const std::pair<Account, V>& kv) { return key_hash(kv.first); }
        static bool same_key(const std::pair<Account, V>& a, const std::pair<Account, V>& b) {
            return key_matches(a, b.first);
        }
    };
}

TEST(MapTest, EmptyMapFindsNothing) {
    auto m = map::empty<std::string, int>();
    EXPECT_TRUE(map::is_empty(m));
    EXPECT_FALSE(map::find(m, "anything").has_value());
}

TEST(MapTest, UpdateThenFindRoundTrip) {
    auto m = map::empty<std::string, int>();
    m = map::update(m, "one", 1);
    m = map::update(m, "two", 2);

    EXPECT_EQ(map::find(m, "one"), std::optional<int>(1));
    EXPECT_EQ(map::find(m, "two"), std::optional<int>(2));
    EXPECT_FALSE(map::find(m, "three").has_value());

    // Other keys are unaffected by an update
    auto before = map::find(m, "one");
    m = map::update(m, "four", 4);
    EXPECT_EQ(map::find(m, "one"), before);
}

TEST(MapTest, UpdateReplacesExistingBinding) {
    auto m = map::empty<int, std::string>(Meta(2));
    m = map::update(m, 5, "five");
    m = map::update(m, 5, "FIVE");

    EXPECT_EQ(map::find(m, 5), std::optional<std::string>("FIVE"));
    EXPECT_EQ(element_count(m), 1u);
}

TEST(MapTest, RebindingSameValueIsNoOp) {
    auto m = map::update(map::empty<int, int>(), 1, 10);
    auto again = map::update(m, 1, 10);
    EXPECT_EQ(m, again);
}

TEST(MapTest, MatchesReferenceMap) {
    auto m = map::empty<int, int>();
    std::map<int, int> expected;
    for (int i = 0; i < 100; ++i) {
        int key = (i * 37) % 41;
        m = map::update(m, key, i);
        expected[key] = i;
    }
    for (int key = 0; key < 45; ++key) {
        auto it = expected.find(key);
        if (it == expected.end()) {
            EXPECT_FALSE(map::find(m, key).has_value()) << "key " << key;
        } else {
            EXPECT_EQ(map::find(m, key), std::optional<int>(it->second)) << "key " << key;
        }
    }

    std::size_t bindings = map::fold(m, std::size_t{0}, [](int, int, std::size_t n) { return n + 1; });
    EXPECT_EQ(bindings, expected.size());
}

TEST(MapTest, FoldSeesKeysAndValues) {
    auto m = map::empty<int, int>();
    for (int k = 1; k <= 4; ++k) m = map::update(m, k, k * k);
    int weighted = map::fold(m, 0, [](int k, int v, int acc) { return acc + k * v; });
    EXPECT_EQ(weighted, 1 + 8 + 27 + 64);
}

TEST(MapTest, RemoveAndAppendAreUnsupported) {
    auto m = map::update(map::empty<int, int>(), 1, 1);
    EXPECT_THROW(map::remove(m, 1), UnsupportedOperationError);
    EXPECT_THROW(map::append(m, m), UnsupportedOperationError);
}

TEST(MapTest, FindFollowsSpecializedKeyPolicy) {
    auto m = map::empty<Account, int>(Meta(2));
    m = map::update(m, Account{7, "savings"}, 100);
    m = map::update(m, Account{9, "checking"}, 5);

    // Same account number, different label: same key under the specialized policy
    EXPECT_EQ(map::find(m, Account{7, "renamed"}), std::optional<int>(100));
    EXPECT_EQ(map::find(m, Account{9, ""}), std::optional<int>(5));
    EXPECT_FALSE(map::find(m, Account{8, "savings"}).has_value());

    m = map::update(m, Account{7, "renamed"}, 150);
    EXPECT_EQ(map::find(m, Account{7, "savings"}), std::optional<int>(150));
    EXPECT_EQ(element_count(m), 2u);
}
