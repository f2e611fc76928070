#include <gtest/gtest.h>
#include <inctrie/bitstring.hpp>
#include <inctrie/errors.hpp>
#include <unordered_set>

using namespace inctrie;

TEST(BitStringTest, EmptyHasZeroLength) {
    BitString bs = BitString::empty();
    EXPECT_EQ(BitString::length_of(bs), 0u);
    EXPECT_EQ(bs.value, 0u);
    EXPECT_EQ(bs.to_string(), "");
    EXPECT_FALSE(bs.is_full());
}

TEST(BitStringTest, PrependPlacesBitAtCurrentLength) {
    BitString bs = BitString::prepend(0, BitString::empty());
    bs = BitString::prepend(1, bs);
    bs = BitString::prepend(1, bs);

    EXPECT_EQ(bs.length, 3u);
    EXPECT_EQ(bs.value, 0b110u);
    EXPECT_FALSE(bs.bit(0));
    EXPECT_TRUE(bs.bit(1));
    EXPECT_TRUE(bs.bit(2));
    EXPECT_FALSE(bs.bit(3)) << "bits past the length read as zero";
    EXPECT_EQ(bs.to_string(), "011");
}

TEST(BitStringTest, PrependDoesNotModifyOriginal) {
    BitString base = BitString::prepend(1, BitString::empty());
    BitString longer = BitString::prepend(0, base);
    EXPECT_EQ(base.length, 1u);
    EXPECT_EQ(longer.length, 2u);
    EXPECT_NE(base, longer);
}

TEST(BitStringTest, OverflowAtMaxLength) {
    BitString bs;
    for (std::size_t i = 0; i < MAX_LEN; ++i) {
        bs = BitString::prepend(static_cast<unsigned>(i % 2), bs);
    }
    EXPECT_TRUE(bs.is_full());
    EXPECT_EQ(bs.length, MAX_LEN);
    EXPECT_THROW(BitString::prepend(0, bs), BitStringOverflowError);
    EXPECT_THROW(BitString::prepend(1, bs), TrieException);
}

TEST(BitStringTest, SuffixTestMatchesSetBits) {
    BitString bs = BitString::prepend(1, BitString::prepend(0, BitString::empty()));  // "01"
    EXPECT_TRUE(bs.is_suffix_of(0b10));
    EXPECT_TRUE(bs.is_suffix_of(0b1110));
    EXPECT_FALSE(bs.is_suffix_of(0b01));
    EXPECT_TRUE(BitString::empty().is_suffix_of(0));
}

TEST(BitStringTest, EqualityAndHashIncludeLength) {
    BitString zero1 = BitString::prepend(0, BitString::empty());
    BitString zero2 = BitString::prepend(0, zero1);
    EXPECT_NE(zero1, zero2) << "same value, different length";

    std::unordered_set<BitString> seen{BitString::empty(), zero1, zero2, BitString::prepend(0, BitString::empty())};
    EXPECT_EQ(seen.size(), 3u);
}
