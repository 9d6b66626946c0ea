#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "entropy/bit_vector.hpp"

using hcodec::BitVector;

TEST(BitVectorTest, PacksMsbFirst) {
    BitVector v;
    v.push_back(true);
    v.push_back(false);
    v.push_back(true);
    ASSERT_EQ(v.size(), 3u);
    ASSERT_EQ(v.bytes().size(), 1u);
    EXPECT_EQ(v.bytes()[0], 0xA0);
    EXPECT_EQ(v.to_string(), "101");
}

TEST(BitVectorTest, UnalignedAppend) {
    BitVector a = BitVector::from_string("110");
    a.append(BitVector::from_string("10101010101"));
    EXPECT_EQ(a.size(), 14u);
    EXPECT_EQ(a.to_string(), "11010101010101");
    EXPECT_EQ(a.bytes()[0], 0xD5);
    EXPECT_EQ(a.bytes()[1], 0x54);
}

TEST(BitVectorTest, AlignedAppendCopiesBytes) {
    BitVector a = BitVector::from_string("00001111");
    a.append(BitVector::from_string("1"));
    EXPECT_EQ(a.to_string(), "000011111");
    EXPECT_EQ(a.bytes().size(), 2u);
    EXPECT_EQ(a.bytes()[1], 0x80);
}

TEST(BitVectorTest, FromBytesClearsPadding) {
    BitVector v = BitVector::from_bytes({0xFF, 0xFF}, 3);
    EXPECT_EQ(v.to_string(), "111");
    ASSERT_EQ(v.bytes().size(), 1u);
    EXPECT_EQ(v.bytes()[0], 0xE0);
    EXPECT_EQ(v, BitVector::from_string("111"));
}

TEST(BitVectorTest, FromBytesRejectsShortBuffer) {
    EXPECT_THROW(BitVector::from_bytes({0x00}, 9), std::runtime_error);
}

TEST(BitVectorTest, FromStringRejectsOtherCharacters) {
    EXPECT_THROW(BitVector::from_string("01x"), std::runtime_error);
}

TEST(BitVectorTest, AtChecksBounds) {
    BitVector v = BitVector::from_string("01");
    EXPECT_FALSE(v.at(0));
    EXPECT_TRUE(v.at(1));
    EXPECT_THROW(v.at(2), std::out_of_range);
}

TEST(BitVectorTest, StartsWith) {
    BitVector v = BitVector::from_string("10110");
    EXPECT_TRUE(v.starts_with(BitVector()));
    EXPECT_TRUE(v.starts_with(BitVector::from_string("101")));
    EXPECT_FALSE(v.starts_with(BitVector::from_string("11")));
    EXPECT_FALSE(v.starts_with(BitVector::from_string("101101")));
}

TEST(BitVectorTest, IteratesInIndexOrder) {
    BitVector v = BitVector::from_string("1001");
    std::vector<bool> seen(v.begin(), v.end());
    EXPECT_EQ(seen, (std::vector<bool>{true, false, false, true}));
}

TEST(BitVectorTest, ClearResets) {
    BitVector v = BitVector::from_string("111");
    v.clear();
    EXPECT_TRUE(v.empty());
    EXPECT_TRUE(v.bytes().empty());
    EXPECT_EQ(v, BitVector());
}

TEST(BitVectorTest, FromBytesRejectsMaximalBitCount) {
    EXPECT_THROW(BitVector::from_bytes({}, SIZE_MAX), std::runtime_error);
    EXPECT_THROW(BitVector::from_bytes({0xFF}, SIZE_MAX - 3), std::runtime_error);
}

TEST(BitVectorTest, AppendToItself) {
    BitVector aligned = BitVector::from_string("10110001");
    aligned.append(aligned);
    EXPECT_EQ(aligned.to_string(), "1011000110110001");

    BitVector unaligned = BitVector::from_string("101");
    unaligned.append(unaligned);
    EXPECT_EQ(unaligned.to_string(), "101101");
}
