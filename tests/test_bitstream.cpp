#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "entropy/bitstream.hpp"

using hcodec::BitVector;
using hcodec::ByteReader;
using hcodec::ByteWriter;

namespace {

std::vector<uint8_t> serialize(const BitVector& bits) {
    ByteWriter w;
    hcodec::write_bitstream(w, bits);
    return w.bytes();
}

std::string error_of(const std::vector<uint8_t>& bytes) {
    try {
        hcodec::read_bitstream(bytes);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(BitstreamTest, HeaderLayout) {
    const auto bytes = serialize(BitVector::from_string("1010000011"));
    ASSERT_EQ(bytes.size(), 16u + 2u);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "HBIT");
    EXPECT_EQ(bytes[4], 1);  // version
    EXPECT_EQ(bytes[5], 0);
    EXPECT_EQ(bytes[6], 16); // header size
    EXPECT_EQ(bytes[8], 10); // bit count, little-endian
    for (size_t i = 9; i < 16; ++i) EXPECT_EQ(bytes[i], 0);
    EXPECT_EQ(bytes[16], 0xA0);
    EXPECT_EQ(bytes[17], 0xC0);
}

TEST(BitstreamTest, ReadBack) {
    const BitVector bits = BitVector::from_string("1101001110101");
    EXPECT_EQ(hcodec::read_bitstream(serialize(bits)), bits);
    EXPECT_TRUE(hcodec::read_bitstream(serialize(BitVector())).empty());
}

TEST(BitstreamTest, RejectsBadMagic) {
    auto bytes = serialize(BitVector::from_string("1"));
    bytes[0] = 'X';
    EXPECT_EQ(error_of(bytes), "bitstream: bad magic");
}

TEST(BitstreamTest, RejectsUnknownVersion) {
    auto bytes = serialize(BitVector::from_string("1"));
    bytes[4] = 2;
    EXPECT_EQ(error_of(bytes), "bitstream: unsupported version");
}

TEST(BitstreamTest, RejectsShortFile) {
    EXPECT_EQ(error_of({'H', 'B', 'I', 'T'}), "bitstream: file too small");
}

TEST(BitstreamTest, RejectsTruncatedPayload) {
    auto bytes = serialize(BitVector::from_string("111111111"));
    bytes.pop_back();
    EXPECT_EQ(error_of(bytes), "bitstream: premature EOF");
}

TEST(BitstreamTest, SkipsLargerHeader) {
    auto bytes = serialize(BitVector::from_string("011"));
    bytes[6] = 18;
    bytes.insert(bytes.begin() + 16, {0xEE, 0xEE});
    EXPECT_EQ(hcodec::read_bitstream(bytes).to_string(), "011");
}

TEST(ByteStreamTest, LittleEndianRoundTrip) {
    ByteWriter w;
    w.write_u8(0x01);
    w.write_u16_le(0x0302);
    w.write_u32_le(0x07060504u);
    w.write_u64_le(0x0F0E0D0C0B0A0908ull);
    const std::vector<uint8_t> expected = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15};
    EXPECT_EQ(w.bytes(), expected);

    ByteReader r(w.bytes());
    EXPECT_EQ(r.read_u8(), 0x01);
    EXPECT_EQ(r.read_u16_le(), 0x0302);
    EXPECT_EQ(r.read_u32_le(), 0x07060504u);
    EXPECT_EQ(r.read_u64_le(), 0x0F0E0D0C0B0A0908ull);
    EXPECT_TRUE(r.eof());
    EXPECT_THROW(r.read_u8(), std::runtime_error);
}

TEST(BitstreamTest, RejectsHugeBitCount) {
    ByteWriter w;
    w.write_bytes("HBIT", 4);
    w.write_u16_le(1);
    w.write_u16_le(16);
    w.write_u64_le(~0ull);
    EXPECT_EQ(error_of(w.bytes()), "bitstream: premature EOF");

    auto with_payload = w.bytes();
    with_payload.push_back(0xFF);
    EXPECT_EQ(error_of(with_payload), "bitstream: premature EOF");
}
