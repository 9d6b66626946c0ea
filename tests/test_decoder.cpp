#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "codec/decoder.hpp"
#include "codec/huffman.hpp"
#include "core/errors.hpp"
#include "tree/tree_builder.hpp"

using hcodec::BitVector;
using hcodec::CodecOptions;
using hcodec::Decoder;
using hcodec::TruncatedStreamError;
using hcodec::TruncationPolicy;
using hcodec::Weights;

namespace {

template <typename D, typename = void>
struct decodes_temporary : std::false_type {};

template <typename D>
struct decodes_temporary<D, std::void_t<decltype(std::declval<const D&>().decode_iter(std::declval<BitVector>()))>>
    : std::true_type {};

template <typename D, typename = void>
struct decodes_lvalue : std::false_type {};

template <typename D>
struct decodes_lvalue<D, std::void_t<decltype(std::declval<const D&>().decode_iter(std::declval<const BitVector&>()))>>
    : std::true_type {};

// A=1, B=00, C=01
Decoder<char> make_abc_decoder(TruncationPolicy policy = TruncationPolicy::discard) {
    CodecOptions opts;
    opts.on_truncation = policy;
    return Decoder<char>(hcodec::build_code_tree<char>(Weights<char>{{'A', 10}, {'B', 1}, {'C', 5}}), opts);
}

} // namespace

TEST(DecoderTest, WalksTreeBitByBit) {
    const auto dec = make_abc_decoder();
    const auto out = dec.decode_owned(BitVector::from_string("011001"));
    EXPECT_EQ(out, (std::vector<char>{'C', 'A', 'B', 'A'}));
}

TEST(DecoderTest, EmptyBitstreamGivesNothing) {
    const auto dec = make_abc_decoder(TruncationPolicy::error);
    EXPECT_TRUE(dec.decode_owned(BitVector()).empty());
}

TEST(DecoderTest, TrailingBitsDiscardedByDefault) {
    const auto dec = make_abc_decoder();
    EXPECT_EQ(dec.decode_owned(BitVector::from_string("10")), (std::vector<char>{'A'}));
    EXPECT_TRUE(dec.decode_owned(BitVector::from_string("0")).empty());
}

TEST(DecoderTest, TrailingBitsRaiseUnderErrorPolicy) {
    const auto dec = make_abc_decoder(TruncationPolicy::error);
    try {
        dec.decode_owned(BitVector::from_string("1010"));
        FAIL() << "expected TruncatedStreamError";
    } catch (const TruncatedStreamError& e) {
        EXPECT_EQ(e.symbol_offset(), 3u);
        EXPECT_EQ(e.dangling_bits(), 1u);
    }
}

TEST(DecoderTest, LazyRangeIsRestartable) {
    const auto dec = make_abc_decoder();
    const BitVector bits = BitVector::from_string("10001");
    const auto range = dec.decode_iter(bits);

    std::string first(range.begin(), range.end());
    std::string second(range.begin(), range.end());
    EXPECT_EQ(first, "ABC");
    EXPECT_EQ(first, second);
}

TEST(DecoderTest, IteratorReportsConsumedBits) {
    const auto dec = make_abc_decoder();
    const BitVector bits = BitVector::from_string("001");
    auto it = dec.decode_iter(bits).begin();
    EXPECT_EQ(*it, 'B');
    EXPECT_EQ(it.position(), 2u);
    ++it;
    EXPECT_EQ(*it, 'A');
    EXPECT_EQ(it.position(), 3u);
    ++it;
    EXPECT_EQ(it, dec.decode_iter(bits).end());
}

TEST(DecoderTest, ReferencesPointIntoTree) {
    const auto dec = make_abc_decoder();
    const auto refs = dec.decode(BitVector::from_string("11"));
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(&refs[0].get(), &refs[1].get());
    EXPECT_EQ(refs[0].get(), 'A');
}

TEST(DecoderTest, ReferencesSurviveMovingTheDecoder) {
    auto dec = make_abc_decoder();
    const auto refs = dec.decode(BitVector::from_string("01"));
    const char* before = &refs[0].get();

    Decoder<char> moved = std::move(dec);
    const auto again = moved.decode(BitVector::from_string("01"));
    EXPECT_EQ(&again[0].get(), before);
    EXPECT_EQ(refs[0].get(), 'C');
}

TEST(DecoderTest, LoneLeafEmitsOncePerBit) {
    const Decoder<std::string> dec(hcodec::build_code_tree<std::string>(Weights<std::string>{{"solo", 3}}),
                                   CodecOptions{TruncationPolicy::error});
    const auto out = dec.decode_owned(BitVector::from_string("0101"));
    EXPECT_EQ(out, (std::vector<std::string>(4, "solo")));
}

TEST(DecoderTest, LazyRangeNeedsLivingBitstream) {
    static_assert(decodes_lvalue<Decoder<char>>::value, "lvalue bitstream must be accepted");
    static_assert(!decodes_temporary<Decoder<char>>::value, "temporary bitstream must be rejected");
    static_assert(!decodes_temporary<hcodec::Huffman<std::string>>::value, "temporary bitstream must be rejected");
    static_assert(decodes_lvalue<hcodec::Huffman<std::string>>::value, "lvalue bitstream must be accepted");

    const auto dec = make_abc_decoder();
    const BitVector bits = BitVector::from_string("011");
    std::string out;
    for (char c : dec.decode_iter(bits)) out.push_back(c);
    EXPECT_EQ(out, "CA");
}

TEST(DecoderTest, PostfixIncrement) {
    const auto dec = make_abc_decoder();
    const BitVector bits = BitVector::from_string("1001");
    auto it = dec.decode_iter(bits).begin();
    EXPECT_EQ(*it++, 'A');
    EXPECT_EQ(*it++, 'B');
    EXPECT_EQ(*it, 'A');
    it++;
    EXPECT_EQ(it, dec.decode_iter(bits).end());
}
