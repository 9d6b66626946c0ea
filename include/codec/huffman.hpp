#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/options.hpp"
#include "entropy/bit_vector.hpp"
#include "tree/tree_builder.hpp"

namespace hcodec {

// Encoder and Decoder built from the same frequency table.
template <typename T>
class Huffman {
public:
    // Throws InvalidWeightsError when the table cannot yield a tree.
    template <typename Range>
    static Huffman construct(const Range& weights, CodecOptions opts = {}) {
        CodeTree<T> tree = build_code_tree<T>(weights);
        Encoder<T> enc(tree);
        return Huffman(std::move(enc), Decoder<T>(std::move(tree), opts));
    }

    static Huffman construct(const Weights<T>& weights, CodecOptions opts = {}) {
        return construct<Weights<T>>(weights, opts);
    }

    BitVector encode(const std::vector<T>& data) const { return encoder_.encode(data); }

    DecodeRange<T> decode_iter(const BitVector& bits) const { return decoder_.decode_iter(bits); }
    DecodeRange<T> decode_iter(const BitVector&& bits) const = delete;
    std::vector<std::reference_wrapper<const T>> decode(const BitVector& bits) const {
        return decoder_.decode(bits);
    }
    std::vector<T> decode_owned(const BitVector& bits) const { return decoder_.decode_owned(bits); }

    const Encoder<T>& encoder() const { return encoder_; }
    const Decoder<T>& decoder() const { return decoder_; }

    // Hand the two halves to separate owners; the facade is consumed.
    std::pair<Encoder<T>, Decoder<T>> split() && {
        return {std::move(encoder_), std::move(decoder_)};
    }

private:
    Huffman(Encoder<T> enc, Decoder<T> dec)
        : encoder_(std::move(enc)), decoder_(std::move(dec)) {}

    Encoder<T> encoder_;
    Decoder<T> decoder_;
};

// Shannon entropy of a frequency table in bits per symbol. Zero entries are
// ignored; an all-zero table has entropy 0.
double shannon_entropy(const std::vector<uint64_t>& freqs);

// Bits per symbol of the smallest fixed-length code for the alphabet size
// (at least 1).
size_t fixed_code_length(size_t alphabet_size);

} // namespace hcodec
