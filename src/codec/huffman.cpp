#include "codec/huffman.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace hcodec {

// Alphabets used by the command line tools and most callers.
template class CodeTree<uint32_t>;
template class Encoder<uint32_t>;
template class Decoder<uint32_t>;
template class Huffman<uint32_t>;

template class CodeTree<std::string>;
template class Encoder<std::string>;
template class Decoder<std::string>;
template class Huffman<std::string>;

double shannon_entropy(const std::vector<uint64_t>& freqs) {
    double total = 0.0;
    for (uint64_t f : freqs) total += static_cast<double>(f);
    if (total == 0.0) return 0.0;
    double h = 0.0;
    for (uint64_t f : freqs) {
        if (f == 0) continue;
        const double p = static_cast<double>(f) / total;
        h -= p * std::log2(p);
    }
    return h;
}

size_t fixed_code_length(size_t alphabet_size) {
    size_t bits = 1;
    while (bits < 64 && (static_cast<uint64_t>(1) << bits) < alphabet_size) {
        ++bits;
    }
    return bits;
}

#ifndef NDEBUG
namespace {
// Self-test: build, encode, decode, split.
struct HuffmanSelfTest {
    HuffmanSelfTest() {
        const Weights<uint32_t> weights = {{3, 3}, {0, 1}, {1, 1}, {2, 2}};
        std::vector<uint32_t> symbols = {3, 0, 1, 3, 2, 2, 3};

        auto codec = Huffman<uint32_t>::construct(weights);
        BitVector bits = codec.encode(symbols);
        if (codec.decode_owned(bits) != symbols) {
            throw std::runtime_error("huffman self-test: round-trip mismatch");
        }

        auto halves = std::move(codec).split();
        if (halves.second.decode_owned(halves.first.encode(symbols)) != symbols) {
            throw std::runtime_error("huffman self-test: split round-trip mismatch");
        }
    }
};
static HuffmanSelfTest _huff_self_test{};
} // namespace
#endif

} // namespace hcodec
