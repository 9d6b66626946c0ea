#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace hcodec {

// Base of every error raised by the coding core.
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// encode() met a symbol that has no entry in the dictionary.
class NoSuchKeyError : public CodecError {
public:
    explicit NoSuchKeyError(std::string symbol)
        : CodecError("encode: no such key in dictionary: " + symbol),
          symbol_(std::move(symbol)) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// The frequency table cannot yield a code tree.
class InvalidWeightsError : public CodecError {
public:
    explicit InvalidWeightsError(std::string reason)
        : CodecError("huffman: invalid weights: " + reason),
          reason_(std::move(reason)) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

// Bitstream ended inside a code (only raised with TruncationPolicy::error).
class TruncatedStreamError : public CodecError {
public:
    TruncatedStreamError(size_t symbol_offset, size_t dangling_bits)
        : CodecError("decode: bitstream truncated at bit " + std::to_string(symbol_offset) +
                     " (" + std::to_string(dangling_bits) + " dangling bits)"),
          symbol_offset_(symbol_offset),
          dangling_bits_(dangling_bits) {}

    size_t symbol_offset() const { return symbol_offset_; }
    size_t dangling_bits() const { return dangling_bits_; }

private:
    size_t symbol_offset_;
    size_t dangling_bits_;
};

} // namespace hcodec
