#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include "entropy/bit_vector.hpp"
#include "format/hbit_format.hpp"

namespace hcodec {

class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_u64_le(uint64_t v) {
        write_u32_le(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        write_u32_le(static_cast<uint32_t>(v >> 32));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    const std::vector<uint8_t>& bytes() const { return buf_; }
private:
    std::vector<uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::vector<uint8_t> data) : buf_(std::move(data)) {}

    uint8_t read_u8() {
        need(1);
        return buf_[pos_++];
    }
    uint16_t read_u16_le() {
        uint16_t lo = read_u8();
        uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t read_u32_le() {
        uint32_t a = read_u16_le();
        uint32_t b = read_u16_le();
        return a | (b << 16);
    }
    uint64_t read_u64_le() {
        uint64_t lo = read_u32_le();
        uint64_t hi = read_u32_le();
        return lo | (hi << 32);
    }
    void read_bytes(void* out, size_t n) {
        if (n == 0) return;
        need(n);
        std::memcpy(out, buf_.data() + pos_, n);
        pos_ += n;
    }
    void skip(size_t n) {
        need(n);
        pos_ += n;
    }
    bool eof() const { return pos_ >= buf_.size(); }
    size_t remaining() const { return buf_.size() - pos_; }
private:
    void need(size_t n) {
        if (n > remaining()) throw std::runtime_error("bitstream: premature EOF");
    }
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
};

// Write header + packed payload for bits.
void write_bitstream(ByteWriter& w, const BitVector& bits);
// Parse and validate a .hbit buffer.
HbitHeader read_bitstream_header(ByteReader& r);
BitVector read_bitstream(const std::vector<uint8_t>& bytes);

} // namespace hcodec
