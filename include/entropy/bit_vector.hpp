#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

namespace hcodec {

// Growable bit sequence. Bits are packed MSB-first: bit 0 is the high bit of
// byte 0. Unused low bits of the last byte are always zero.
class BitVector {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = bool;
        using difference_type = std::ptrdiff_t;
        using pointer = const bool*;
        using reference = bool;

        const_iterator() = default;
        const_iterator(const BitVector* owner, size_t pos) : owner_(owner), pos_(pos) {}

        bool operator*() const { return (*owner_)[pos_]; }
        const_iterator& operator++() {
            ++pos_;
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator prev = *this;
            ++pos_;
            return prev;
        }
        bool operator==(const const_iterator& o) const { return owner_ == o.owner_ && pos_ == o.pos_; }
        bool operator!=(const const_iterator& o) const { return !(*this == o); }

    private:
        const BitVector* owner_{nullptr};
        size_t pos_{0};
    };

    BitVector() = default;

    // Parse "0110..." (any other character throws).
    static BitVector from_string(const std::string& bits);
    // Take the first bit_count bits of an MSB-first packed buffer.
    static BitVector from_bytes(const std::vector<uint8_t>& bytes, size_t bit_count);

    void push_back(bool bit);
    void append(const BitVector& other);
    void reserve(size_t bits) { data_.reserve((bits + 7) / 8); }
    void clear() {
        data_.clear();
        size_ = 0;
    }

    bool operator[](size_t i) const {
        return ((data_[i >> 3] >> (7 - (i & 7))) & 1u) != 0;
    }
    bool at(size_t i) const;

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    bool starts_with(const BitVector& prefix) const;

    const std::vector<uint8_t>& bytes() const { return data_; }
    std::string to_string() const;

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size_); }

    bool operator==(const BitVector& o) const { return size_ == o.size_ && data_ == o.data_; }
    bool operator!=(const BitVector& o) const { return !(*this == o); }

private:
    std::vector<uint8_t> data_;
    size_t size_{0};
};

} // namespace hcodec
