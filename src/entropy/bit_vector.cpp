#include "entropy/bit_vector.hpp"

#include <stdexcept>

namespace hcodec {

BitVector BitVector::from_string(const std::string& bits) {
    BitVector v;
    v.reserve(bits.size());
    for (char c : bits) {
        if (c == '0') {
            v.push_back(false);
        } else if (c == '1') {
            v.push_back(true);
        } else {
            throw std::runtime_error("BitVector: invalid bit character");
        }
    }
    return v;
}

BitVector BitVector::from_bytes(const std::vector<uint8_t>& bytes, size_t bit_count) {
    // bit_count + 7 would wrap near SIZE_MAX
    const size_t need = bit_count / 8 + ((bit_count & 7) != 0 ? 1 : 0);
    if (bytes.size() < need) {
        throw std::runtime_error("BitVector: byte buffer shorter than bit count");
    }
    BitVector v;
    v.data_.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(need));
    v.size_ = bit_count;
    // keep the padding invariant: unused low bits are zero
    const size_t used = bit_count & 7;
    if (used != 0) {
        v.data_.back() &= static_cast<uint8_t>(0xFFu << (8 - used));
    }
    return v;
}

void BitVector::push_back(bool bit) {
    const size_t bit_pos = size_ & 7;
    if (bit_pos == 0) {
        data_.push_back(0);
    }
    if (bit) {
        data_.back() |= static_cast<uint8_t>(1u << (7 - bit_pos));
    }
    ++size_;
}

void BitVector::append(const BitVector& other) {
    if (&other == this) {
        const BitVector copy = other;
        append(copy);
        return;
    }
    if ((size_ & 7) == 0) {
        // byte aligned: copy whole bytes
        data_.insert(data_.end(), other.data_.begin(), other.data_.end());
        size_ += other.size_;
        return;
    }
    reserve(size_ + other.size_);
    for (size_t i = 0; i < other.size_; ++i) {
        push_back(other[i]);
    }
}

bool BitVector::at(size_t i) const {
    if (i >= size_) {
        throw std::out_of_range("BitVector: index out of range");
    }
    return (*this)[i];
}

bool BitVector::starts_with(const BitVector& prefix) const {
    if (prefix.size_ > size_) return false;
    for (size_t i = 0; i < prefix.size_; ++i) {
        if ((*this)[i] != prefix[i]) return false;
    }
    return true;
}

std::string BitVector::to_string() const {
    std::string s;
    s.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        s.push_back((*this)[i] ? '1' : '0');
    }
    return s;
}

#ifndef NDEBUG
namespace {
// Self-test: unaligned append and byte packing.
struct BitVectorSelfTest {
    BitVectorSelfTest() {
        BitVector a = BitVector::from_string("101");
        a.append(BitVector::from_string("0000011"));
        if (a.to_string() != "1010000011" || a.bytes().size() != 2 ||
            a.bytes()[0] != 0xA0 || a.bytes()[1] != 0xC0) {
            throw std::runtime_error("BitVector self-test: packing mismatch");
        }
        if (BitVector::from_bytes(a.bytes(), a.size()) != a) {
            throw std::runtime_error("BitVector self-test: round-trip mismatch");
        }
    }
};
static BitVectorSelfTest _bit_vector_self_test{};
} // namespace
#endif

} // namespace hcodec
