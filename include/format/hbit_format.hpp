#pragma once

#include <cstdint>

namespace hcodec {

// IMPORTANT:
// Do NOT write/read this struct by dumping raw memory or using sizeof(HbitHeader).
// Always serialize field-by-field.
inline constexpr uint16_t kHbitHeaderBytes = 16; // fixed on-disk header size for v1
inline constexpr uint16_t kHbitVersion = 1;

// .hbit file layout:
// [Header][payload...]
//
// Header fields are little-endian. The payload is the MSB-first packed
// bitstream, ceil(bit_count / 8) bytes. The code tree is not stored; the
// reader rebuilds it from the same weights table.
struct HbitHeader {
    char     magic[4];        // "HBIT"
    uint16_t version;         // container version
    uint16_t header_bytes;    // fixed header size
    uint64_t bit_count;       // number of meaningful payload bits
};

} // namespace hcodec
