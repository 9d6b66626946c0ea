#pragma once

#include <cstdint>

namespace hcodec {

// What the decoder does when the bitstream ends in the middle of a code.
enum class TruncationPolicy : uint8_t {
    discard = 0, // drop the dangling bits, emit nothing for them
    error = 1,   // throw TruncatedStreamError
};

struct CodecOptions {
    TruncationPolicy on_truncation = TruncationPolicy::discard;
};

} // namespace hcodec
