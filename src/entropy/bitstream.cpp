#include "entropy/bitstream.hpp"

namespace hcodec {

void write_bitstream(ByteWriter& w, const BitVector& bits) {
    HbitHeader hdr{};
    // "HBIT"
    hdr.magic[0] = 'H';
    hdr.magic[1] = 'B';
    hdr.magic[2] = 'I';
    hdr.magic[3] = 'T';
    hdr.version = kHbitVersion;
    hdr.header_bytes = kHbitHeaderBytes;
    hdr.bit_count = static_cast<uint64_t>(bits.size());

    w.write_bytes(hdr.magic, 4);
    w.write_u16_le(hdr.version);
    w.write_u16_le(hdr.header_bytes);
    w.write_u64_le(hdr.bit_count);
    w.write_bytes(bits.bytes().data(), bits.bytes().size());
}

HbitHeader read_bitstream_header(ByteReader& r) {
    if (r.remaining() < kHbitHeaderBytes) throw std::runtime_error("bitstream: file too small");

    HbitHeader hdr{};
    r.read_bytes(hdr.magic, 4);
    hdr.version = r.read_u16_le();
    hdr.header_bytes = r.read_u16_le();
    hdr.bit_count = r.read_u64_le();

    if (!(hdr.magic[0] == 'H' && hdr.magic[1] == 'B' && hdr.magic[2] == 'I' && hdr.magic[3] == 'T')) {
        throw std::runtime_error("bitstream: bad magic");
    }
    if (hdr.version != kHbitVersion) throw std::runtime_error("bitstream: unsupported version");
    if (hdr.header_bytes < kHbitHeaderBytes) throw std::runtime_error("bitstream: invalid header_bytes");
    // tolerate larger headers from future writers
    r.skip(hdr.header_bytes - kHbitHeaderBytes);
    return hdr;
}

BitVector read_bitstream(const std::vector<uint8_t>& bytes) {
    ByteReader r(bytes);
    HbitHeader hdr = read_bitstream_header(r);

    const uint64_t payload_bytes = hdr.bit_count / 8 + ((hdr.bit_count & 7) != 0 ? 1 : 0);
    if (payload_bytes > r.remaining()) throw std::runtime_error("bitstream: premature EOF");
    std::vector<uint8_t> payload(static_cast<size_t>(payload_bytes));
    r.read_bytes(payload.data(), payload.size());
    return BitVector::from_bytes(payload, static_cast<size_t>(hdr.bit_count));
}

} // namespace hcodec
