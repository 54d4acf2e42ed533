#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace droidpack::package {

// Little-endian field helpers shared by the zip codec and the signature block.
using Bytes = std::vector<std::uint8_t>;

inline void putU16(Bytes &out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFU));
}

inline void putU32(Bytes &out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

inline void putU64(Bytes &out, std::uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

inline void putBytes(Bytes &out, const Bytes &data) {
    out.insert(out.end(), data.begin(), data.end());
}

inline void putString(Bytes &out, const std::string &text) {
    out.insert(out.end(), text.begin(), text.end());
}

inline std::uint16_t getU16(const Bytes &in, std::size_t at) {
    return static_cast<std::uint16_t>(in[at] | (in[at + 1] << 8));
}

inline std::uint32_t getU32(const Bytes &in, std::size_t at) {
    return static_cast<std::uint32_t>(in[at]) | (static_cast<std::uint32_t>(in[at + 1]) << 8) |
           (static_cast<std::uint32_t>(in[at + 2]) << 16) | (static_cast<std::uint32_t>(in[at + 3]) << 24);
}

inline std::uint64_t getU64(const Bytes &in, std::size_t at) {
    return static_cast<std::uint64_t>(getU32(in, at)) | (static_cast<std::uint64_t>(getU32(in, at + 4)) << 32);
}

inline void setU32(Bytes &out, std::size_t at, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[at + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFU);
    }
}

} // namespace droidpack::package
