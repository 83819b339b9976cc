#pragma once

/**
 * @file BigEndian.h
 * @brief Fixed-width big-endian integer reads over byte spans.
 *
 * Callers are responsible for bounds: every function reads exactly
 * the number of bytes its name states, starting at the given offset.
 */

#include <cstddef>
#include <cstdint>
#include <span>

namespace Anvil::Region {

inline uint32_t readU8(std::span<const uint8_t> bytes, size_t offset) {
    return bytes[offset];
}

inline uint32_t readU16BE(std::span<const uint8_t> bytes, size_t offset) {
    return (static_cast<uint32_t>(bytes[offset]) << 8) |
        static_cast<uint32_t>(bytes[offset + 1]);
}

/// Three-byte value with the top byte of the result zeroed.
inline uint32_t readU24BE(std::span<const uint8_t> bytes, size_t offset) {
    return (static_cast<uint32_t>(bytes[offset]) << 16) |
        (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
        static_cast<uint32_t>(bytes[offset + 2]);
}

inline uint32_t readU32BE(std::span<const uint8_t> bytes, size_t offset) {
    return (static_cast<uint32_t>(bytes[offset]) << 24) |
        (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
        (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
        static_cast<uint32_t>(bytes[offset + 3]);
}

inline uint64_t readU64BE(std::span<const uint8_t> bytes, size_t offset) {
    return (static_cast<uint64_t>(readU32BE(bytes, offset)) << 32) |
        static_cast<uint64_t>(readU32BE(bytes, offset + 4));
}

} // namespace Anvil::Region
