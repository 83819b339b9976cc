#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Anvil::Region {

enum class CompressionType : uint8_t {
    GZip = 1,
    Zlib = 2,
    Uncompressed = 3,
    Lz4 = 4,
    Custom = 127
};

/// Known compression type for a tag byte, or nullopt for an unknown tag.
std::optional<CompressionType> compressionTypeFromByte(uint8_t tag);

const char* compressionTypeName(uint8_t tag);

/// Default ceiling for a single inflated chunk.
inline constexpr size_t DefaultMaxDecompressedBytes = 64u * 1024u * 1024u;

/**
 * @brief Decompress a chunk payload according to its tag byte.
 *
 * Zlib (2) and gzip (1) are inflated with zlib, stored data (3) is copied.
 * LZ4 (4), custom (127) and unknown tags are rejected.
 *
 * @throws RegionError (DecompressError) on a corrupt, truncated or oversized stream
 * @throws RegionError (UnsupportedCompression) for tags without a decoder
 */
std::vector<uint8_t> decompress(uint8_t tag,
                                std::span<const uint8_t> compressed,
                                size_t maxOutput = DefaultMaxDecompressedBytes);

} // namespace Anvil::Region
