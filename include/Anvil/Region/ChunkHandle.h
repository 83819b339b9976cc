#pragma once

#include "Anvil/Region/Compression.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Anvil::Chunk {
class ParsedChunk;
}

namespace Anvil::Region {

class OwnedChunk;

/**
 * @brief Compressed chunk payload borrowed from a Region.
 *
 * A handle is a view into the region's payload and must not outlive the
 * Region (or the buffer the Region borrows). Use toOwned() to keep the
 * bytes beyond that lifetime.
 */
class ChunkHandle {
public:
    ChunkHandle(uint8_t compressionTag, std::span<const uint8_t> compressed)
        : m_tag(compressionTag), m_data(compressed) {
    }

    uint8_t compressionTag() const { return m_tag; }
    std::optional<CompressionType> compressionType() const { return compressionTypeFromByte(m_tag); }

    /// Compressed bytes, excluding the length prefix and type tag.
    std::span<const uint8_t> data() const { return m_data; }
    size_t size() const { return m_data.size(); }

    std::vector<uint8_t> decompress(size_t maxOutput = DefaultMaxDecompressedBytes) const;

    /**
     * @brief Decompress and decode into an owned chunk record.
     *
     * @throws RegionError on decompression or schema failures
     */
    Chunk::ParsedChunk parse(size_t maxOutput = DefaultMaxDecompressedBytes) const;

    OwnedChunk toOwned() const;

private:
    uint8_t m_tag;
    std::span<const uint8_t> m_data;
};

/// Deep copy of a chunk payload, independent of any Region.
class OwnedChunk {
public:
    OwnedChunk(uint8_t compressionTag, std::vector<uint8_t> compressed)
        : m_tag(compressionTag), m_data(std::move(compressed)) {
    }

    ChunkHandle view() const { return ChunkHandle(m_tag, m_data); }

    uint8_t compressionTag() const { return m_tag; }
    const std::vector<uint8_t>& data() const { return m_data; }

private:
    uint8_t m_tag;
    std::vector<uint8_t> m_data;
};

} // namespace Anvil::Region
