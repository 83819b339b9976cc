#pragma once

/**
 * @file Region.h
 * @brief Read-only view over a region container.
 *
 * A Region is the 8 KiB header plus the sector-addressed payload that
 * follows it. Construction parses the header only; every chunk lookup is
 * bounds-checked against the payload when it is made, so buffers that are
 * never fully queried cost no extra work.
 *
 * @section thread_safety Thread Safety
 *
 * All accessors are const and read immutable state. A Region may be
 * shared between threads as long as the underlying buffer is not modified.
 */

#include "Anvil/Region/ChunkHandle.h"
#include "Anvil/Region/RegionHeader.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Anvil::Region {

class Region {
public:
    /**
     * @brief View a caller-owned buffer.
     *
     * The buffer must stay alive and unmodified for the lifetime of the
     * Region and of any ChunkHandle obtained from it.
     *
     * @throws RegionError (MissingHeader) if bytes is shorter than 8192
     */
    static Region fromBytes(std::span<const uint8_t> bytes);

    /**
     * @brief Take ownership of a heap buffer.
     *
     * @throws RegionError (MissingHeader) if bytes is shorter than 8192
     */
    static Region fromOwned(std::vector<uint8_t> bytes);

    Region(Region&&) noexcept = default;
    Region& operator=(Region&&) noexcept = default;
    Region(const Region&) = delete;
    Region& operator=(const Region&) = delete;

    /// True if the chunk at region-relative (x, z) has been generated.
    bool hasChunk(uint32_t x, uint32_t z) const {
        return !m_header.location(x, z).isEmpty();
    }

    uint32_t getTimestamp(uint32_t x, uint32_t z) const {
        return m_header.timestamp(x, z);
    }

    const LocationEntry& location(uint32_t x, uint32_t z) const {
        return m_header.location(x, z);
    }

    /**
     * @brief Locate the chunk at region-relative (x, z).
     *
     * @return nullopt if the chunk has not been generated
     * @throws RegionError (UnexpectedEof) if the entry points outside the payload
     * @throws std::out_of_range if x or z is not within [0, 32)
     */
    std::optional<ChunkHandle> getChunk(uint32_t x, uint32_t z) const;

    /**
     * @brief Locate a chunk by region-relative block coordinates.
     *
     * @throws std::out_of_range if blockX or blockZ is not within [0, 512)
     */
    std::optional<ChunkHandle> getChunkFromBlock(uint32_t blockX, uint32_t blockZ) const;

    /**
     * @brief Decompress and decode every present chunk.
     *
     * Slow and allocation-heavy; meant for integrity audits only. Prefer
     * handling errors from getChunk() and ChunkHandle::parse() as chunks
     * are used.
     *
     * @throws RegionError for the first chunk that fails
     */
    void validate() const;

    /// Number of slots with a non-empty location entry.
    size_t chunkCount() const;

    const RegionHeader& header() const { return m_header; }
    std::span<const uint8_t> payload() const { return m_payload; }

private:
    Region(RegionHeader header, std::span<const uint8_t> payload, std::vector<uint8_t> owned);

    RegionHeader m_header;
    std::vector<uint8_t> m_owned;
    std::span<const uint8_t> m_payload;
};

} // namespace Anvil::Region
