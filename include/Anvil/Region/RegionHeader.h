#pragma once

/**
 * @file RegionHeader.h
 * @brief The fixed 8 KiB index at the start of a region file.
 *
 * Bytes [0, 4096) hold 1024 location entries (3-byte sector offset,
 * 1-byte sector count). Bytes [4096, 8192) hold 1024 timestamps. Both
 * tables are indexed by z * 32 + x.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Anvil::Region {

/// Bytes per payload sector
inline constexpr size_t SectorSize = 4096;

/// Size of the location + timestamp tables
inline constexpr size_t HeaderSize = 2 * SectorSize;

/// Sectors occupied by the header
inline constexpr uint32_t HeaderSectors = 2;

/// Chunks per region side
inline constexpr uint32_t RegionWidth = 32;

/// Chunk slots per region
inline constexpr size_t ChunkSlots = RegionWidth * RegionWidth;

struct LocationEntry {
    uint32_t sectorOffset = 0;
    uint8_t sectorCount = 0;

    /// An all-zero entry marks a chunk that has not been generated.
    bool isEmpty() const { return sectorOffset == 0 && sectorCount == 0; }

    bool operator==(const LocationEntry&) const = default;
};

/**
 * @brief Flat slot index for region-relative chunk coordinates.
 *
 * @throws std::out_of_range if x or z is not within [0, 32)
 */
size_t chunkIndex(uint32_t x, uint32_t z);

/**
 * @brief Parsed copy of the header tables.
 *
 * Holds owned values only; the buffer it was parsed from may be released
 * independently.
 */
class RegionHeader {
public:
    /**
     * @brief Parse the location and timestamp tables.
     *
     * @throws RegionError (MissingHeader) if bytes is shorter than HeaderSize
     */
    static RegionHeader parse(std::span<const uint8_t> bytes);

    const LocationEntry& location(uint32_t x, uint32_t z) const {
        return m_locations[chunkIndex(x, z)];
    }

    uint32_t timestamp(uint32_t x, uint32_t z) const {
        return m_timestamps[chunkIndex(x, z)];
    }

    const std::array<LocationEntry, ChunkSlots>& locations() const { return m_locations; }
    const std::array<uint32_t, ChunkSlots>& timestamps() const { return m_timestamps; }

private:
    std::array<LocationEntry, ChunkSlots> m_locations{};
    std::array<uint32_t, ChunkSlots> m_timestamps{};
};

} // namespace Anvil::Region
