#pragma once

/**
 * @file Coord.h
 * @brief Coordinate systems for region files.
 *
 * Three frames are in use: absolute world block coordinates, chunk
 * coordinates (16 blocks per side horizontally, sections of 16 blocks
 * vertically) and region coordinates (32 chunks per side). All
 * conversions use floor division and floor modulo, so negative
 * coordinates stay in range: block x = -1 is chunk -1, local x = 15.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <glm/vec3.hpp>

namespace Anvil::World {

/// Blocks per chunk side and per section height
inline constexpr int32_t SectionSize = 16;

/// Chunks per region side
inline constexpr int32_t RegionChunks = 32;

/// Blocks per biome cell side
inline constexpr int32_t BiomeCellSize = 4;

/// Division rounding toward negative infinity.
constexpr int32_t floorDiv(int32_t value, int32_t divisor) {
    int32_t q = value / divisor;
    int32_t r = value % divisor;
    if (r != 0 && ((r < 0) != (divisor < 0))) {
        q -= 1;
    }
    return q;
}

/// Modulo with the sign of the divisor: floorMod(-1, 16) == 15.
constexpr int32_t floorMod(int32_t value, int32_t divisor) {
    int32_t r = value % divisor;
    if (r != 0 && ((r < 0) != (divisor < 0))) {
        r += divisor;
    }
    return r;
}

/**
 * @brief Absolute block position in the world.
 */
struct BlockPos {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    bool operator==(const BlockPos&) const = default;

    glm::ivec3 toVec() const { return glm::ivec3(x, y, z); }

    /// Position within its section, each component in [0, 16)
    glm::ivec3 sectionLocal() const {
        return glm::ivec3(floorMod(x, SectionSize), floorMod(y, SectionSize), floorMod(z, SectionSize));
    }
};

/**
 * @brief Absolute chunk column position.
 */
struct ChunkPos {
    int32_t x = 0;
    int32_t z = 0;

    bool operator==(const ChunkPos&) const = default;
};

/**
 * @brief Region position, as encoded in r.<x>.<z>.mca file names.
 */
struct RegionPos {
    int32_t x = 0;
    int32_t z = 0;

    bool operator==(const RegionPos&) const = default;
};

struct RegionPosHash {
    std::size_t operator()(const RegionPos& r) const {
        return std::hash<int64_t>{}((static_cast<int64_t>(r.x) << 32) ^ static_cast<uint32_t>(r.z));
    }
};

inline ChunkPos blockToChunk(const BlockPos& block) {
    return {floorDiv(block.x, SectionSize), floorDiv(block.z, SectionSize)};
}

inline RegionPos chunkToRegion(const ChunkPos& chunk) {
    return {floorDiv(chunk.x, RegionChunks), floorDiv(chunk.z, RegionChunks)};
}

inline RegionPos blockToRegion(const BlockPos& block) {
    return chunkToRegion(blockToChunk(block));
}

/// Chunk slot within its region, each component in [0, 32)
inline void chunkInRegion(const ChunkPos& chunk, uint32_t& rx, uint32_t& rz) {
    rx = static_cast<uint32_t>(floorMod(chunk.x, RegionChunks));
    rz = static_cast<uint32_t>(floorMod(chunk.z, RegionChunks));
}

/// Block coordinate within its chunk or section, in [0, 16)
inline int32_t blockInChunk(int32_t coord) {
    return floorMod(coord, SectionSize);
}

/// Section Y for an absolute block Y.
inline int32_t sectionIndexForWorldY(int32_t y) {
    return floorDiv(y, SectionSize);
}

/**
 * @brief Linear index of a block within a section, y * 256 + z * 16 + x.
 *
 * @throws std::out_of_range if any coordinate is not within [0, 16)
 */
inline size_t blockIndexWithinSection(int32_t x, int32_t y, int32_t z) {
    if (x < 0 || x >= SectionSize || y < 0 || y >= SectionSize || z < 0 || z >= SectionSize) {
        throw std::out_of_range("blockIndexWithinSection: (" + std::to_string(x) + ", " +
            std::to_string(y) + ", " + std::to_string(z) + ") outside [0, 16)");
    }
    return static_cast<size_t>(y) * 256 + static_cast<size_t>(z) * 16 + static_cast<size_t>(x);
}

/**
 * @brief Linear index of the 4x4x4 biome cell containing a section-local block.
 *
 * @throws std::out_of_range if any coordinate is not within [0, 16)
 */
inline size_t biomeIndexWithinSection(int32_t x, int32_t y, int32_t z) {
    if (x < 0 || x >= SectionSize || y < 0 || y >= SectionSize || z < 0 || z >= SectionSize) {
        throw std::out_of_range("biomeIndexWithinSection: (" + std::to_string(x) + ", " +
            std::to_string(y) + ", " + std::to_string(z) + ") outside [0, 16)");
    }
    return static_cast<size_t>(y / BiomeCellSize) * 16 +
        static_cast<size_t>(z / BiomeCellSize) * 4 +
        static_cast<size_t>(x / BiomeCellSize);
}

} // namespace Anvil::World
