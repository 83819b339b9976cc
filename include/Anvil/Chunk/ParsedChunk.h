#pragma once

/**
 * @file ParsedChunk.h
 * @brief Decoded chunk record mapped from the chunk's tag tree.
 *
 * A ParsedChunk owns all of its data and is independent of the Region it
 * was read from.
 */

#include "Anvil/Chunk/PalettedContainer.h"
#include "Anvil/Nbt/Tag.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Anvil::Chunk {

struct BlockState {
    std::string name;
    std::map<std::string, std::string> properties;

    bool operator==(const BlockState&) const = default;
};

struct Biome {
    std::string name;

    bool operator==(const Biome&) const = default;
};

struct Heightmaps {
    std::optional<std::vector<int64_t>> motionBlocking;
    std::optional<std::vector<int64_t>> motionBlockingNoLeaves;
    std::optional<std::vector<int64_t>> oceanFloor;
    std::optional<std::vector<int64_t>> oceanFloorWg;
    std::optional<std::vector<int64_t>> worldSurface;
    std::optional<std::vector<int64_t>> worldSurfaceWg;
};

/**
 * @brief One 16x16x16 slice of a chunk column.
 *
 * Light-only sections at the top and bottom of the world carry no
 * block_states or biomes.
 */
struct ChunkSection {
    int8_t y = 0;
    std::optional<PalettedContainer<BlockState>> blockStates;
    std::optional<PalettedContainer<Biome>> biomes;
    std::optional<std::vector<int8_t>> blockLight;
    std::optional<std::vector<int8_t>> skyLight;
};

struct ParsedChunk {
    int32_t dataVersion = 0;
    int32_t xPos = 0;
    int32_t yPos = 0;
    int32_t zPos = 0;
    std::string status;
    int64_t lastUpdate = 0;
    int64_t inhabitedTime = 0;
    std::vector<ChunkSection> sections;
    Heightmaps heightmaps;

    // Kept as raw tags; their contents are not interpreted here.
    std::optional<Nbt::ListTag> blockEntities;
    std::optional<Nbt::ListTag> blockTicks;
    std::optional<Nbt::ListTag> fluidTicks;
    std::optional<Nbt::ListTag> postProcessing;
    std::optional<Nbt::Compound> structures;
    std::optional<Nbt::Tag> carvingMasks;
    std::optional<Nbt::ListTag> lights;
    std::optional<Nbt::ListTag> entities;

    /**
     * @brief Map a decoded root compound onto the chunk schema.
     *
     * @throws Region::RegionError (TagDecodeError) if a required field is
     *         missing or any known field has the wrong type
     */
    static ParsedChunk fromNbt(const Nbt::Compound& root);

    /// Section containing absolute block Y, or nullptr.
    const ChunkSection* sectionAt(int32_t blockY) const;

    /**
     * @brief Block at chunk-relative x, z and absolute y.
     *
     * @return nullopt if the section or its block states are absent
     * @throws std::out_of_range if x or z is not within [0, 16)
     * @throws Region::RegionError (CorruptData) on malformed packed data
     */
    std::optional<BlockState> getBlock(int32_t x, int32_t y, int32_t z) const;

    /// Block at absolute world coordinates. Only meaningful for blocks inside this chunk.
    std::optional<BlockState> getBlockAtWorld(int32_t x, int32_t y, int32_t z) const;

    /// Biome at chunk-relative x, z and absolute y.
    std::optional<Biome> getBiome(int32_t x, int32_t y, int32_t z) const;

    /// Block light level (0-15) at chunk-relative x, z and absolute y.
    std::optional<uint8_t> blockLight(int32_t x, int32_t y, int32_t z) const;

    /// Sky light level (0-15) at chunk-relative x, z and absolute y.
    std::optional<uint8_t> skyLight(int32_t x, int32_t y, int32_t z) const;
};

} // namespace Anvil::Chunk
