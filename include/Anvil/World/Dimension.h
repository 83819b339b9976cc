#pragma once

/**
 * @file Dimension.h
 * @brief Directory of region files making up one dimension of a world.
 *
 * Regions are indexed by the position encoded in their file names when the
 * dimension is opened; no region is read until it is requested.
 */

#include "Anvil/Chunk/ParsedChunk.h"
#include "Anvil/Region/Region.h"
#include "Anvil/World/Coord.h"
#include "Anvil/World/ReaderConfig.h"
#include "Anvil/World/RegionFile.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Anvil::World {

class StorageBackend;

class DimensionId {
public:
    static constexpr int32_t Overworld = 0;
    static constexpr int32_t Nether = -1;
    static constexpr int32_t End = 1;

    explicit DimensionId(int32_t id) : m_id(id) {}

    int32_t id() const { return m_id; }
    bool isCustom() const { return m_id != Overworld && m_id != Nether && m_id != End; }

    bool operator==(const DimensionId&) const = default;

private:
    int32_t m_id;
};

/// Dimension id from a directory named DIM<id>, e.g. "DIM-1".
std::optional<DimensionId> parseDimensionDirectory(const std::string& name);

class Dimension {
public:
    /**
     * @brief Index the region files in a directory.
     *
     * Files whose names are not region file names are skipped. The id is
     * taken from the directory name when it has the DIM<id> form.
     */
    static Dimension fromPath(const std::string& path, StorageBackend& storage, ReaderConfig config = {});

    Dimension(std::optional<DimensionId> id, std::vector<RegionFile> regions,
              StorageBackend& storage, ReaderConfig config);

    const std::optional<DimensionId>& id() const { return m_id; }

    bool hasRegion(int32_t regionX, int32_t regionZ) const;
    std::vector<RegionPos> regionPositions() const;
    size_t regionCount() const { return m_regions.size(); }

    /**
     * @brief Read and index a region.
     *
     * @throws std::out_of_range if no region file exists at that position
     * @throws Region::RegionError if the file cannot be read, or fails
     *         validation when validateOnLoad is set
     */
    Region::Region loadRegion(int32_t regionX, int32_t regionZ) const;

    /// Region containing an absolute chunk position, or nullopt if there is no file for it.
    std::optional<Region::Region> regionForChunk(int32_t chunkX, int32_t chunkZ) const;

    /**
     * @brief Decode one chunk by absolute chunk position.
     *
     * Convenient for one-off lookups; reading many chunks of a region is
     * cheaper through loadRegion().
     *
     * @return nullopt if the region file or the chunk does not exist
     */
    std::optional<Chunk::ParsedChunk> getChunkInWorld(int32_t chunkX, int32_t chunkZ) const;

private:
    std::optional<DimensionId> m_id;
    std::unordered_map<RegionPos, RegionFile, RegionPosHash> m_regions;
    StorageBackend* m_storage;
    ReaderConfig m_config;
};

} // namespace Anvil::World
