#include "Anvil/World/Dimension.h"

#include "Anvil/Region/RegionError.h"
#include "Anvil/World/Storage.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <stdexcept>
#include <string_view>

namespace Anvil::World {

std::optional<DimensionId> parseDimensionDirectory(const std::string& name) {
    std::string_view view(name);
    if (!view.starts_with("DIM")) {
        return std::nullopt;
    }
    view.remove_prefix(3);
    if (view.empty()) {
        return std::nullopt;
    }
    int32_t id = 0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), id);
    if (ec != std::errc() || ptr != view.data() + view.size()) {
        return std::nullopt;
    }
    return DimensionId(id);
}

Dimension Dimension::fromPath(const std::string& path, StorageBackend& storage, ReaderConfig config) {
    if (!storage.isDirectory(path)) {
        throw Region::RegionError(Region::ErrorKind::Io, "not a directory: " + path);
    }

    std::vector<RegionFile> regions;
    for (const auto& file : storage.list(path)) {
        auto pos = parseRegionFilename(baseName(file), config.regionExtension);
        if (!pos) {
            spdlog::warn("Skipping '{}': not a region file name", file);
            continue;
        }
        regions.emplace_back(file, *pos);
    }

    auto id = parseDimensionDirectory(baseName(path));
    spdlog::debug("Indexed {} region files in {}", regions.size(), path);
    return Dimension(id, std::move(regions), storage, std::move(config));
}

Dimension::Dimension(std::optional<DimensionId> id, std::vector<RegionFile> regions,
                     StorageBackend& storage, ReaderConfig config)
    : m_id(id), m_storage(&storage), m_config(std::move(config)) {
    for (auto& region : regions) {
        RegionPos pos = region.position();
        m_regions.insert_or_assign(pos, std::move(region));
    }
}

bool Dimension::hasRegion(int32_t regionX, int32_t regionZ) const {
    return m_regions.find(RegionPos{regionX, regionZ}) != m_regions.end();
}

std::vector<RegionPos> Dimension::regionPositions() const {
    std::vector<RegionPos> out;
    out.reserve(m_regions.size());
    for (const auto& [pos, file] : m_regions) {
        out.push_back(pos);
    }
    return out;
}

Region::Region Dimension::loadRegion(int32_t regionX, int32_t regionZ) const {
    auto it = m_regions.find(RegionPos{regionX, regionZ});
    if (it == m_regions.end()) {
        throw std::out_of_range("no region file at (" + std::to_string(regionX) + ", " +
            std::to_string(regionZ) + ")");
    }
    Region::Region region = it->second.load(*m_storage);
    spdlog::debug("Loaded region ({}, {}) from {} with {} chunks",
        regionX, regionZ, it->second.path(), region.chunkCount());
    if (m_config.validateOnLoad) {
        region.validate();
    }
    return region;
}

std::optional<Region::Region> Dimension::regionForChunk(int32_t chunkX, int32_t chunkZ) const {
    RegionPos pos = chunkToRegion(ChunkPos{chunkX, chunkZ});
    if (!hasRegion(pos.x, pos.z)) {
        return std::nullopt;
    }
    return loadRegion(pos.x, pos.z);
}

std::optional<Chunk::ParsedChunk> Dimension::getChunkInWorld(int32_t chunkX, int32_t chunkZ) const {
    auto region = regionForChunk(chunkX, chunkZ);
    if (!region) {
        return std::nullopt;
    }
    uint32_t rx = 0;
    uint32_t rz = 0;
    chunkInRegion(ChunkPos{chunkX, chunkZ}, rx, rz);
    auto chunk = region->getChunk(rx, rz);
    if (!chunk) {
        return std::nullopt;
    }
    return chunk->parse(m_config.maxDecompressedBytes);
}

} // namespace Anvil::World
