#include "TestFramework.h"
#include "RegionFixture.h"

#include "Anvil/World/Dimension.h"
#include "Anvil/World/RegionFile.h"
#include "Anvil/World/Storage.h"

#include <algorithm>
#include <map>
#include <stdexcept>

using namespace Anvil::World;
using namespace Anvil::Test;
using Anvil::Region::ErrorKind;

namespace {

class MemoryStorage : public StorageBackend {
public:
    void put(const std::string& path, std::vector<uint8_t> data) {
        m_files[path] = std::move(data);
    }

    std::vector<uint8_t> readAll(const std::string& path) override {
        ++reads;
        auto it = m_files.find(path);
        if (it == m_files.end()) {
            throw Anvil::Region::RegionError(ErrorKind::Io, "missing file: " + path);
        }
        return it->second;
    }

    bool exists(const std::string& path) override {
        return m_files.find(path) != m_files.end() || isDirectory(path);
    }

    bool isDirectory(const std::string& path) override {
        std::string prefix = path + "/";
        for (const auto& [name, data] : m_files) {
            if (name.rfind(prefix, 0) == 0) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> list(const std::string& path) override {
        std::vector<std::string> out;
        std::string prefix = path + "/";
        for (const auto& [name, data] : m_files) {
            if (name.rfind(prefix, 0) == 0 && name.find('/', prefix.size()) == std::string::npos) {
                out.push_back(name);
            }
        }
        return out;
    }

    size_t reads = 0;

private:
    std::map<std::string, std::vector<uint8_t>> m_files;
};

ChunkLayout chunkAt(int32_t x, int32_t z) {
    ChunkLayout layout;
    layout.xPos = x;
    layout.zPos = z;
    layout.sections.push_back(uniformSection(4));
    return layout;
}

} // namespace

TEST_CASE(RegionFile_ParseFilename) {
    auto pos = parseRegionFilename("r.0.0.mca");
    CHECK(pos.has_value());
    CHECK(*pos == (RegionPos{0, 0}));
    CHECK(*parseRegionFilename("r.-1.12.mca") == (RegionPos{-1, 12}));
    CHECK(*parseRegionFilename("r.3.-40.mcr", "mcr") == (RegionPos{3, -40}));
    CHECK(!parseRegionFilename("r.0.0.mcr").has_value());
    CHECK(!parseRegionFilename("r.0.mca").has_value());
    CHECK(!parseRegionFilename("r.a.0.mca").has_value());
    CHECK(!parseRegionFilename("r.0.0.0.mca").has_value());
    CHECK(!parseRegionFilename("x.0.0.mca").has_value());
    CHECK(!parseRegionFilename("r..0.mca").has_value());
    CHECK(!parseRegionFilename("level.dat").has_value());
    CHECK_EQ(regionFilename(RegionPos{-1, 2}), "r.-1.2.mca");
}

TEST_CASE(RegionFile_BaseName) {
    CHECK_EQ(baseName("/world/region/r.0.0.mca"), "r.0.0.mca");
    CHECK_EQ(baseName("world/DIM-1/"), "DIM-1");
    CHECK_EQ(baseName("r.0.0.mca"), "r.0.0.mca");
}

TEST_CASE(Dimension_ParseDirectory) {
    CHECK(*parseDimensionDirectory("DIM-1") == DimensionId(DimensionId::Nether));
    CHECK(*parseDimensionDirectory("DIM1") == DimensionId(DimensionId::End));
    CHECK(parseDimensionDirectory("DIM7")->isCustom());
    CHECK(!parseDimensionDirectory("DIM0")->isCustom());
    CHECK(!parseDimensionDirectory("DIM").has_value());
    CHECK(!parseDimensionDirectory("DIMx").has_value());
    CHECK(!parseDimensionDirectory("region").has_value());
}

TEST_CASE(Dimension_IndexesRegionFiles) {
    MemoryStorage storage;
    storage.put("world/DIM-1/r.0.0.mca", RegionBuilder().zlibChunk(0, 0, chunkAt(0, 0)).build());
    storage.put("world/DIM-1/r.-1.-1.mca", RegionBuilder().zlibChunk(31, 31, chunkAt(-1, -1)).build());
    storage.put("world/DIM-1/notes.txt", {1, 2, 3});

    Dimension dim = Dimension::fromPath("world/DIM-1", storage);
    CHECK(dim.id().has_value());
    CHECK(*dim.id() == DimensionId(DimensionId::Nether));
    CHECK_EQ(dim.regionCount(), 2u);
    CHECK(dim.hasRegion(0, 0));
    CHECK(dim.hasRegion(-1, -1));
    CHECK(!dim.hasRegion(1, 0));
    CHECK_EQ(storage.reads, 0u);

    auto positions = dim.regionPositions();
    CHECK_EQ(positions.size(), 2u);
    CHECK(std::find(positions.begin(), positions.end(), RegionPos{-1, -1}) != positions.end());
}

TEST_CASE(Dimension_LoadRegion) {
    MemoryStorage storage;
    storage.put("region/r.2.3.mca", RegionBuilder().zlibChunk(5, 6, chunkAt(69, 102)).build());
    Dimension dim = Dimension::fromPath("region", storage);
    CHECK(!dim.id().has_value());

    Anvil::Region::Region region = dim.loadRegion(2, 3);
    CHECK(region.hasChunk(5, 6));
    CHECK_EQ(region.chunkCount(), 1u);
    CHECK_THROWS_AS(dim.loadRegion(0, 0), std::out_of_range);
}

TEST_CASE(Dimension_GetChunkInWorldNegative) {
    MemoryStorage storage;
    storage.put("region/r.-1.-1.mca", RegionBuilder().zlibChunk(31, 31, chunkAt(-1, -1)).build());
    Dimension dim = Dimension::fromPath("region", storage);

    auto chunk = dim.getChunkInWorld(-1, -1);
    CHECK(chunk.has_value());
    CHECK_EQ(chunk->xPos, -1);
    CHECK_EQ(chunk->zPos, -1);
    CHECK(!dim.getChunkInWorld(-2, -1).has_value());
    CHECK(!dim.getChunkInWorld(0, 0).has_value());
    CHECK(dim.regionForChunk(-32, -32).has_value());
    CHECK(!dim.regionForChunk(-33, 0).has_value());
}

TEST_CASE(Dimension_ValidateOnLoad) {
    ChunkLayout broken = chunkAt(0, 0);
    broken.withStatus = false;
    MemoryStorage storage;
    storage.put("region/r.0.0.mca", RegionBuilder().zlibChunk(0, 0, broken).build());

    Dimension lenient = Dimension::fromPath("region", storage);
    CHECK_NO_THROW(lenient.loadRegion(0, 0));

    ReaderConfig strictConfig;
    strictConfig.validateOnLoad = true;
    Dimension strict = Dimension::fromPath("region", storage, strictConfig);
    CHECK_REGION_ERROR(strict.loadRegion(0, 0), ErrorKind::TagDecodeError);
}

TEST_CASE(Dimension_MissingDirectoryIsIo) {
    MemoryStorage storage;
    CHECK_REGION_ERROR(Dimension::fromPath("nowhere", storage), ErrorKind::Io);
}

TEST_CASE(Dimension_CustomExtension) {
    MemoryStorage storage;
    storage.put("old/r.0.0.mcr", RegionBuilder().build());
    storage.put("old/r.1.0.mca", RegionBuilder().build());
    ReaderConfig config;
    config.regionExtension = "mcr";
    Dimension dim = Dimension::fromPath("old", storage, config);
    CHECK(dim.hasRegion(0, 0));
    CHECK(!dim.hasRegion(1, 0));
}
