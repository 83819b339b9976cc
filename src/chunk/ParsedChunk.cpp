#include "Anvil/Chunk/ParsedChunk.h"

#include "Anvil/Region/RegionError.h"
#include "Anvil/World/Coord.h"

#include <string>

namespace Anvil::Chunk {

namespace {

using Region::ErrorKind;
using Region::RegionError;

constexpr size_t kLightArrayBytes = 2048;

[[noreturn]] void schemaError(const std::string& field, const std::string& problem) {
    throw RegionError(ErrorKind::TagDecodeError, "chunk field '" + field + "' " + problem);
}

template <typename T>
const T& requireField(const Nbt::Compound& compound, const std::string& name, Nbt::TagType expected) {
    const Nbt::Tag* tag = compound.find(name);
    if (!tag) {
        schemaError(name, "is missing");
    }
    const T* value = std::get_if<T>(&tag->value);
    if (!value) {
        schemaError(name, std::string("has type ") + Nbt::tagTypeName(tag->type()) +
            ", expected " + Nbt::tagTypeName(expected));
    }
    return *value;
}

template <typename T>
std::optional<T> optionalField(const Nbt::Compound& compound, const std::string& name, Nbt::TagType expected) {
    if (!compound.contains(name)) {
        return std::nullopt;
    }
    return requireField<T>(compound, name, expected);
}

void requireElementType(const Nbt::ListTag& list, const std::string& name, Nbt::TagType expected) {
    if (!list.items.empty() && list.elementType != expected) {
        schemaError(name, std::string("holds ") + Nbt::tagTypeName(list.elementType) +
            " elements, expected " + Nbt::tagTypeName(expected));
    }
}

BlockState readBlockState(const Nbt::Compound& entry) {
    BlockState state;
    state.name = requireField<std::string>(entry, "Name", Nbt::TagType::String);
    if (entry.contains("Properties")) {
        const auto& props = requireField<Nbt::Compound>(entry, "Properties", Nbt::TagType::Compound);
        for (const auto& [key, value] : props.entries()) {
            const auto* text = std::get_if<std::string>(&value.value);
            if (!text) {
                schemaError("Properties." + key, "is not a String");
            }
            state.properties[key] = *text;
        }
    }
    return state;
}

std::optional<std::vector<int64_t>> readPackedData(const Nbt::Compound& container) {
    return optionalField<std::vector<int64_t>>(container, "data", Nbt::TagType::LongArray);
}

PalettedContainer<BlockState> readBlockStates(const Nbt::Compound& container) {
    const auto& paletteTag = requireField<Nbt::ListTag>(container, "palette", Nbt::TagType::List);
    requireElementType(paletteTag, "block_states.palette", Nbt::TagType::Compound);
    if (paletteTag.items.empty()) {
        schemaError("block_states.palette", "is empty");
    }
    std::vector<BlockState> palette;
    palette.reserve(paletteTag.items.size());
    for (const auto& item : paletteTag.items) {
        palette.push_back(readBlockState(std::get<Nbt::Compound>(item.value)));
    }
    return PalettedContainer<BlockState>(PaletteKind::Block, std::move(palette), readPackedData(container));
}

PalettedContainer<Biome> readBiomes(const Nbt::Compound& container) {
    const auto& paletteTag = requireField<Nbt::ListTag>(container, "palette", Nbt::TagType::List);
    requireElementType(paletteTag, "biomes.palette", Nbt::TagType::String);
    if (paletteTag.items.empty()) {
        schemaError("biomes.palette", "is empty");
    }
    std::vector<Biome> palette;
    palette.reserve(paletteTag.items.size());
    for (const auto& item : paletteTag.items) {
        palette.push_back(Biome{std::get<std::string>(item.value)});
    }
    return PalettedContainer<Biome>(PaletteKind::Biome, std::move(palette), readPackedData(container));
}

ChunkSection readSection(const Nbt::Compound& compound) {
    ChunkSection section;
    section.y = requireField<int8_t>(compound, "Y", Nbt::TagType::Byte);
    if (compound.contains("block_states")) {
        section.blockStates = readBlockStates(
            requireField<Nbt::Compound>(compound, "block_states", Nbt::TagType::Compound));
    }
    if (compound.contains("biomes")) {
        section.biomes = readBiomes(requireField<Nbt::Compound>(compound, "biomes", Nbt::TagType::Compound));
    }
    section.blockLight = optionalField<std::vector<int8_t>>(compound, "BlockLight", Nbt::TagType::ByteArray);
    section.skyLight = optionalField<std::vector<int8_t>>(compound, "SkyLight", Nbt::TagType::ByteArray);
    return section;
}

Heightmaps readHeightmaps(const Nbt::Compound& compound) {
    using LongArray = std::vector<int64_t>;
    Heightmaps maps;
    maps.motionBlocking = optionalField<LongArray>(compound, "MOTION_BLOCKING", Nbt::TagType::LongArray);
    maps.motionBlockingNoLeaves = optionalField<LongArray>(compound, "MOTION_BLOCKING_NO_LEAVES", Nbt::TagType::LongArray);
    maps.oceanFloor = optionalField<LongArray>(compound, "OCEAN_FLOOR", Nbt::TagType::LongArray);
    maps.oceanFloorWg = optionalField<LongArray>(compound, "OCEAN_FLOOR_WG", Nbt::TagType::LongArray);
    maps.worldSurface = optionalField<LongArray>(compound, "WORLD_SURFACE", Nbt::TagType::LongArray);
    maps.worldSurfaceWg = optionalField<LongArray>(compound, "WORLD_SURFACE_WG", Nbt::TagType::LongArray);
    return maps;
}

std::optional<uint8_t> readNibble(const std::optional<std::vector<int8_t>>& array, const char* name,
                                  size_t index) {
    if (!array) {
        return std::nullopt;
    }
    if (array->size() != kLightArrayBytes) {
        throw RegionError(ErrorKind::CorruptData,
            std::string(name) + " has " + std::to_string(array->size()) + " bytes, expected " +
            std::to_string(kLightArrayBytes));
    }
    uint8_t packed = static_cast<uint8_t>((*array)[index / 2]);
    return static_cast<uint8_t>((index % 2 == 0) ? (packed & 0x0F) : (packed >> 4));
}

} // namespace

ParsedChunk ParsedChunk::fromNbt(const Nbt::Compound& root) {
    ParsedChunk chunk;
    chunk.dataVersion = requireField<int32_t>(root, "DataVersion", Nbt::TagType::Int);
    chunk.xPos = requireField<int32_t>(root, "xPos", Nbt::TagType::Int);
    chunk.yPos = requireField<int32_t>(root, "yPos", Nbt::TagType::Int);
    chunk.zPos = requireField<int32_t>(root, "zPos", Nbt::TagType::Int);
    chunk.status = requireField<std::string>(root, "Status", Nbt::TagType::String);
    chunk.lastUpdate = requireField<int64_t>(root, "LastUpdate", Nbt::TagType::Long);
    chunk.inhabitedTime = requireField<int64_t>(root, "InhabitedTime", Nbt::TagType::Long);

    const auto& sections = requireField<Nbt::ListTag>(root, "sections", Nbt::TagType::List);
    requireElementType(sections, "sections", Nbt::TagType::Compound);
    chunk.sections.reserve(sections.items.size());
    for (const auto& item : sections.items) {
        chunk.sections.push_back(readSection(std::get<Nbt::Compound>(item.value)));
    }

    chunk.heightmaps = readHeightmaps(requireField<Nbt::Compound>(root, "Heightmaps", Nbt::TagType::Compound));

    chunk.blockEntities = optionalField<Nbt::ListTag>(root, "block_entities", Nbt::TagType::List);
    chunk.blockTicks = optionalField<Nbt::ListTag>(root, "block_ticks", Nbt::TagType::List);
    chunk.fluidTicks = optionalField<Nbt::ListTag>(root, "fluid_ticks", Nbt::TagType::List);
    chunk.postProcessing = optionalField<Nbt::ListTag>(root, "PostProcessing", Nbt::TagType::List);
    chunk.structures = optionalField<Nbt::Compound>(root, "structures", Nbt::TagType::Compound);
    chunk.lights = optionalField<Nbt::ListTag>(root, "Lights", Nbt::TagType::List);
    chunk.entities = optionalField<Nbt::ListTag>(root, "Entities", Nbt::TagType::List);
    if (const Nbt::Tag* masks = root.find("CarvingMasks")) {
        chunk.carvingMasks = *masks;
    }
    return chunk;
}

const ChunkSection* ParsedChunk::sectionAt(int32_t blockY) const {
    int32_t sectionY = World::sectionIndexForWorldY(blockY);
    for (const auto& section : sections) {
        if (section.y == sectionY) {
            return &section;
        }
    }
    return nullptr;
}

std::optional<BlockState> ParsedChunk::getBlock(int32_t x, int32_t y, int32_t z) const {
    int32_t localY = World::blockInChunk(y);
    size_t index = World::blockIndexWithinSection(x, localY, z);
    const ChunkSection* section = sectionAt(y);
    if (!section || !section->blockStates) {
        return std::nullopt;
    }
    return section->blockStates->at(index);
}

std::optional<BlockState> ParsedChunk::getBlockAtWorld(int32_t x, int32_t y, int32_t z) const {
    return getBlock(World::blockInChunk(x), y, World::blockInChunk(z));
}

std::optional<Biome> ParsedChunk::getBiome(int32_t x, int32_t y, int32_t z) const {
    int32_t localY = World::blockInChunk(y);
    size_t index = World::biomeIndexWithinSection(x, localY, z);
    const ChunkSection* section = sectionAt(y);
    if (!section || !section->biomes) {
        return std::nullopt;
    }
    return section->biomes->at(index);
}

std::optional<uint8_t> ParsedChunk::blockLight(int32_t x, int32_t y, int32_t z) const {
    size_t index = World::blockIndexWithinSection(x, World::blockInChunk(y), z);
    const ChunkSection* section = sectionAt(y);
    if (!section) {
        return std::nullopt;
    }
    return readNibble(section->blockLight, "BlockLight", index);
}

std::optional<uint8_t> ParsedChunk::skyLight(int32_t x, int32_t y, int32_t z) const {
    size_t index = World::blockIndexWithinSection(x, World::blockInChunk(y), z);
    const ChunkSection* section = sectionAt(y);
    if (!section) {
        return std::nullopt;
    }
    return readNibble(section->skyLight, "SkyLight", index);
}

} // namespace Anvil::Chunk
