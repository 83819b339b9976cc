#include "TestFramework.h"
#include "RegionFixture.h"

#include "Anvil/Chunk/PackedArray.h"
#include "Anvil/Chunk/PalettedContainer.h"

#include <string>

using namespace Anvil::Chunk;
using Anvil::Region::ErrorKind;
using Anvil::Test::packIndices;

TEST_CASE(PackedArray_BitsForPalette) {
    CHECK_EQ(bitsForPalette(1, PaletteKind::Block), 4u);
    CHECK_EQ(bitsForPalette(16, PaletteKind::Block), 4u);
    CHECK_EQ(bitsForPalette(17, PaletteKind::Block), 5u);
    CHECK_EQ(bitsForPalette(128, PaletteKind::Block), 7u);
    CHECK_EQ(bitsForPalette(1, PaletteKind::Biome), 1u);
    CHECK_EQ(bitsForPalette(2, PaletteKind::Biome), 1u);
    CHECK_EQ(bitsForPalette(3, PaletteKind::Biome), 2u);
    CHECK_EQ(bitsForPalette(5, PaletteKind::Biome), 3u);
    CHECK_REGION_ERROR(bitsForPalette(0, PaletteKind::Block), ErrorKind::CorruptData);
}

TEST_CASE(PackedArray_ExpectedWordCount) {
    CHECK_EQ(expectedWordCount(4096, 4), 256u);
    CHECK_EQ(expectedWordCount(4096, 5), 342u);
    CHECK_EQ(expectedWordCount(4096, 7), 456u);
    CHECK_EQ(expectedWordCount(64, 1), 1u);
    CHECK_EQ(expectedWordCount(64, 3), 4u);
}

TEST_CASE(PackedArray_AllZeroDecodesToZero) {
    for (uint32_t bits : {4u, 5u, 7u, 12u}) {
        std::vector<int64_t> words(expectedWordCount(BlockEntriesPerSection, bits), 0);
        for (size_t i = 0; i < BlockEntriesPerSection; i += 97) {
            CHECK_EQ(unpackIndex(words, i, bits, BlockEntriesPerSection), 0u);
        }
        CHECK_EQ(unpackIndex(words, BlockEntriesPerSection - 1, bits, BlockEntriesPerSection), 0u);
    }
    std::vector<int64_t> biomeWords(expectedWordCount(BiomeEntriesPerSection, 2), 0);
    CHECK_EQ(unpackIndex(biomeWords, 63, 2, BiomeEntriesPerSection), 0u);
}

TEST_CASE(PackedArray_ValuesDoNotStraddleWords) {
    std::vector<uint32_t> values(BlockEntriesPerSection);
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<uint32_t>((i * 7) % 20);
    }
    auto words = packIndices(values, 5);
    CHECK_EQ(words.size(), 342u);
    for (size_t i : {size_t{0}, size_t{11}, size_t{12}, size_t{13}, size_t{4095}}) {
        CHECK_EQ(unpackIndex(words, i, 5, BlockEntriesPerSection), values[i]);
    }
}

TEST_CASE(PackedArray_HighBitWord) {
    std::vector<int64_t> words(256, 0);
    words[0] = static_cast<int64_t>(0xF000000000000000ull);
    CHECK_EQ(unpackIndex(words, 15, 4, BlockEntriesPerSection), 15u);
    CHECK_EQ(unpackIndex(words, 14, 4, BlockEntriesPerSection), 0u);
}

TEST_CASE(PackedArray_LengthMismatchIsCorrupt) {
    std::vector<int64_t> shortWords(255, 0);
    std::vector<int64_t> longWords(257, 0);
    CHECK_REGION_ERROR(unpackIndex(shortWords, 0, 4, BlockEntriesPerSection), ErrorKind::CorruptData);
    CHECK_REGION_ERROR(unpackIndex(longWords, 0, 4, BlockEntriesPerSection), ErrorKind::CorruptData);
}

TEST_CASE(PackedArray_IndexAndWidthBounds) {
    std::vector<int64_t> words(256, 0);
    CHECK_REGION_ERROR(unpackIndex(words, 4096, 4, BlockEntriesPerSection), ErrorKind::CorruptData);
    CHECK_REGION_ERROR(unpackIndex(words, 0, 0, BlockEntriesPerSection), ErrorKind::CorruptData);
    CHECK_REGION_ERROR(unpackIndex(words, 0, 33, BlockEntriesPerSection), ErrorKind::CorruptData);
}

TEST_CASE(PalettedContainer_SingleEntryWithoutData) {
    PalettedContainer<std::string> container(PaletteKind::Block, {"minecraft:air"}, std::nullopt);
    CHECK_EQ(container.at(0), "minecraft:air");
    CHECK_EQ(container.at(2048), "minecraft:air");
    CHECK_EQ(container.at(4095), "minecraft:air");
}

TEST_CASE(PalettedContainer_SingleEntryWithData) {
    std::vector<int64_t> zeros(256, 0);
    PalettedContainer<std::string> container(PaletteKind::Block, {"minecraft:stone"}, zeros);
    CHECK_EQ(container.bitsPerEntry(), 4u);
    CHECK_EQ(container.at(100), "minecraft:stone");
}

TEST_CASE(PalettedContainer_IndexOutsidePaletteIsCorrupt) {
    std::vector<uint32_t> values(BlockEntriesPerSection, 0);
    values[10] = 9;
    PalettedContainer<std::string> container(PaletteKind::Block, {"a", "b"}, packIndices(values, 4));
    CHECK_EQ(container.at(9), "a");
    CHECK_EQ(container.indexAt(10), 9u);
    CHECK_REGION_ERROR(container.at(10), ErrorKind::CorruptData);
}

TEST_CASE(PalettedContainer_DecodeIsIdempotent) {
    std::vector<uint32_t> values(BiomeEntriesPerSection);
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<uint32_t>(i % 3);
    }
    PalettedContainer<std::string> container(PaletteKind::Biome, {"plains", "forest", "desert"},
        packIndices(values, 2));
    for (size_t i = 0; i < BiomeEntriesPerSection; ++i) {
        const std::string& first = container.at(i);
        const std::string& second = container.at(i);
        CHECK_EQ(first, second);
        CHECK_EQ(container.indexAt(i), values[i]);
    }
}

TEST_CASE(PalettedContainer_BiomeMinimumWidthIsOne) {
    std::vector<uint32_t> values(BiomeEntriesPerSection, 0);
    values[63] = 1;
    auto words = packIndices(values, 1);
    CHECK_EQ(words.size(), 1u);
    PalettedContainer<std::string> container(PaletteKind::Biome, {"plains", "river"}, words);
    CHECK_EQ(container.bitsPerEntry(), 1u);
    CHECK_EQ(container.at(62), "plains");
    CHECK_EQ(container.at(63), "river");
}
