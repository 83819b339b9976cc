#include "Anvil/Chunk/PackedArray.h"

#include "Anvil/Region/RegionError.h"

#include <algorithm>
#include <bit>
#include <string>

namespace Anvil::Chunk {

using Region::ErrorKind;
using Region::RegionError;

uint32_t minimumBits(PaletteKind kind) {
    return kind == PaletteKind::Block ? 4u : 1u;
}

size_t entriesPerSection(PaletteKind kind) {
    return kind == PaletteKind::Block ? BlockEntriesPerSection : BiomeEntriesPerSection;
}

uint32_t bitsForPalette(size_t paletteSize, PaletteKind kind) {
    if (paletteSize == 0) {
        throw RegionError(ErrorKind::CorruptData, "palette is empty");
    }
    // ceil(log2(n)) for n >= 1
    uint32_t needed = static_cast<uint32_t>(std::bit_width(paletteSize - 1));
    return std::max(needed, minimumBits(kind));
}

size_t expectedWordCount(size_t entryCount, uint32_t bits) {
    size_t perWord = 64 / bits;
    return (entryCount + perWord - 1) / perWord;
}

uint32_t unpackIndex(std::span<const int64_t> words, size_t index, uint32_t bits, size_t entryCount) {
    if (bits == 0 || bits > 32) {
        throw RegionError(ErrorKind::CorruptData,
            "unsupported packed index width " + std::to_string(bits));
    }
    size_t expected = expectedWordCount(entryCount, bits);
    if (words.size() != expected) {
        throw RegionError(ErrorKind::CorruptData,
            "packed array has " + std::to_string(words.size()) + " words, expected " +
            std::to_string(expected) + " for " + std::to_string(bits) + "-bit indices");
    }
    if (index >= entryCount) {
        throw RegionError(ErrorKind::CorruptData,
            "packed index " + std::to_string(index) + " outside " + std::to_string(entryCount) + " entries");
    }

    size_t perWord = 64 / bits;
    size_t wordIndex = index / perWord;
    size_t slot = index % perWord;
    uint64_t word = static_cast<uint64_t>(words[wordIndex]);
    uint64_t mask = (uint64_t{1} << bits) - 1;
    return static_cast<uint32_t>((word >> (bits * slot)) & mask);
}

} // namespace Anvil::Chunk
