#pragma once

/**
 * @file PackedArray.h
 * @brief Fixed-width indices packed into 64-bit words.
 *
 * Values never straddle a word boundary: each word holds 64 / bits values
 * starting at the least significant bit, and any remaining high bits are
 * padding.
 */

#include <cstddef>
#include <cstdint>
#include <span>

namespace Anvil::Chunk {

/// Block state palettes use at least 4 bits per index, biome palettes at least 1.
enum class PaletteKind : uint8_t {
    Block,
    Biome
};

/// Indices per section: 16^3 block states, 4^3 biome cells.
inline constexpr size_t BlockEntriesPerSection = 4096;
inline constexpr size_t BiomeEntriesPerSection = 64;

uint32_t minimumBits(PaletteKind kind);
size_t entriesPerSection(PaletteKind kind);

/**
 * @brief Index width for a palette: max(ceil(log2(size)), minimum width).
 *
 * @throws Region::RegionError (CorruptData) for an empty palette
 */
uint32_t bitsForPalette(size_t paletteSize, PaletteKind kind);

/// Number of 64-bit words needed to hold entryCount values of the given width.
size_t expectedWordCount(size_t entryCount, uint32_t bits);

/**
 * @brief Extract the value at a linear index.
 *
 * @throws Region::RegionError (CorruptData) if the word count does not match
 *         entryCount at this width, or index is not within [0, entryCount)
 */
uint32_t unpackIndex(std::span<const int64_t> words, size_t index, uint32_t bits, size_t entryCount);

} // namespace Anvil::Chunk
