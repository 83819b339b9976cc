#pragma once

#include "Anvil/Chunk/PackedArray.h"
#include "Anvil/Region/RegionError.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Anvil::Chunk {

/**
 * @brief Palette plus optional packed indices for one section.
 *
 * Without packed data the palette has a single entry that applies to
 * every position in the section.
 */
template <typename T>
class PalettedContainer {
public:
    PalettedContainer() = default;

    PalettedContainer(PaletteKind kind, std::vector<T> palette, std::optional<std::vector<int64_t>> data)
        : m_kind(kind), m_palette(std::move(palette)), m_data(std::move(data)) {
    }

    PaletteKind kind() const { return m_kind; }
    const std::vector<T>& palette() const { return m_palette; }
    const std::optional<std::vector<int64_t>>& data() const { return m_data; }

    uint32_t bitsPerEntry() const { return bitsForPalette(m_palette.size(), m_kind); }

    /**
     * @brief Palette index stored at a linear position.
     *
     * @throws Region::RegionError (CorruptData) on malformed packed data
     */
    uint32_t indexAt(size_t index) const {
        if (!m_data) {
            if (m_palette.empty()) {
                throw Region::RegionError(Region::ErrorKind::CorruptData, "palette is empty");
            }
            return 0;
        }
        return unpackIndex(*m_data, index, bitsPerEntry(), entriesPerSection(m_kind));
    }

    /**
     * @brief Palette entry at a linear position.
     *
     * @throws Region::RegionError (CorruptData) if the stored index is not in the palette
     */
    const T& at(size_t index) const {
        uint32_t raw = indexAt(index);
        if (raw >= m_palette.size()) {
            throw Region::RegionError(Region::ErrorKind::CorruptData,
                "palette index " + std::to_string(raw) + " outside palette of " +
                std::to_string(m_palette.size()) + " entries");
        }
        return m_palette[raw];
    }

private:
    PaletteKind m_kind = PaletteKind::Block;
    std::vector<T> m_palette;
    std::optional<std::vector<int64_t>> m_data;
};

} // namespace Anvil::Chunk
