#include "Anvil/Region/RegionHeader.h"

#include "Anvil/Region/BigEndian.h"
#include "Anvil/Region/RegionError.h"

#include <stdexcept>
#include <string>

namespace Anvil::Region {

size_t chunkIndex(uint32_t x, uint32_t z) {
    if (x >= RegionWidth || z >= RegionWidth) {
        throw std::out_of_range("chunkIndex: coordinates (" + std::to_string(x) + ", " +
            std::to_string(z) + ") outside [0, 32)");
    }
    return static_cast<size_t>(z) * RegionWidth + x;
}

RegionHeader RegionHeader::parse(std::span<const uint8_t> bytes) {
    if (bytes.size() < HeaderSize) {
        throw RegionError(ErrorKind::MissingHeader,
            "region buffer has " + std::to_string(bytes.size()) + " bytes, header needs " +
            std::to_string(HeaderSize));
    }

    RegionHeader header;
    for (size_t i = 0; i < ChunkSlots; ++i) {
        size_t offset = i * 4;
        header.m_locations[i].sectorOffset = readU24BE(bytes, offset);
        header.m_locations[i].sectorCount = static_cast<uint8_t>(readU8(bytes, offset + 3));
        header.m_timestamps[i] = readU32BE(bytes, SectorSize + offset);
    }
    return header;
}

} // namespace Anvil::Region
