#include "Anvil/Region/Region.h"

#include "Anvil/Chunk/ParsedChunk.h"
#include "Anvil/Region/BigEndian.h"
#include "Anvil/Region/RegionError.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace Anvil::Region {

namespace {

constexpr uint32_t kBlocksPerRegion = RegionWidth * 16;
constexpr size_t kLengthPrefix = 4;

std::string slotName(uint32_t x, uint32_t z) {
    return "(" + std::to_string(x) + ", " + std::to_string(z) + ")";
}

} // namespace

Region::Region(RegionHeader header, std::span<const uint8_t> payload, std::vector<uint8_t> owned)
    : m_header(header), m_owned(std::move(owned)), m_payload(payload) {
}

Region Region::fromBytes(std::span<const uint8_t> bytes) {
    RegionHeader header = RegionHeader::parse(bytes);
    return Region(header, bytes.subspan(HeaderSize), {});
}

Region Region::fromOwned(std::vector<uint8_t> bytes) {
    RegionHeader header = RegionHeader::parse(bytes);
    // Moving the vector keeps its heap storage, so the payload view stays valid.
    Region region(header, {}, std::move(bytes));
    region.m_payload = std::span<const uint8_t>(region.m_owned).subspan(HeaderSize);
    return region;
}

std::optional<ChunkHandle> Region::getChunk(uint32_t x, uint32_t z) const {
    const LocationEntry& loc = m_header.location(x, z);
    if (loc.isEmpty()) {
        return std::nullopt;
    }
    if (loc.sectorOffset < HeaderSectors) {
        throw RegionError(ErrorKind::UnexpectedEof,
            "chunk " + slotName(x, z) + " points into the header (sector " +
            std::to_string(loc.sectorOffset) + ")");
    }

    size_t start = static_cast<size_t>(loc.sectorOffset - HeaderSectors) * SectorSize;
    if (start > m_payload.size() || m_payload.size() - start < kLengthPrefix) {
        throw RegionError(ErrorKind::UnexpectedEof,
            "chunk " + slotName(x, z) + " length prefix at payload offset " +
            std::to_string(start) + " is past the end of " + std::to_string(m_payload.size()) + " bytes");
    }

    // The declared length counts the compression tag byte plus the compressed data.
    size_t length = readU32BE(m_payload, start);
    if (length == 0) {
        throw RegionError(ErrorKind::UnexpectedEof,
            "chunk " + slotName(x, z) + " declares zero length");
    }
    if (m_payload.size() - start - kLengthPrefix < length) {
        throw RegionError(ErrorKind::UnexpectedEof,
            "chunk " + slotName(x, z) + " declares " + std::to_string(length) +
            " bytes but only " + std::to_string(m_payload.size() - start - kLengthPrefix) + " remain");
    }

    uint8_t tag = m_payload[start + kLengthPrefix];
    return ChunkHandle(tag, m_payload.subspan(start + kLengthPrefix + 1, length - 1));
}

std::optional<ChunkHandle> Region::getChunkFromBlock(uint32_t blockX, uint32_t blockZ) const {
    if (blockX >= kBlocksPerRegion || blockZ >= kBlocksPerRegion) {
        throw std::out_of_range("getChunkFromBlock: block " + slotName(blockX, blockZ) +
            " outside [0, 512)");
    }
    return getChunk(blockX / 16, blockZ / 16);
}

void Region::validate() const {
    size_t checked = 0;
    for (uint32_t z = 0; z < RegionWidth; ++z) {
        for (uint32_t x = 0; x < RegionWidth; ++x) {
            try {
                auto chunk = getChunk(x, z);
                if (chunk) {
                    chunk->parse();
                    ++checked;
                }
            } catch (const RegionError& e) {
                spdlog::warn("Region validation failed at chunk {}: {}", slotName(x, z), e.what());
                throw;
            }
        }
    }
    spdlog::debug("Region validation passed ({} chunks)", checked);
}

size_t Region::chunkCount() const {
    size_t count = 0;
    for (const auto& loc : m_header.locations()) {
        if (!loc.isEmpty()) {
            ++count;
        }
    }
    return count;
}

} // namespace Anvil::Region
