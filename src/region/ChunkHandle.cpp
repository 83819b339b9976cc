#include "Anvil/Region/ChunkHandle.h"

#include "Anvil/Chunk/ParsedChunk.h"
#include "Anvil/Nbt/NbtReader.h"

namespace Anvil::Region {

std::vector<uint8_t> ChunkHandle::decompress(size_t maxOutput) const {
    return ::Anvil::Region::decompress(m_tag, m_data, maxOutput);
}

Chunk::ParsedChunk ChunkHandle::parse(size_t maxOutput) const {
    std::vector<uint8_t> raw = decompress(maxOutput);
    Nbt::NamedTag root = Nbt::readRoot(raw);
    return Chunk::ParsedChunk::fromNbt(root.compound());
}

OwnedChunk ChunkHandle::toOwned() const {
    return OwnedChunk(m_tag, std::vector<uint8_t>(m_data.begin(), m_data.end()));
}

} // namespace Anvil::Region
