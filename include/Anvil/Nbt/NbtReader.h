#pragma once

#include "Anvil/Nbt/Tag.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace Anvil::Nbt {

/// Nesting limit for lists and compounds.
inline constexpr size_t MaxDepth = 512;

/**
 * @brief Decode one named root compound from uncompressed bytes.
 *
 * Trailing bytes after the root tag are ignored.
 *
 * @throws Region::RegionError (TagDecodeError) on truncated input, unknown
 *         tag ids, negative lengths, excessive nesting or a non-compound root
 */
NamedTag readRoot(std::span<const uint8_t> bytes);

} // namespace Anvil::Nbt
