#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace Anvil::Region {

enum class ErrorKind : uint8_t {
    MissingHeader,
    UnexpectedEof,
    DecompressError,
    UnsupportedCompression,
    TagDecodeError,
    CorruptData,
    Io
};

const char* errorKindName(ErrorKind kind);

/**
 * @brief Typed failure for untrusted region content.
 *
 * Thrown for every data-validity problem: short headers, offsets past the
 * end of the buffer, corrupt compressed streams, unknown compression tags,
 * schema mismatches and inconsistent palette data. Programmer errors
 * (out-of-range coordinates) are reported with std::out_of_range instead.
 */
class RegionError : public std::runtime_error {
public:
    RegionError(ErrorKind kind, const std::string& message);

    static RegionError unsupportedCompression(uint8_t tag);

    ErrorKind kind() const { return m_kind; }

    /// Compression tag byte, set only for UnsupportedCompression.
    std::optional<uint8_t> compressionTag() const { return m_tag; }

private:
    ErrorKind m_kind;
    std::optional<uint8_t> m_tag;
};

} // namespace Anvil::Region
