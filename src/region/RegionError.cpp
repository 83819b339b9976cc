#include "Anvil/Region/RegionError.h"

namespace Anvil::Region {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingHeader:
        return "MissingHeader";
    case ErrorKind::UnexpectedEof:
        return "UnexpectedEof";
    case ErrorKind::DecompressError:
        return "DecompressError";
    case ErrorKind::UnsupportedCompression:
        return "UnsupportedCompression";
    case ErrorKind::TagDecodeError:
        return "TagDecodeError";
    case ErrorKind::CorruptData:
        return "CorruptData";
    case ErrorKind::Io:
        return "Io";
    }
    return "Unknown";
}

RegionError::RegionError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + message),
      m_kind(kind) {
}

RegionError RegionError::unsupportedCompression(uint8_t tag) {
    RegionError error(ErrorKind::UnsupportedCompression,
        "compression type " + std::to_string(static_cast<int>(tag)) + " is not supported");
    error.m_tag = tag;
    return error;
}

} // namespace Anvil::Region
