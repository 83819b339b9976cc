#pragma once

#include <ryml.hpp>
#include <ryml_std.hpp>

#include <cstdint>
#include <string>

namespace Anvil::Util {

inline bool readBool(ryml::ConstNodeRef node, const char* key, bool fallback) {
    if (!node.readable() || !node.has_child(ryml::to_csubstr(key))) {
        return fallback;
    }
    std::string value;
    node[ryml::to_csubstr(key)] >> value;
    if (value == "true" || value == "yes" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        return false;
    }
    return fallback;
}

inline uint64_t readUInt64(ryml::ConstNodeRef node, const char* key, uint64_t fallback) {
    if (!node.readable() || !node.has_child(ryml::to_csubstr(key))) {
        return fallback;
    }
    uint64_t value = fallback;
    node[ryml::to_csubstr(key)] >> value;
    return value;
}

inline std::string readString(ryml::ConstNodeRef node,
                              const char* key,
                              const std::string& fallback) {
    if (!node.readable() || !node.has_child(ryml::to_csubstr(key))) {
        return fallback;
    }
    std::string value;
    node[ryml::to_csubstr(key)] >> value;
    return value;
}

} // namespace Anvil::Util
