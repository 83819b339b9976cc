#include "Anvil/World/ReaderConfig.h"

#include "Anvil/Util/Yaml.h"

#include <ryml.hpp>
#include <ryml_std.hpp>
#include <spdlog/spdlog.h>

#include <array>

namespace Anvil::World {

bool isValidLogLevel(const std::string& name) {
    static constexpr std::array<const char*, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    for (const char* level : kLevels) {
        if (name == level) {
            return true;
        }
    }
    return false;
}

void ReaderConfig::applyYaml(const char* sourceName, const std::string& yaml) {
    if (yaml.empty()) {
        return;
    }

    ryml::Tree tree = ryml::parse_in_arena(
        ryml::to_csubstr(sourceName),
        ryml::to_csubstr(yaml)
    );
    ryml::ConstNodeRef root = tree.rootref();
    if (!root.is_map()) {
        return;
    }
    ryml::ConstNodeRef readerNode = root;
    if (root.has_child("reader")) {
        readerNode = root["reader"];
    }
    if (!readerNode.readable() || !readerNode.is_map()) {
        return;
    }

    regionExtension = Util::readString(readerNode, "regionExtension", regionExtension);
    validateOnLoad = Util::readBool(readerNode, "validateOnLoad", validateOnLoad);
    maxDecompressedBytes = static_cast<size_t>(
        Util::readUInt64(readerNode, "maxDecompressedBytes", maxDecompressedBytes));

    std::string level = Util::readString(readerNode, "logLevel", logLevel);
    if (isValidLogLevel(level)) {
        logLevel = level;
    } else {
        spdlog::warn("Ignoring unknown log level '{}' in {}", level, sourceName);
    }

    spdlog::debug("Applied reader config from {}", sourceName);
}

} // namespace Anvil::World
