#pragma once

#include "Anvil/Region/Compression.h"

#include <cstddef>
#include <string>

namespace Anvil::World {

struct ReaderConfig {
    std::string regionExtension = "mca";
    bool validateOnLoad = false;
    size_t maxDecompressedBytes = Region::DefaultMaxDecompressedBytes;
    std::string logLevel = "info";

    /**
     * @brief Overlay values from a YAML document.
     *
     * Keys are read from a top-level "reader" node when present, otherwise
     * from the document root. Missing keys keep their current values.
     */
    void applyYaml(const char* sourceName, const std::string& yaml);
};

/// True for the level names spdlog understands (trace, debug, info, warn, error, critical, off).
bool isValidLogLevel(const std::string& name);

} // namespace Anvil::World
