#include "Anvil/Chunk/ParsedChunk.h"
#include "Anvil/Region/Region.h"
#include "Anvil/Region/RegionError.h"
#include "Anvil/World/ReaderConfig.h"
#include "Anvil/World/Storage.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string regionPath;
    std::optional<std::string> configPath;
    bool validate = false;
    std::optional<std::pair<uint32_t, uint32_t>> chunk;
};

void printUsage() {
    std::cerr << "usage: anvil-inspect <region-file> [--config <yaml>] [--validate] [--chunk <x> <z>]\n";
}

uint32_t parseSlot(const std::string& text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value >= Anvil::Region::RegionWidth) {
        throw std::invalid_argument("chunk coordinate must be within [0, 32): " + text);
    }
    return value;
}

std::optional<Options> parseArgs(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Options options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config" && i + 1 < args.size()) {
            options.configPath = args[++i];
        } else if (arg == "--validate") {
            options.validate = true;
        } else if (arg == "--chunk" && i + 2 < args.size()) {
            uint32_t x = parseSlot(args[i + 1]);
            uint32_t z = parseSlot(args[i + 2]);
            options.chunk = std::make_pair(x, z);
            i += 2;
        } else if (!arg.empty() && arg[0] != '-' && options.regionPath.empty()) {
            options.regionPath = arg;
        } else {
            return std::nullopt;
        }
    }
    if (options.regionPath.empty()) {
        return std::nullopt;
    }
    return options;
}

void printChunk(const Anvil::Region::Region& region, uint32_t x, uint32_t z, size_t maxOutput) {
    auto handle = region.getChunk(x, z);
    if (!handle) {
        std::cout << "chunk (" << x << ", " << z << ") not generated\n";
        return;
    }
    Anvil::Chunk::ParsedChunk chunk = handle->parse(maxOutput);
    std::cout << "chunk (" << x << ", " << z << ")\n"
              << "  compression: " << Anvil::Region::compressionTypeName(handle->compressionTag())
              << " (" << handle->size() << " bytes)\n"
              << "  timestamp: " << region.getTimestamp(x, z) << "\n"
              << "  DataVersion: " << chunk.dataVersion << "\n"
              << "  position: " << chunk.xPos << ", " << chunk.yPos << ", " << chunk.zPos << "\n"
              << "  status: " << chunk.status << "\n"
              << "  sections: " << chunk.sections.size() << "\n"
              << "  block entities: " << (chunk.blockEntities ? chunk.blockEntities->items.size() : 0) << "\n";
}

void printSlots(const Anvil::Region::Region& region) {
    for (uint32_t z = 0; z < Anvil::Region::RegionWidth; ++z) {
        for (uint32_t x = 0; x < Anvil::Region::RegionWidth; ++x) {
            const auto& loc = region.location(x, z);
            if (loc.isEmpty()) {
                continue;
            }
            std::cout << "  (" << x << ", " << z << ") sector " << loc.sectorOffset
                      << " x" << static_cast<int>(loc.sectorCount)
                      << " timestamp " << region.getTimestamp(x, z) << "\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto options = parseArgs(argc, argv);
        if (!options) {
            printUsage();
            return 2;
        }

        Anvil::World::FilesystemBackend storage;
        Anvil::World::ReaderConfig config;
        if (options->configPath) {
            std::vector<uint8_t> bytes = storage.readAll(*options->configPath);
            config.applyYaml(options->configPath->c_str(), std::string(bytes.begin(), bytes.end()));
        }
        spdlog::set_level(spdlog::level::from_str(config.logLevel));

        Anvil::Region::Region region = Anvil::Region::Region::fromOwned(storage.readAll(options->regionPath));
        std::cout << options->regionPath << ": " << region.chunkCount() << " chunks\n";

        if (!options->chunk) {
            printSlots(region);
        }

        if (options->validate || config.validateOnLoad) {
            region.validate();
            std::cout << "validation passed\n";
        }
        if (options->chunk) {
            printChunk(region, options->chunk->first, options->chunk->second, config.maxDecompressedBytes);
        }
    } catch (const Anvil::Region::RegionError& e) {
        spdlog::error("Region error ({}): {}", Anvil::Region::errorKindName(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("anvil-inspect: {}", e.what());
        return -1;
    }
    return 0;
}
