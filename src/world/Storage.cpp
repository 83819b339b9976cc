#include "Anvil/World/Storage.h"

#include "Anvil/Region/RegionError.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace Anvil::World {

using Region::ErrorKind;
using Region::RegionError;

std::vector<uint8_t> FilesystemBackend::readAll(const std::string& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw RegionError(ErrorKind::Io, "failed to open file for reading: " + path);
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw RegionError(ErrorKind::Io, "failed to stat " + path + ": " + ec.message());
    }

    std::vector<uint8_t> out(static_cast<size_t>(size));
    if (!out.empty()) {
        stream.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (!stream) {
            throw RegionError(ErrorKind::Io, "failed to read bytes from: " + path);
        }
    }
    return out;
}

bool FilesystemBackend::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FilesystemBackend::isDirectory(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

std::vector<std::string> FilesystemBackend::list(const std::string& path) {
    std::vector<std::string> result;
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return result;
    }
    for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
        if (entry.is_regular_file(ec)) {
            result.push_back(entry.path().string());
        }
    }
    if (ec) {
        throw RegionError(ErrorKind::Io, "failed to list " + path + ": " + ec.message());
    }
    return result;
}

} // namespace Anvil::World
