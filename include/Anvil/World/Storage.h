#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Anvil::World {

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /// Whole file contents. Throws Region::RegionError (Io) if the file cannot be read.
    virtual std::vector<uint8_t> readAll(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;
    virtual bool isDirectory(const std::string& path) = 0;
    /// Full paths of the regular files directly inside a directory.
    virtual std::vector<std::string> list(const std::string& path) = 0;
};

class FilesystemBackend : public StorageBackend {
public:
    std::vector<uint8_t> readAll(const std::string& path) override;
    bool exists(const std::string& path) override;
    bool isDirectory(const std::string& path) override;
    std::vector<std::string> list(const std::string& path) override;
};

} // namespace Anvil::World
