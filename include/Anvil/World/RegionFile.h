#pragma once

#include "Anvil/Region/Region.h"
#include "Anvil/World/Coord.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace Anvil::World {

class StorageBackend;

/**
 * @brief Parse a region file name of the form r.<x>.<z>.<extension>.
 *
 * @return nullopt for any other name
 */
std::optional<RegionPos> parseRegionFilename(const std::string& name, const std::string& extension = "mca");

/// File name for a region position, e.g. "r.-1.0.mca".
std::string regionFilename(RegionPos pos, const std::string& extension = "mca");

/// Last path component, ignoring trailing separators.
std::string baseName(const std::string& path);

/**
 * @brief Region file on disk, identified by path.
 *
 * Loading reads the whole file into an owned buffer.
 */
class RegionFile {
public:
    RegionFile(std::string path, RegionPos position)
        : m_path(std::move(path)), m_position(position) {
    }

    const std::string& path() const { return m_path; }
    RegionPos position() const { return m_position; }

    /// @throws Region::RegionError (Io or MissingHeader)
    Region::Region load(StorageBackend& storage) const;

private:
    std::string m_path;
    RegionPos m_position;
};

} // namespace Anvil::World
