#include "Anvil/World/RegionFile.h"

#include "Anvil/World/Storage.h"

#include <charconv>
#include <string_view>

namespace Anvil::World {

namespace {

bool parseInt(std::string_view text, int32_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

} // namespace

std::optional<RegionPos> parseRegionFilename(const std::string& name, const std::string& extension) {
    std::string_view view(name);
    if (!view.starts_with("r.")) {
        return std::nullopt;
    }
    view.remove_prefix(2);

    std::string suffix = "." + extension;
    if (!view.ends_with(suffix)) {
        return std::nullopt;
    }
    view.remove_suffix(suffix.size());

    auto dot = view.find('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }
    RegionPos pos;
    if (!parseInt(view.substr(0, dot), pos.x) || !parseInt(view.substr(dot + 1), pos.z)) {
        return std::nullopt;
    }
    return pos;
}

std::string regionFilename(RegionPos pos, const std::string& extension) {
    return "r." + std::to_string(pos.x) + "." + std::to_string(pos.z) + "." + extension;
}

std::string baseName(const std::string& path) {
    std::string trimmed = path;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto pos = trimmed.find_last_of('/');
    if (pos == std::string::npos) {
        return trimmed;
    }
    return trimmed.substr(pos + 1);
}

Region::Region RegionFile::load(StorageBackend& storage) const {
    return Region::Region::fromOwned(storage.readAll(m_path));
}

} // namespace Anvil::World
