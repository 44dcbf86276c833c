#include <rosid/manifest_cache.hpp>
#include <rosid/loader.hpp>
#include <rosid/log.hpp>

namespace rosid {

namespace fs = std::filesystem;

ManifestCache::ManifestCache()
    : loader_([](const std::string& path) { return load_package(path); }) {}

ManifestCache::ManifestCache(Loader loader)
    : loader_(std::move(loader)) {}

std::string ManifestCache::normalize(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = path;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_relative_path()) {
        abs = abs.parent_path();
    }
    return abs.string();
}

const CacheEntry& ManifestCache::lookup_or_load(const fs::path& path) {
    std::string key = normalize(path);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }

    rosid::log::trace("loading manifest for %s", key.c_str());

    CacheEntry entry;
    entry.package = loader_(key);
    if (entry.package) {
        entry.build_type = classify_build_type(*entry.package, key);
    }
    return entries_.emplace(std::move(key), std::move(entry)).first->second;
}

const CacheEntry* ManifestCache::find(const fs::path& path) const {
    auto it = entries_.find(normalize(path));
    return it != entries_.end() ? &it->second : nullptr;
}

} // namespace rosid
