#pragma once

#include <rosid/manifest.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace rosid {

struct CacheEntry {
    std::shared_ptr<Manifest> package;       // null: no usable manifest
    std::optional<std::string> build_type;   // nullopt: unclassifiable
};

// Memoizes path -> (manifest, build type) for one scan session. Each path is
// loaded at most once, including paths without a manifest.
//
// Not synchronized: concurrent callers must serialize lookup_or_load().
class ManifestCache {
public:
    using Loader = std::function<std::shared_ptr<Manifest>(const std::string& path)>;

    // Uses load_package() against the current process environment
    ManifestCache();
    explicit ManifestCache(Loader loader);

    const CacheEntry& lookup_or_load(const std::filesystem::path& path);

    // nullptr if the path was never looked up
    const CacheEntry* find(const std::filesystem::path& path) const;

    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

    // Absolute, lexically normal, without trailing separator
    static std::string normalize(const std::filesystem::path& path);

private:
    Loader loader_;
    std::unordered_map<std::string, CacheEntry> entries_;
};

} // namespace rosid
