#pragma once

#include <rosid/result.hpp>
#include <rosid/config.hpp>
#include <rosid/descriptor.hpp>
#include <rosid/identification.hpp>
#include <filesystem>
#include <vector>

namespace rosid {

// Walk `root` depth-first and offer every directory to the identifications
// (highest priority first). A directory that gets a type is a package and
// its subtree is not scanned; IgnoreLocation prunes the subtree; hidden
// directories are skipped. After the walk every augmentation runs once over
// the whole batch. Descriptors are returned sorted by path.
Result<std::vector<PackageDescriptor>> discover_packages(
    const std::filesystem::path& root,
    const std::vector<PackageIdentification*>& identifications,
    const std::vector<PackageAugmentation*>& augmentations,
    const Config& config = Config{});

} // namespace rosid
