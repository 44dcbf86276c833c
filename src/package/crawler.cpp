#include <rosid/crawler.hpp>
#include <rosid/log.hpp>
#include <algorithm>
#include <set>

namespace rosid {

namespace fs = std::filesystem;

namespace {

struct Crawler {
    fs::path root;
    std::vector<PackageIdentification*> identifications;
    const Config& config;

    std::set<fs::path> visited;
    std::vector<PackageDescriptor> found;

    // Config keys are paths relative to the root, "." for the root itself
    void apply_overrides(PackageDescriptor& desc) const {
        std::error_code ec;
        std::string rel = fs::relative(desc.path(), root, ec).generic_string();
        if (ec || rel.empty()) rel = ".";

        auto it = config.packages.find(rel);
        if (it == config.packages.end()) return;
        if (it->second.name.has_value()) {
            desc.name = it->second.name;
        }
    }

    // True if the directory was claimed or must not be descended into
    bool identify(PackageDescriptor& desc) {
        for (auto* ext : identifications) {
            auto r = ext->identify(desc);
            if (r.is_err()) {
                rosid::log::error("%s identification failed for '%s'\n%s",
                                  ext->name(), desc.path().c_str(),
                                  r.error().format().c_str());
                return true;
            }
            if (r.value() == Identification::IgnoreLocation) {
                rosid::log::debug("ignoring location %s", desc.path().c_str());
                return true;
            }
            if (desc.type().has_value()) {
                found.push_back(std::move(desc));
                return true;
            }
        }
        return false;
    }

    void crawl(const fs::path& dir) {
        std::error_code ec;
        fs::path canonical = fs::canonical(dir, ec);
        if (ec) canonical = dir;
        if (!visited.insert(canonical).second) return;

        PackageDescriptor desc(dir);
        apply_overrides(desc);
        if (identify(desc)) return;

        std::vector<fs::path> subdirs;
        for (auto it = fs::directory_iterator(dir, ec);
             !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (!name.empty() && name[0] == '.') continue;
            std::error_code dir_ec;
            if (!it->is_directory(dir_ec) || dir_ec) continue;
            subdirs.push_back(it->path());
        }
        if (ec) {
            rosid::log::warn("cannot list '%s': %s", dir.c_str(),
                             ec.message().c_str());
        }

        std::sort(subdirs.begin(), subdirs.end());
        for (const auto& sub : subdirs) {
            crawl(sub);
        }
    }
};

} // anonymous namespace

Result<std::vector<PackageDescriptor>> discover_packages(
    const fs::path& root,
    const std::vector<PackageIdentification*>& identifications,
    const std::vector<PackageAugmentation*>& augmentations,
    const Config& config)
{
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return RosidError{RosidError::NotFound,
            "not a directory: " + root.string()};
    }

    std::vector<PackageIdentification*> ordered = identifications;
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const PackageIdentification* a, const PackageIdentification* b) {
            return a->priority() > b->priority();
        });

    Crawler crawler{fs::path(ManifestCache::normalize(root)), std::move(ordered),
                    config, {}, {}};
    crawler.crawl(crawler.root);

    for (auto* aug : augmentations) {
        ROSID_TRY(aug->augment_packages(crawler.found));
    }

    std::sort(crawler.found.begin(), crawler.found.end(),
        [](const PackageDescriptor& a, const PackageDescriptor& b) {
            return a.path() < b.path();
        });

    rosid::log::info("found %zu package(s) in %s",
                     crawler.found.size(), root.c_str());
    return Result<std::vector<PackageDescriptor>>::ok(std::move(crawler.found));
}

} // namespace rosid
