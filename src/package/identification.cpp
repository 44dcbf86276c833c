#include <rosid/identification.hpp>
#include <rosid/log.hpp>
#include <algorithm>
#include <filesystem>

namespace rosid {

namespace fs = std::filesystem;

const char* identification_name(Identification id) {
    switch (id) {
        case Identification::NotIdentified:  return "not-identified";
        case Identification::Identified:     return "identified";
        case Identification::IgnoreLocation: return "ignore-location";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

bool file_exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

// Adds every dependency whose condition holds. Collected into `out` first so
// a broken invariant leaves the descriptor untouched.
Status collect_dependencies(const std::vector<const std::vector<ManifestDependency>*>& lists,
                            const std::string& pkg_name,
                            DependencySet& out) {
    for (const auto* deps : lists) {
        for (const auto& d : *deps) {
            if (!d.evaluated_condition.has_value()) {
                return RosidError{RosidError::Invariant,
                    "dependency '" + d.name + "' of package '" + pkg_name +
                    "' has no evaluated condition",
                    "manifest conditions must be evaluated before identification"};
            }
            if (*d.evaluated_condition) {
                out.add(DependencyDescriptor::from_manifest(d));
            }
        }
    }
    return ok_status();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RosPackageIdentification
// ---------------------------------------------------------------------------

RosPackageIdentification::RosPackageIdentification(ManifestCache& cache,
                                                   IdentificationConfig config)
    : cache_(cache), config_(std::move(config)) {}

Result<Identification> RosPackageIdentification::identify(PackageDescriptor& desc) {
    // Leave packages alone that another extension already typed
    if (desc.type().has_value() && *desc.type() != ROS_FAMILY) {
        return Result<Identification>::ok(Identification::NotIdentified);
    }

    for (const auto& marker : config_.ignore_markers) {
        if (file_exists(desc.path() / marker)) {
            rosid::log::debug("'%s' contains %s, skipping",
                              desc.path().c_str(), marker.c_str());
            return Result<Identification>::ok(Identification::IgnoreLocation);
        }
    }

    const CacheEntry& entry = cache_.lookup_or_load(desc.path());
    if (!entry.package || !entry.build_type.has_value()) {
        // A dry (rosbuild) package must not be picked up as plain CMake
        if (file_exists(desc.path() / config_.legacy_manifest)) {
            return Result<Identification>::ok(Identification::IgnoreLocation);
        }
        return Result<Identification>::ok(Identification::NotIdentified);
    }

    const Manifest& pkg = *entry.package;
    const std::string& build_type = *entry.build_type;

    if (build_type == "ament_python") {
        std::error_code ec;
        if (!fs::is_regular_file(desc.path() / "setup.py", ec)) {
            rosid::log::error(
                "ROS package '%s' with build type '%s' has no 'setup.py' file",
                desc.path().c_str(), build_type.c_str());
            return Result<Identification>::ok(Identification::IgnoreLocation);
        }
    }

    DependencySets deps;
    ROSID_TRY(collect_dependencies(
        {&pkg.build_depends, &pkg.buildtool_depends}, pkg.name, deps.build));
    ROSID_TRY(collect_dependencies(
        {&pkg.build_export_depends, &pkg.buildtool_export_depends,
         &pkg.exec_depends}, pkg.name, deps.run));
    ROSID_TRY(collect_dependencies(
        {&pkg.test_depends}, pkg.name, deps.test));

    std::string type = std::string(ROS_FAMILY) + "." + build_type;
    if (!desc.set_type(type)) {
        return RosidError{RosidError::Invariant,
            "cannot set type '" + type + "' on " + desc.path().string(),
            "descriptor already has type '" + desc.type().value_or("") + "'"};
    }

    // A name given by external configuration takes precedence
    if (!desc.name.has_value()) {
        desc.name = pkg.name;
    }

    desc.metadata["version"] = pkg.version;

    for (auto category : {DependencyCategory::Build, DependencyCategory::Run,
                          DependencyCategory::Test}) {
        for (const auto& d : deps[category]) {
            desc.dependencies[category].add(d);
        }
    }

    if (build_type == "ament_python") {
        desc.metadata["get_python_setup_options"] = PythonSetupAccessor(
            desc.path() / "setup.py", config_.python_executable);
    }

    rosid::log::debug("identified '%s' (%s) in %s",
                      desc.name->c_str(), type.c_str(), desc.path().c_str());
    return Result<Identification>::ok(Identification::Identified);
}

Status RosPackageIdentification::augment_packages(std::vector<PackageDescriptor>& descs) {
    // Manifests of this batch, in batch order; a repeated path keeps the
    // last descriptor
    std::vector<std::pair<Manifest*, PackageDescriptor*>> pkgs;
    for (auto& desc : descs) {
        const CacheEntry* entry = cache_.find(desc.path());
        if (!entry || !entry->package) continue;

        Manifest* pkg = entry->package.get();
        auto same = std::find_if(pkgs.begin(), pkgs.end(),
            [&](const auto& p) { return p.first == pkg; });
        if (same != pkgs.end()) {
            same->second = &desc;
        } else {
            pkgs.emplace_back(pkg, &desc);
        }
    }

    std::vector<const Manifest*> batch;
    batch.reserve(pkgs.size());
    for (const auto& [pkg, desc] : pkgs) batch.push_back(pkg);

    for (auto& [pkg, desc] : pkgs) {
        for (auto& group : pkg->group_depends) {
            if (!group.evaluated_condition.has_value()) {
                return RosidError{RosidError::Invariant,
                    "group_depend '" + group.name + "' of package '" +
                    pkg->name + "' has no evaluated condition"};
            }
            if (!*group.evaluated_condition) continue;

            ROSID_TRY(group.extract_group_members(batch));
            for (const auto& member : group.members) {
                desc->dependencies.build.add(DependencyDescriptor(member));
                desc->dependencies.run.add(DependencyDescriptor(member));
            }
            rosid::log::trace("group '%s' of '%s' resolved to %zu member(s)",
                              group.name.c_str(), pkg->name.c_str(),
                              group.members.size());
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// IgnoreMarkerIdentification
// ---------------------------------------------------------------------------

Result<Identification> IgnoreMarkerIdentification::identify(PackageDescriptor& desc) {
    if (file_exists(desc.path() / marker_)) {
        return Result<Identification>::ok(Identification::IgnoreLocation);
    }
    return Result<Identification>::ok(Identification::NotIdentified);
}

} // namespace rosid
