#include <rosid/dependency.hpp>

namespace rosid {

DependencyDescriptor DependencyDescriptor::from_manifest(const ManifestDependency& dep) {
    Metadata metadata;
    if (dep.version_lte) metadata["version_lte"] = *dep.version_lte;
    if (dep.version_lt) metadata["version_lt"] = *dep.version_lt;
    if (dep.version_gte) metadata["version_gte"] = *dep.version_gte;
    if (dep.version_gt) metadata["version_gt"] = *dep.version_gt;
    if (dep.version_eq) metadata["version_eq"] = *dep.version_eq;
    return DependencyDescriptor(dep.name, std::move(metadata));
}

bool DependencySet::add(DependencyDescriptor dep) {
    std::string key = dep.name();
    return deps_.emplace(std::move(key), std::move(dep)).second;
}

bool DependencySet::contains(const std::string& name) const {
    return deps_.count(name) > 0;
}

const DependencyDescriptor* DependencySet::find(const std::string& name) const {
    auto it = deps_.find(name);
    return it != deps_.end() ? &it->second : nullptr;
}

std::vector<std::string> DependencySet::names() const {
    std::vector<std::string> out;
    out.reserve(deps_.size());
    for (const auto& [name, dep] : deps_) out.push_back(name);
    return out;
}

} // namespace rosid
