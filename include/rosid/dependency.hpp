#pragma once

#include <rosid/manifest.hpp>
#include <map>
#include <string>
#include <vector>

namespace rosid {

// Version bound keys a dependency may carry in its metadata
inline constexpr const char* VERSION_BOUND_KEYS[] = {
    "version_lte", "version_lt", "version_gte", "version_gt", "version_eq",
};

// A named dependency of a package. Identity is the name alone; metadata
// (version bounds) rides along but is never compared.
class DependencyDescriptor {
public:
    using Metadata = std::map<std::string, std::string>;

    explicit DependencyDescriptor(std::string name, Metadata metadata = {})
        : name_(std::move(name)), metadata_(std::move(metadata)) {}

    // Carries over the version bounds that are set on a manifest entry
    static DependencyDescriptor from_manifest(const ManifestDependency& dep);

    const std::string& name() const { return name_; }
    const Metadata& metadata() const { return metadata_; }

    bool operator==(const DependencyDescriptor& o) const { return name_ == o.name_; }
    bool operator!=(const DependencyDescriptor& o) const { return name_ != o.name_; }

private:
    std::string name_;
    Metadata metadata_;
};

// Set of dependencies keyed by name, iterated in name order.
// The first descriptor added under a name wins.
class DependencySet {
public:
    using Storage = std::map<std::string, DependencyDescriptor>;

    class const_iterator {
    public:
        explicit const_iterator(Storage::const_iterator it) : it_(it) {}
        const DependencyDescriptor& operator*() const { return it_->second; }
        const DependencyDescriptor* operator->() const { return &it_->second; }
        const_iterator& operator++() { ++it_; return *this; }
        bool operator==(const const_iterator& o) const { return it_ == o.it_; }
        bool operator!=(const const_iterator& o) const { return it_ != o.it_; }

    private:
        Storage::const_iterator it_;
    };

    // Returns false if a dependency of that name is already present
    bool add(DependencyDescriptor dep);

    bool contains(const std::string& name) const;
    const DependencyDescriptor* find(const std::string& name) const;
    std::vector<std::string> names() const;

    size_t size() const { return deps_.size(); }
    bool empty() const { return deps_.empty(); }

    const_iterator begin() const { return const_iterator(deps_.begin()); }
    const_iterator end() const { return const_iterator(deps_.end()); }

private:
    Storage deps_;
};

} // namespace rosid
