#pragma once

#include <rosid/result.hpp>
#include <rosid/environment.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rosid {

// File name of the manifest inside a package directory
inline constexpr const char* MANIFEST_FILENAME = "package.xml";

// <build_depend>, <exec_depend>, ... entries
struct ManifestDependency {
    std::string name;
    std::string condition;                   // empty: unconditional
    std::optional<bool> evaluated_condition; // set by evaluate_conditions()

    std::optional<std::string> version_lt;
    std::optional<std::string> version_lte;
    std::optional<std::string> version_eq;
    std::optional<std::string> version_gte;
    std::optional<std::string> version_gt;
};

// <member_of_group>
struct GroupMembership {
    std::string name;
    std::string condition;
    std::optional<bool> evaluated_condition;
};

struct Manifest;

// <group_depend>: expands to the packages that declare membership
struct GroupDependency {
    std::string name;
    std::string condition;
    std::optional<bool> evaluated_condition;
    std::set<std::string> members;  // filled by extract_group_members()

    // Replace `members` with the names of all given packages that are
    // members of this group under their evaluated conditions.
    Status extract_group_members(const std::vector<const Manifest*>& packages);
};

// Children of <export>
struct ManifestExport {
    std::string tagname;
    std::string content;
    std::string condition;
    std::optional<bool> evaluated_condition;
};

struct Manifest {
    int package_format = 1;
    std::string name;
    std::string version;
    std::string description;
    std::vector<std::string> maintainers;
    std::vector<std::string> licenses;

    std::vector<ManifestDependency> build_depends;
    std::vector<ManifestDependency> buildtool_depends;
    std::vector<ManifestDependency> build_export_depends;
    std::vector<ManifestDependency> buildtool_export_depends;
    std::vector<ManifestDependency> exec_depends;
    std::vector<ManifestDependency> test_depends;
    std::vector<ManifestDependency> doc_depends;
    std::vector<GroupDependency> group_depends;
    std::vector<GroupMembership> member_of_groups;
    std::vector<ManifestExport> exports;

    // Parse package.xml content. `filename` is only used in error locations.
    // Errors: Parse for malformed XML or structure, Manifest for content
    // that violates the manifest rules.
    static Result<Manifest> parse(const std::string& xml,
                                  const std::string& filename = "");

    // Load from a package directory or directly from a package.xml path
    static Result<Manifest> load(const std::string& path);

    Status validate() const;

    // Evaluate every condition (dependencies, groups, exports) against env
    Status evaluate_conditions(const Environment& env);

    // The single <build_type> export whose condition holds; "catkin" when
    // none is declared. Manifest error when more than one applies.
    Result<std::string> build_type() const;
};

// True if `path` is a directory containing a package.xml
bool package_exists_at(const std::string& path);

} // namespace rosid
