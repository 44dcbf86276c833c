#pragma once

#include <rosid/dependency.hpp>
#include <rosid/python_setup.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rosid {

using MetadataValue = std::variant<std::string,
                                   std::vector<std::string>,
                                   PythonSetupAccessor>;

enum class DependencyCategory { Build, Run, Test };

const char* category_name(DependencyCategory category);

struct DependencySets {
    DependencySet build;
    DependencySet run;
    DependencySet test;

    DependencySet& operator[](DependencyCategory category);
    const DependencySet& operator[](DependencyCategory category) const;
};

// A candidate package location. Created by the scanner, filled in by the
// identification and augmentation passes; the caller keeps ownership.
class PackageDescriptor {
public:
    explicit PackageDescriptor(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

    const std::optional<std::string>& type() const { return type_; }

    // Accepted when no type is set yet or the current type belongs to the
    // same family ("ros" -> "ros.ament_cmake"). Returns false otherwise.
    bool set_type(const std::string& type);

    std::optional<std::string> name;
    DependencySets dependencies;
    std::map<std::string, MetadataValue> metadata;

    // Convenience accessors; nullptr when absent or of another type
    const std::string* metadata_string(const std::string& key) const;
    const PythonSetupAccessor* python_setup_accessor() const;

private:
    std::filesystem::path path_;
    std::optional<std::string> type_;
};

// "ros.ament_cmake" -> "ros"
std::string type_family(const std::string& type);

} // namespace rosid
