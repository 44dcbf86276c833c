#include <rosid/descriptor.hpp>

namespace rosid {

const char* category_name(DependencyCategory category) {
    switch (category) {
        case DependencyCategory::Build: return "build";
        case DependencyCategory::Run:   return "run";
        case DependencyCategory::Test:  return "test";
    }
    return "unknown";
}

DependencySet& DependencySets::operator[](DependencyCategory category) {
    switch (category) {
        case DependencyCategory::Build: return build;
        case DependencyCategory::Run:   return run;
        case DependencyCategory::Test:  return test;
    }
    return build;
}

const DependencySet& DependencySets::operator[](DependencyCategory category) const {
    switch (category) {
        case DependencyCategory::Build: return build;
        case DependencyCategory::Run:   return run;
        case DependencyCategory::Test:  return test;
    }
    return build;
}

std::string type_family(const std::string& type) {
    return type.substr(0, type.find('.'));
}

PackageDescriptor::PackageDescriptor(std::filesystem::path path)
    : path_(std::move(path)) {}

bool PackageDescriptor::set_type(const std::string& type) {
    if (type_.has_value() && type_family(*type_) != type_family(type)) {
        return false;
    }
    type_ = type;
    return true;
}

const std::string* PackageDescriptor::metadata_string(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end()) return nullptr;
    return std::get_if<std::string>(&it->second);
}

const PythonSetupAccessor* PackageDescriptor::python_setup_accessor() const {
    auto it = metadata.find("get_python_setup_options");
    if (it == metadata.end()) return nullptr;
    return std::get_if<PythonSetupAccessor>(&it->second);
}

} // namespace rosid
