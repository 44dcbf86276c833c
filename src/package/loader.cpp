#include <rosid/loader.hpp>
#include <rosid/log.hpp>

namespace rosid {

std::shared_ptr<Manifest> load_package(const std::string& path) {
    return load_package(path, current_environment());
}

std::shared_ptr<Manifest> load_package(const std::string& path,
                                       const Environment& env) {
    if (!package_exists_at(path)) {
        return nullptr;
    }

    auto parsed = Manifest::load(path);
    if (parsed.is_err()) {
        rosid::log::debug("ignoring manifest in '%s': %s",
                          path.c_str(), parsed.error().format().c_str());
        return nullptr;
    }

    auto pkg = std::make_shared<Manifest>(std::move(parsed).value());
    auto evaluated = pkg->evaluate_conditions(env);
    if (evaluated.is_err()) {
        rosid::log::debug("ignoring manifest in '%s': %s",
                          path.c_str(), evaluated.error().format().c_str());
        return nullptr;
    }
    return pkg;
}

std::optional<std::string> classify_build_type(const Manifest& pkg,
                                               const std::string& path) {
    auto build_type = pkg.build_type();
    if (build_type.is_ok()) {
        return std::move(build_type).value();
    }

    if (build_type.error().code == RosidError::Manifest) {
        rosid::log::warn("ROS package '%s' in '%s' has more than one build type",
                         pkg.name.c_str(), path.c_str());
    } else {
        rosid::log::error("%s", build_type.error().format().c_str());
    }
    return std::nullopt;
}

} // namespace rosid
