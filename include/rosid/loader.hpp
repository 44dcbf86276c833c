#pragma once

#include <rosid/manifest.hpp>
#include <rosid/environment.hpp>
#include <memory>
#include <optional>
#include <string>

namespace rosid {

// Parse the manifest in `path` and evaluate its conditions against the
// current process environment. Returns nullptr when there is no manifest or
// it is invalid; the scan is never aborted by a bad manifest.
std::shared_ptr<Manifest> load_package(const std::string& path);

// Same, evaluating conditions against an explicit environment
std::shared_ptr<Manifest> load_package(const std::string& path,
                                       const Environment& env);

// The declared build type, or nullopt (with a warning) when the package
// declares more than one.
std::optional<std::string> classify_build_type(const Manifest& pkg,
                                               const std::string& path);

} // namespace rosid
