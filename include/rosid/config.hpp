#pragma once

#include <rosid/result.hpp>
#include <rosid/log.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rosid {

// Workspace-level config file name, looked up in the scanned root
inline constexpr const char* WORKSPACE_CONFIG_FILENAME = "rosid.toml";

// [log] section
struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// [identification] section
struct IdentificationConfig {
    std::vector<std::string> ignore_markers = {"CATKIN_IGNORE", "AMENT_IGNORE"};
    std::string legacy_manifest = "manifest.xml";
    std::string python_executable = "python3";
};

// [packages."<relative path>"] section: values fixed before identification
struct PackageOverride {
    std::optional<std::string> name;
};

// Layered configuration: global > workspace.
// Later layers override earlier ones field by field.
struct Config {
    LogConfig log;
    IdentificationConfig identification;
    std::map<std::string, PackageOverride> packages;

    // Track which scalar fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool ignore_markers_set = false;
    bool legacy_manifest_set = false;
    bool python_executable_set = false;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& workspace);

    // Push the [log] settings into rosid::log
    void apply_logging() const;
};

// ~/.rosid/config.toml, or empty when HOME is unset
std::string global_config_path();

} // namespace rosid
