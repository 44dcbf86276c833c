#include <rosid/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace rosid {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return RosidError{RosidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto level = rosid::log::parse_level(*v);
            if (level.is_err()) {
                return RosidError{RosidError::Config,
                    "invalid [log] level: " + level.error().message,
                    level.error().hint};
            }
            cfg.log.level = level.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [identification] section
    if (auto ident = doc["identification"].as_table()) {
        if (auto node = (*ident)["ignore-markers"]; node) {
            auto arr = node.as_array();
            if (!arr) {
                return RosidError{RosidError::Config,
                    "[identification] ignore-markers must be an array of strings"};
            }
            cfg.identification.ignore_markers.clear();
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return RosidError{RosidError::Config,
                        "[identification] ignore-markers must be an array of strings"};
                }
                cfg.identification.ignore_markers.push_back(*s);
            }
            cfg.ignore_markers_set = true;
        }
        if (auto v = (*ident)["legacy-manifest"].value<std::string>()) {
            cfg.identification.legacy_manifest = *v;
            cfg.legacy_manifest_set = true;
        }
        if (auto v = (*ident)["python-executable"].value<std::string>()) {
            cfg.identification.python_executable = *v;
            cfg.python_executable_set = true;
        }
    }

    // [packages."<path>"] sections
    if (auto pkgs = doc["packages"].as_table()) {
        for (const auto& [key, val] : *pkgs) {
            auto tbl = val.as_table();
            if (!tbl) {
                return RosidError{RosidError::Config,
                    "[packages] entry '" + std::string(key) + "' must be a table"};
            }
            PackageOverride po;
            if (auto v = (*tbl)["name"].value<std::string>()) po.name = *v;
            cfg.packages[std::string(key)] = std::move(po);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RosidError{RosidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        RosidError err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log.level = other.log.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log.color = other.log.color;
        log_color_set = true;
    }
    if (other.ignore_markers_set) {
        identification.ignore_markers = other.identification.ignore_markers;
        ignore_markers_set = true;
    }
    if (other.legacy_manifest_set) {
        identification.legacy_manifest = other.identification.legacy_manifest;
        legacy_manifest_set = true;
    }
    if (other.python_executable_set) {
        identification.python_executable = other.identification.python_executable;
        python_executable_set = true;
    }

    // Package overrides: other wins per path
    for (const auto& [path, po] : other.packages) {
        packages[path] = po;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& workspace) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (workspace.has_value()) result.merge(workspace.value());
    return result;
}

void Config::apply_logging() const {
    rosid::log::set_level(log.level);
    if (log_color_set) rosid::log::set_color_enabled(log.color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.rosid/config.toml";
}

} // namespace rosid
