// demo_scan.cpp
//
// Scans a directory tree for ROS packages and prints what was identified:
//
//     ./demo_scan ~/ros2_ws/src            # names, types and versions
//     ./demo_scan ~/ros2_ws/src --deps     # plus build/run/test dependencies
//     ./demo_scan ~/ros2_ws/src --setup    # plus setup.py options of Python packages
//
// Settings are read from ~/.rosid/config.toml and <path>/rosid.toml.

#include <rosid/config.hpp>
#include <rosid/crawler.hpp>
#include <rosid/identification.hpp>
#include <rosid/log.hpp>
#include <rosid/manifest_cache.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace rosid;

static std::optional<Config> load_layer(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return std::nullopt;

    auto cfg = Config::load(path.string());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return std::nullopt;
    }
    return std::move(cfg).value();
}

static void print_set(const char* label, const DependencySet& deps) {
    if (deps.empty()) return;
    std::cout << "    " << label << ":";
    for (const auto& d : deps) {
        std::cout << " " << d.name();
        for (const auto& [key, value] : d.metadata()) {
            std::cout << "[" << key << "=" << value << "]";
        }
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: demo_scan <path> [--deps] [--setup]\n";
        return 1;
    }

    fs::path root = argv[1];
    bool show_deps = false;
    bool show_setup = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--deps") show_deps = true;
        else if (arg == "--setup") show_setup = true;
        else {
            std::cerr << "error: unknown option " << arg << "\n";
            return 1;
        }
    }

    Config config = Config::effective(load_layer(global_config_path()),
                                      load_layer(root / WORKSPACE_CONFIG_FILENAME));
    config.apply_logging();

    ManifestCache cache;
    RosPackageIdentification ros(cache, config.identification);
    IgnoreMarkerIdentification ignore;

    auto found = discover_packages(root, {&ros, &ignore}, {&ros}, config);
    if (found.is_err()) {
        std::cerr << found.error().format() << "\n";
        return 1;
    }

    Environment env = current_environment();
    for (const auto& desc : found.value()) {
        const std::string* version = desc.metadata_string("version");
        std::cout << desc.name.value_or("?") << "\t"
                  << desc.type().value_or("?") << "\t"
                  << (version ? *version : "-") << "\t"
                  << desc.path().string() << "\n";

        if (show_deps) {
            print_set("build", desc.dependencies.build);
            print_set("run", desc.dependencies.run);
            print_set("test", desc.dependencies.test);
        }

        if (show_setup) {
            if (const auto* accessor = desc.python_setup_accessor()) {
                auto opts = accessor->evaluate(env);
                if (opts.is_err()) {
                    std::cerr << opts.error().format() << "\n";
                    continue;
                }
                std::cout << "    setup: name=" << opts.value().name
                          << " version=" << opts.value().version
                          << " packages=" << opts.value().packages.size() << "\n";
                for (const auto& [group, specs] : opts.value().entry_points) {
                    for (const auto& spec : specs) {
                        std::cout << "    " << group << ": " << spec << "\n";
                    }
                }
            }
        }
    }

    return 0;
}
