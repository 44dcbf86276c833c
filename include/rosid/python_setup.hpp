#pragma once

#include <rosid/result.hpp>
#include <rosid/environment.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace rosid {

// Keyword arguments a setup.py passes to setup()
struct PythonSetupOptions {
    std::string name;
    std::string version;
    std::vector<std::string> packages;
    std::map<std::string, std::string> package_dir;
    // (install directory, files)
    std::vector<std::pair<std::string, std::vector<std::string>>> data_files;
    // group -> entry point specs, e.g. console_scripts -> ["talker = pkg.talker:main"]
    std::map<std::string, std::vector<std::string>> entry_points;
    // Every keyword passed to setup(), sorted
    std::vector<std::string> keywords;
};

// Deferred reader of a package's setup.py. Holds only the file path; every
// evaluate() runs the interpreter again, nothing is cached.
class PythonSetupAccessor {
public:
    explicit PythonSetupAccessor(std::filesystem::path setup_py,
                                 std::string python_executable = "python3");

    Result<PythonSetupOptions> evaluate(const Environment& env) const;

    const std::filesystem::path& setup_py() const { return setup_py_; }
    const std::string& python_executable() const { return python_; }

private:
    std::filesystem::path setup_py_;
    std::string python_;
};

// Parse the TOML document printed by the setup.py capture script
Result<PythonSetupOptions> parse_setup_options(const std::string& toml_str);

} // namespace rosid
