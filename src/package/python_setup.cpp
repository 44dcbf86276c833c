#include <rosid/python_setup.hpp>
#include <rosid/log.hpp>
#include <rosid/process.hpp>
#include <toml++/toml.hpp>

namespace rosid {

namespace fs = std::filesystem;

namespace {

const char* OPTIONS_MARKER = "--- rosid setup options ---";

// Runs setup.py with setup() replaced by a recorder and prints the recorded
// keyword arguments as TOML after OPTIONS_MARKER.
const char* CAPTURE_SCRIPT = R"PY(
import json, os, runpy, sys, types

def _str(s):
    return json.dumps(str(s), ensure_ascii=False)

def _value(v):
    if isinstance(v, bool):
        return 'true' if v else 'false'
    if isinstance(v, int):
        return str(v)
    if isinstance(v, float):
        return repr(v)
    if isinstance(v, dict):
        return '{' + ', '.join(
            _str(k) + ' = ' + _value(x) for k, x in v.items() if x is not None) + '}'
    if isinstance(v, (list, tuple, set, frozenset)):
        return '[' + ', '.join('""' if x is None else _value(x) for x in v) + ']'
    return _str(v)

setup_py = os.path.abspath(sys.argv[1])
captured = {}

def _setup(*args, **kwargs):
    captured.update(kwargs)

try:
    import setuptools
except ImportError:
    setuptools = types.ModuleType('setuptools')
    sys.modules['setuptools'] = setuptools
setuptools.setup = _setup
try:
    import distutils.core
    distutils.core.setup = _setup
except ImportError:
    pass

sys.argv = [setup_py]
sys.path.insert(0, os.path.dirname(setup_py))
os.chdir(os.path.dirname(setup_py))
runpy.run_path(setup_py, run_name='__main__')
sys.stdout.write('\n')
)PY";

std::vector<std::string> string_array(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> out;
    if (auto arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) out.push_back(*s);
        }
    } else if (auto s = node.value<std::string>()) {
        out.push_back(*s);
    }
    return out;
}

std::string capture_script() {
    std::string script = CAPTURE_SCRIPT;
    script += "sys.stdout.write('";
    script += OPTIONS_MARKER;
    script += "\\n')\n"
              "for k in sorted(captured):\n"
              "    if captured[k] is not None:\n"
              "        sys.stdout.write(_str(k) + ' = ' + _value(captured[k]) + '\\n')\n";
    return script;
}

} // anonymous namespace

PythonSetupAccessor::PythonSetupAccessor(fs::path setup_py,
                                         std::string python_executable)
    : setup_py_(std::move(setup_py)), python_(std::move(python_executable)) {}

Result<PythonSetupOptions> PythonSetupAccessor::evaluate(const Environment& env) const {
    std::error_code ec;
    if (!fs::is_regular_file(setup_py_, ec)) {
        return RosidError{RosidError::NotFound,
            "setup.py not found: " + setup_py_.string()};
    }

    rosid::log::debug("reading setup options from %s", setup_py_.c_str());

    auto r = run_command({python_, "-c", capture_script(), setup_py_.string()},
                         setup_py_.parent_path().string(), 60, env);
    if (r.is_err()) return std::move(r).error();

    const CommandResult& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string detail = cmd.stderr_str;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
        return RosidError{RosidError::Subprocess,
            "failed to evaluate " + setup_py_.string() + " (exit code " +
            std::to_string(cmd.exit_code) + ")",
            detail};
    }

    auto marker = cmd.stdout_str.rfind(OPTIONS_MARKER);
    if (marker == std::string::npos) {
        return RosidError{RosidError::Parse,
            "no setup options reported by " + setup_py_.string(),
            "does setup.py call setup()?"};
    }
    return parse_setup_options(
        cmd.stdout_str.substr(marker + std::string(OPTIONS_MARKER).size()));
}

Result<PythonSetupOptions> parse_setup_options(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return RosidError{RosidError::Parse,
            std::string("cannot parse setup options: ") + e.what()};
    }

    PythonSetupOptions opts;
    const toml::table& cdoc = doc;

    for (const auto& [key, val] : cdoc) {
        opts.keywords.push_back(std::string(key));
    }

    if (auto v = cdoc["name"].value<std::string>()) opts.name = *v;
    if (auto v = cdoc["version"].value<std::string>()) {
        opts.version = *v;
    } else if (auto n = cdoc["version"].value<double>()) {
        opts.version = std::to_string(*n);
    }

    opts.packages = string_array(cdoc["packages"]);

    if (auto dirs = cdoc["package_dir"].as_table()) {
        for (const auto& [key, val] : *dirs) {
            if (auto s = val.value<std::string>()) {
                opts.package_dir[std::string(key)] = *s;
            }
        }
    }

    if (auto files = cdoc["data_files"].as_array()) {
        for (const auto& entry : *files) {
            const toml::array* pair = entry.as_array();
            if (!pair || pair->size() != 2) continue;
            auto dest = (*pair)[0].value<std::string>();
            if (!dest) continue;
            std::vector<std::string> sources;
            if (auto srcs = (*pair)[1].as_array()) {
                for (const auto& s : *srcs) {
                    if (auto str = s.value<std::string>()) sources.push_back(*str);
                }
            }
            opts.data_files.emplace_back(*dest, std::move(sources));
        }
    }

    if (auto eps = cdoc["entry_points"].as_table()) {
        for (const auto& [group, specs] : *eps) {
            std::vector<std::string> list;
            if (auto arr = specs.as_array()) {
                for (const auto& s : *arr) {
                    if (auto str = s.value<std::string>()) list.push_back(*str);
                }
            } else if (auto str = specs.value<std::string>()) {
                list.push_back(*str);
            }
            opts.entry_points[std::string(group)] = std::move(list);
        }
    }

    return Result<PythonSetupOptions>::ok(std::move(opts));
}

} // namespace rosid
