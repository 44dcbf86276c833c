#include <rosid/manifest.hpp>
#include <rosid/condition.hpp>
#include <tinyxml.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace rosid {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

const std::set<std::string> FORMAT1_TAGS = {
    "name", "version", "description", "maintainer", "license", "url",
    "author", "build_depend", "buildtool_depend", "run_depend",
    "test_depend", "conflict", "replace", "export",
};

const std::set<std::string> FORMAT2_TAGS = {
    "name", "version", "description", "maintainer", "license", "url",
    "author", "depend", "build_depend", "build_export_depend",
    "buildtool_depend", "buildtool_export_depend", "exec_depend",
    "test_depend", "doc_depend", "conflict", "replace", "export",
};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Concatenated text of an element and all of its descendants
void collect_text(const TiXmlNode* node, std::string& out) {
    for (const TiXmlNode* child = node->FirstChild(); child;
         child = child->NextSibling()) {
        if (child->ToText()) {
            out += child->Value();
        } else if (child->ToElement()) {
            collect_text(child, out);
        }
    }
}

std::string element_text(const TiXmlElement* elem) {
    std::string text;
    collect_text(elem, text);
    return trim(text);
}

std::optional<std::string> optional_attribute(const TiXmlElement* elem,
                                              const char* name) {
    const char* value = elem->Attribute(name);
    if (!value) return std::nullopt;
    return std::string(value);
}

std::string condition_attribute(const TiXmlElement* elem, int format) {
    // Conditions were introduced with format 3
    if (format < 3) return "";
    const char* value = elem->Attribute("condition");
    return value ? trim(value) : "";
}

bool is_valid_version(const std::string& version) {
    int parts = 0;
    size_t pos = 0;
    while (true) {
        size_t start = pos;
        while (pos < version.size() &&
               std::isdigit(static_cast<unsigned char>(version[pos]))) {
            ++pos;
        }
        if (pos == start) return false;
        ++parts;
        if (pos == version.size()) break;
        if (version[pos] != '.') return false;
        ++pos;
    }
    return parts == 3;
}

struct XmlReader {
    const TiXmlElement* root;
    int format;
    std::string filename;

    RosidError invalid(const std::string& msg) const {
        return RosidError{RosidError::Manifest, msg, "", filename, 0};
    }

    std::vector<const TiXmlElement*> children(const char* tag) const {
        std::vector<const TiXmlElement*> out;
        for (const TiXmlElement* e = root->FirstChildElement(tag); e;
             e = e->NextSiblingElement(tag)) {
            out.push_back(e);
        }
        return out;
    }

    Result<std::string> single_text(const char* tag) const {
        auto nodes = children(tag);
        if (nodes.size() != 1) {
            return invalid(std::string("the manifest must contain a single \"") +
                           tag + "\" tag");
        }
        return Result<std::string>::ok(element_text(nodes[0]));
    }

    Result<std::vector<ManifestDependency>> dependencies(const char* tag) const {
        std::vector<ManifestDependency> deps;
        for (const TiXmlElement* e : children(tag)) {
            ManifestDependency dep;
            dep.name = element_text(e);
            if (dep.name.empty()) {
                return invalid(std::string("a \"") + tag +
                               "\" tag must contain a package name");
            }
            dep.condition = condition_attribute(e, format);
            dep.version_lt = optional_attribute(e, "version_lt");
            dep.version_lte = optional_attribute(e, "version_lte");
            dep.version_eq = optional_attribute(e, "version_eq");
            dep.version_gte = optional_attribute(e, "version_gte");
            dep.version_gt = optional_attribute(e, "version_gt");
            deps.push_back(std::move(dep));
        }
        return Result<std::vector<ManifestDependency>>::ok(std::move(deps));
    }
};

void append(std::vector<ManifestDependency>& to,
            const std::vector<ManifestDependency>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

Status check_condition_syntax(const std::string& condition,
                              const std::string& filename) {
    if (condition.empty()) return ok_status();
    auto parsed = Condition::parse(condition);
    if (parsed.is_err()) {
        RosidError err = std::move(parsed).error();
        err.file = filename;
        return err;
    }
    return ok_status();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& xml,
                                 const std::string& filename) {
    TiXmlDocument doc;
    doc.Parse(xml.c_str());
    if (doc.Error()) {
        return RosidError{RosidError::Parse,
            std::string("XML parse error: ") + doc.ErrorDesc(),
            "", filename, doc.ErrorRow()};
    }

    const TiXmlElement* root = doc.RootElement();
    if (!root || std::string(root->Value()) != "package") {
        return RosidError{RosidError::Parse,
            "the manifest must have a single root element \"package\"",
            "", filename, 0};
    }

    Manifest m;

    if (const char* fmt = root->Attribute("format")) {
        std::string f = trim(fmt);
        if (f == "1") m.package_format = 1;
        else if (f == "2") m.package_format = 2;
        else if (f == "3") m.package_format = 3;
        else {
            return RosidError{RosidError::Manifest,
                "unsupported package format '" + f + "'",
                "supported formats are 1, 2 and 3", filename, 0};
        }
    }

    XmlReader reader{root, m.package_format, filename};

    // Tags a given format does not know are rejected
    const auto& known = m.package_format == 1 ? FORMAT1_TAGS : FORMAT2_TAGS;
    std::string unknown;
    for (const TiXmlElement* e = root->FirstChildElement(); e;
         e = e->NextSiblingElement()) {
        std::string tag = e->Value();
        bool allowed = known.count(tag) > 0 ||
            (m.package_format >= 3 &&
             (tag == "group_depend" || tag == "member_of_group"));
        if (!allowed) {
            if (!unknown.empty()) unknown += ", ";
            unknown += tag;
        }
    }
    if (!unknown.empty()) {
        return reader.invalid("the manifest (with format version " +
            std::to_string(m.package_format) +
            ") must not contain the following tags: " + unknown);
    }

    auto name = reader.single_text("name");
    if (name.is_err()) return std::move(name).error();
    m.name = std::move(name).value();

    auto version = reader.single_text("version");
    if (version.is_err()) return std::move(version).error();
    m.version = std::move(version).value();

    auto description = reader.single_text("description");
    if (description.is_err()) return std::move(description).error();
    m.description = std::move(description).value();

    for (const TiXmlElement* e : reader.children("maintainer")) {
        m.maintainers.push_back(element_text(e));
    }
    for (const TiXmlElement* e : reader.children("license")) {
        m.licenses.push_back(element_text(e));
    }

    auto build = reader.dependencies("build_depend");
    if (build.is_err()) return std::move(build).error();
    m.build_depends = std::move(build).value();

    auto buildtool = reader.dependencies("buildtool_depend");
    if (buildtool.is_err()) return std::move(buildtool).error();
    m.buildtool_depends = std::move(buildtool).value();

    auto test = reader.dependencies("test_depend");
    if (test.is_err()) return std::move(test).error();
    m.test_depends = std::move(test).value();

    if (m.package_format == 1) {
        // run_depend covers both the export and the exec role
        auto run = reader.dependencies("run_depend");
        if (run.is_err()) return std::move(run).error();
        m.build_export_depends = run.value();
        m.exec_depends = std::move(run).value();
    } else {
        auto depend = reader.dependencies("depend");
        if (depend.is_err()) return std::move(depend).error();

        auto build_export = reader.dependencies("build_export_depend");
        if (build_export.is_err()) return std::move(build_export).error();
        m.build_export_depends = std::move(build_export).value();

        auto buildtool_export = reader.dependencies("buildtool_export_depend");
        if (buildtool_export.is_err()) return std::move(buildtool_export).error();
        m.buildtool_export_depends = std::move(buildtool_export).value();

        auto exec = reader.dependencies("exec_depend");
        if (exec.is_err()) return std::move(exec).error();
        m.exec_depends = std::move(exec).value();

        auto doc_deps = reader.dependencies("doc_depend");
        if (doc_deps.is_err()) return std::move(doc_deps).error();
        m.doc_depends = std::move(doc_deps).value();

        // <depend> expands to build, build_export and exec
        append(m.build_depends, depend.value());
        append(m.build_export_depends, depend.value());
        append(m.exec_depends, depend.value());
    }

    if (m.package_format >= 3) {
        for (const TiXmlElement* e : reader.children("group_depend")) {
            GroupDependency g;
            g.name = element_text(e);
            g.condition = condition_attribute(e, m.package_format);
            m.group_depends.push_back(std::move(g));
        }
        for (const TiXmlElement* e : reader.children("member_of_group")) {
            GroupMembership g;
            g.name = element_text(e);
            g.condition = condition_attribute(e, m.package_format);
            m.member_of_groups.push_back(std::move(g));
        }
    }

    for (const TiXmlElement* exp : reader.children("export")) {
        for (const TiXmlElement* e = exp->FirstChildElement(); e;
             e = e->NextSiblingElement()) {
            ManifestExport x;
            x.tagname = e->Value();
            x.content = element_text(e);
            x.condition = condition_attribute(e, m.package_format);
            m.exports.push_back(std::move(x));
        }
    }

    auto valid = m.validate();
    if (valid.is_err()) {
        RosidError err = std::move(valid).error();
        err.file = filename;
        return err;
    }

    return Result<Manifest>::ok(std::move(m));
}

// ---------------------------------------------------------------------------
// Manifest::load
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::load(const std::string& path) {
    fs::path file_path(path);
    std::error_code ec;
    if (fs::is_directory(file_path, ec)) {
        file_path /= MANIFEST_FILENAME;
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        return RosidError{RosidError::IO,
            "cannot open manifest file: " + file_path.string()};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return Manifest::parse(ss.str(), file_path.string());
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

Status Manifest::validate() const {
    if (name.empty()) {
        return RosidError{RosidError::Manifest, "package name must not be empty"};
    }
    if (!is_valid_version(version)) {
        return RosidError{RosidError::Manifest,
            "package version '" + version + "' does not follow version conventions",
            "expected <major>.<minor>.<patch>, e.g. 1.0.0"};
    }
    if (description.empty()) {
        return RosidError{RosidError::Manifest,
            "package '" + name + "' has an empty description"};
    }
    if (maintainers.empty()) {
        return RosidError{RosidError::Manifest,
            "package '" + name + "' must declare at least one maintainer"};
    }
    if (licenses.empty()) {
        return RosidError{RosidError::Manifest,
            "package '" + name + "' must declare at least one license"};
    }

    const std::vector<std::pair<const char*, const std::vector<ManifestDependency>*>>
        lists = {
            {"build", &build_depends},
            {"buildtool", &buildtool_depends},
            {"build_export", &build_export_depends},
            {"buildtool_export", &buildtool_export_depends},
            {"exec", &exec_depends},
            {"test", &test_depends},
            {"doc", &doc_depends},
        };
    for (const auto& [kind, deps] : lists) {
        for (const auto& d : *deps) {
            if (d.name == name) {
                return RosidError{RosidError::Manifest,
                    "package '" + name + "' must not " + kind +
                    "_depend on a package with the same name"};
            }
            ROSID_TRY(check_condition_syntax(d.condition, ""));
        }
    }
    for (const auto& g : group_depends) {
        ROSID_TRY(check_condition_syntax(g.condition, ""));
    }
    for (const auto& g : member_of_groups) {
        ROSID_TRY(check_condition_syntax(g.condition, ""));
    }
    for (const auto& x : exports) {
        ROSID_TRY(check_condition_syntax(x.condition, ""));
    }

    return ok_status();
}

// ---------------------------------------------------------------------------
// Conditions
// ---------------------------------------------------------------------------

Status Manifest::evaluate_conditions(const Environment& env) {
    auto eval = [&](const std::string& condition,
                    std::optional<bool>& out) -> Status {
        auto r = evaluate_condition(condition, env);
        if (r.is_err()) return std::move(r).error();
        out = r.value();
        return ok_status();
    };

    for (auto* deps : {&build_depends, &buildtool_depends,
                       &build_export_depends, &buildtool_export_depends,
                       &exec_depends, &test_depends, &doc_depends}) {
        for (auto& d : *deps) {
            ROSID_TRY(eval(d.condition, d.evaluated_condition));
        }
    }
    for (auto& g : group_depends) {
        ROSID_TRY(eval(g.condition, g.evaluated_condition));
    }
    for (auto& g : member_of_groups) {
        ROSID_TRY(eval(g.condition, g.evaluated_condition));
    }
    for (auto& x : exports) {
        ROSID_TRY(eval(x.condition, x.evaluated_condition));
    }
    return ok_status();
}

Result<std::string> Manifest::build_type() const {
    std::vector<std::string> declared;
    for (const auto& x : exports) {
        if (x.tagname != "build_type") continue;
        if (!x.evaluated_condition.has_value()) {
            return RosidError{RosidError::Invariant,
                "build_type export of package '" + name +
                "' has no evaluated condition",
                "call evaluate_conditions() before build_type()"};
        }
        if (*x.evaluated_condition) declared.push_back(x.content);
    }

    if (declared.empty()) return Result<std::string>::ok("catkin");
    if (declared.size() > 1) {
        return RosidError{RosidError::Manifest,
            "only one <build_type> element is permitted"};
    }
    return Result<std::string>::ok(declared[0]);
}

// ---------------------------------------------------------------------------
// Groups
// ---------------------------------------------------------------------------

Status GroupDependency::extract_group_members(
    const std::vector<const Manifest*>& packages) {
    std::set<std::string> found;
    for (const Manifest* pkg : packages) {
        for (const auto& membership : pkg->member_of_groups) {
            if (!membership.evaluated_condition.has_value()) {
                return RosidError{RosidError::Invariant,
                    "member_of_group '" + membership.name + "' of package '" +
                    pkg->name + "' has no evaluated condition"};
            }
            if (*membership.evaluated_condition && membership.name == name) {
                found.insert(pkg->name);
            }
        }
    }
    members = std::move(found);
    return ok_status();
}

bool package_exists_at(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) &&
           fs::is_regular_file(fs::path(path) / MANIFEST_FILENAME, ec);
}

} // namespace rosid
