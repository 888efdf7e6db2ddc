#include "octpkg/description.hpp"
#include "octpkg/version.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace octpkg {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(value);
    while (std::getline(ss, current, ',')) {
        auto item = trim(current);
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

std::optional<bool> parse_flag(const std::string& value) {
    auto v = to_lower(trim(value));
    if (v == "yes" || v == "true" || v == "on") return true;
    if (v == "no" || v == "false" || v == "off") return false;
    return std::nullopt;
}

// Parse one "name (op version)" item
Result<Dependency> parse_dependency_item(const std::string& item) {
    Dependency dep;
    auto open = item.find('(');

    if (open == std::string::npos) {
        dep.name = trim(item);
    } else {
        auto close = item.find(')', open);
        if (close == std::string::npos) {
            return Result<Dependency>::err(Error(ErrorCode::InvalidDescription,
                                                 "unbalanced parenthesis in dependency '" + item + "'"));
        }
        dep.name = trim(item.substr(0, open));
        std::string constraint = trim(item.substr(open + 1, close - open - 1));

        size_t op_len = 0;
        while (op_len < constraint.size() &&
               (constraint[op_len] == '<' || constraint[op_len] == '>' ||
                constraint[op_len] == '=' || constraint[op_len] == '!')) {
            ++op_len;
        }

        auto op = parse_constraint_op(constraint.substr(0, op_len));
        if (!op || *op == ConstraintOp::Any) {
            return Result<Dependency>::err(Error(ErrorCode::InvalidDescription,
                                                 "unsupported operator in dependency '" + item + "'"));
        }
        dep.op = *op;
        dep.version = trim(constraint.substr(op_len));
        if (!is_valid_version(dep.version)) {
            return Result<Dependency>::err(Error(ErrorCode::InvalidVersion,
                                                 "invalid version in dependency '" + item + "'"));
        }
    }

    if (!is_valid_package_name(dep.name)) {
        return Result<Dependency>::err(Error(ErrorCode::InvalidDescription,
                                             "invalid dependency name in '" + item + "'"));
    }

    return Result<Dependency>::ok(std::move(dep));
}

const char* const kRequiredFields[] = {
    "name", "version", "date", "author", "maintainer", "title", "description",
};

} // namespace

bool is_valid_package_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_')) {
            return false;
        }
    }
    return true;
}

Result<std::vector<Dependency>> parse_depends(const std::string& value,
                                              std::optional<Dependency>* runtime_out) {
    std::vector<Dependency> deps;

    for (const auto& item : split_list(value)) {
        auto dep = parse_dependency_item(item);
        if (dep.isErr()) {
            return Result<std::vector<Dependency>>::err(dep.error());
        }
        if (to_lower(dep.value().name) == kRuntimeDependencyName) {
            if (runtime_out) *runtime_out = dep.value();
            continue;
        }
        deps.push_back(std::move(dep.value()));
    }

    return Result<std::vector<Dependency>>::ok(std::move(deps));
}

DescriptionParseResult parse_description(const std::string& content,
                                         const std::string& source_path) {
    DescriptionParseResult result;
    result.description.source_path = source_path;

    // Collect key/value pairs, folding continuation lines into the previous key
    std::map<std::string, std::string> fields;
    std::string last_key;
    std::istringstream in(content);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty() || line[0] == '#') continue;

        if (std::isspace(static_cast<unsigned char>(line[0]))) {
            if (last_key.empty()) {
                result.error = "continuation line without a key at line " + std::to_string(line_no);
                return result;
            }
            fields[last_key] += " " + trim(line);
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            result.error = "malformed line " + std::to_string(line_no) + ": " + line;
            return result;
        }

        last_key = to_lower(trim(line.substr(0, colon)));
        if (fields.count(last_key)) {
            result.warnings.push_back("duplicate key '" + last_key + "', last value wins");
        }
        fields[last_key] = trim(line.substr(colon + 1));
    }

    for (const char* key : kRequiredFields) {
        auto it = fields.find(key);
        if (it == fields.end() || it->second.empty()) {
            result.error = std::string(key) + " missing";
            return result;
        }
    }

    auto& desc = result.description;
    desc.name = fields["name"];
    desc.version = fields["version"];
    desc.date = fields["date"];
    desc.author = fields["author"];
    desc.maintainer = fields["maintainer"];
    desc.title = fields["title"];
    desc.description = fields["description"];

    if (!is_valid_package_name(desc.name)) {
        result.error = "invalid package name: " + desc.name;
        return result;
    }
    if (!is_valid_version(desc.version)) {
        result.error = "invalid version: " + desc.version;
        return result;
    }

    for (auto& [key, value] : fields) {
        if (key == "name" || key == "version" || key == "date" || key == "author" ||
            key == "maintainer" || key == "title" || key == "description") {
            continue;
        }
        if (key == "depends") {
            auto deps = parse_depends(value, &desc.runtime_requirement);
            if (deps.isErr()) {
                result.error = deps.error().message();
                return result;
            }
            desc.depends = std::move(deps.value());
        } else if (key == "systemrequirements") {
            desc.system_requirements = split_list(value);
        } else if (key == "buildrequires") {
            desc.build_requires = split_list(value);
        } else if (key == "autoload") {
            desc.autoload = parse_flag(value);
            if (!desc.autoload) {
                result.warnings.push_back("unrecognized Autoload value '" + value + "'");
            }
        } else if (key == "license") {
            desc.license = value;
        } else if (key == "url") {
            desc.url = value;
        } else {
            desc.extra[key] = value;
        }
    }

    result.ok = true;
    return result;
}

PackageRecord record_from_description(const Description& desc) {
    PackageRecord record;
    record.name = desc.name;
    record.version = desc.version;
    record.dependencies = desc.depends;
    record.runtime_requirement = desc.runtime_requirement;
    record.autoload = desc.autoload.value_or(false);
    record.date = desc.date;
    record.title = desc.title;
    record.description = desc.description;
    record.author = desc.author;
    record.maintainer = desc.maintainer;
    record.license = desc.license;
    record.url = desc.url;
    return record;
}

std::string format_description(const Description& desc) {
    std::ostringstream out;
    out << "Name: " << desc.name << "\n";
    out << "Version: " << desc.version << "\n";
    out << "Date: " << desc.date << "\n";
    out << "Author: " << desc.author << "\n";
    out << "Maintainer: " << desc.maintainer << "\n";
    out << "Title: " << desc.title << "\n";
    out << "Description: " << desc.description << "\n";

    std::vector<std::string> deps;
    if (desc.runtime_requirement) deps.push_back(desc.runtime_requirement->to_string());
    for (const auto& d : desc.depends) deps.push_back(d.to_string());
    if (!deps.empty()) out << "Depends: " << join_names(deps) << "\n";

    if (!desc.system_requirements.empty()) {
        out << "SystemRequirements: " << join_names(desc.system_requirements) << "\n";
    }
    if (!desc.build_requires.empty()) {
        out << "BuildRequires: " << join_names(desc.build_requires) << "\n";
    }
    if (desc.autoload) out << "Autoload: " << (*desc.autoload ? "yes" : "no") << "\n";
    if (!desc.license.empty()) out << "License: " << desc.license << "\n";
    if (!desc.url.empty()) out << "Url: " << desc.url << "\n";
    return out.str();
}

} // namespace octpkg
