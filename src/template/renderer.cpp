#include "qapp/template.hpp"
#include "qapp/platform.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

namespace qapp {

namespace {

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool is_valid_name(const std::string& name) {
    if (name.empty() || !is_name_start(name[0])) return false;
    for (char c : name) {
        if (!is_name_char(c)) return false;
    }
    return true;
}

size_t line_of(const std::string& text, size_t offset) {
    size_t line = 1;
    for (size_t i = 0; i < offset && i < text.size(); ++i) {
        if (text[i] == '\n') ++line;
    }
    return line;
}

Error template_error(const std::string& source_path, size_t line, const std::string& msg) {
    return Error(ErrorCode::TEMPLATE_ERROR,
                 source_path + ":" + std::to_string(line) + ": " + msg);
}

} // namespace

Result<std::string> PlaceholderRenderer::render(const std::string& text,
                                                const VariableMap& variables,
                                                const std::string& source_path) const {
    std::string output;
    output.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        size_t open = text.find("{{", i);
        if (open == std::string::npos) {
            output.append(text, i, std::string::npos);
            break;
        }

        output.append(text, i, open - i);

        size_t close = text.find("}}", open + 2);
        size_t next_open = text.find("{{", open + 2);
        if (close == std::string::npos || (next_open != std::string::npos && next_open < close)) {
            return Result<std::string>::err(template_error(
                source_path, line_of(text, open), "unterminated placeholder '{{'"));
        }

        std::string name = trim(text.substr(open + 2, close - open - 2));
        if (!is_valid_name(name)) {
            return Result<std::string>::err(template_error(
                source_path, line_of(text, open),
                "invalid placeholder '{{" + text.substr(open + 2, close - open - 2) + "}}'"));
        }

        auto it = variables.find(name);
        if (it == variables.end()) {
            return Result<std::string>::err(template_error(
                source_path, line_of(text, open), "undefined variable '" + name + "'"));
        }

        output += it->second;
        i = close + 2;
    }

    return Result<std::string>::ok(output);
}

Result<VariableMap> parse_variable_assignments(const std::vector<std::string>& assignments) {
    VariableMap vars;
    for (const auto& a : assignments) {
        auto eq = a.find('=');
        if (eq == std::string::npos) {
            return Result<VariableMap>::err(Error(ErrorCode::CONFIG_ERROR,
                "invalid variable assignment '" + a + "' (expected key=value)"));
        }
        std::string key = trim(a.substr(0, eq));
        if (!is_valid_name(key)) {
            return Result<VariableMap>::err(Error(ErrorCode::CONFIG_ERROR,
                "invalid variable name in '" + a + "'"));
        }
        vars[key] = a.substr(eq + 1);
    }
    return Result<VariableMap>::ok(vars);
}

Result<VariableMap> load_variables_file(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<VariableMap>::err(Error(ErrorCode::CONFIG_ERROR,
            "cannot read variables file: " + path));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<VariableMap>::err(Error(ErrorCode::CONFIG_ERROR,
            "invalid JSON in variables file " + path + ": " + e.what()));
    }

    if (!j.is_object()) {
        return Result<VariableMap>::err(Error(ErrorCode::CONFIG_ERROR,
            "variables file must contain a JSON object: " + path));
    }

    VariableMap vars;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        if (v.is_string()) {
            vars[it.key()] = v.get<std::string>();
        } else if (v.is_boolean()) {
            vars[it.key()] = v.get<bool>() ? "true" : "false";
        } else if (v.is_number()) {
            vars[it.key()] = v.dump();
        } else {
            return Result<VariableMap>::err(Error(ErrorCode::CONFIG_ERROR,
                "variable '" + it.key() + "' in " + path +
                " must be a string, number or boolean"));
        }
    }
    return Result<VariableMap>::ok(vars);
}

VariableMap merge_variables(const VariableMap& base, const VariableMap& overrides) {
    VariableMap merged = base;
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    return merged;
}

} // namespace qapp
