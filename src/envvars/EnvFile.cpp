#include "EnvFile.h"
#include "errors/Errors.h"

namespace envvars {

static bool needs_quoting(const std::string& value) {
    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) return true;
        switch (c) {
            case ' ': case '"': case '\'': case '\\': case '#': case '=': case '`':
                return true;
            default:
                break;
        }
    }
    return false;
}

std::string format_env_value(const std::string& value) {
    if (value.empty()) return value;
    if (!needs_quoting(value)) return value;
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

std::vector<std::string> to_env_lines(const VariableDocument& doc, Environment env, bool empty_values) {
    const auto& vars = doc.get(env);
    if (!vars.has_value()) throw errors::EnvironmentUnavailable(environment_name(env));
    std::vector<std::string> lines;
    lines.reserve(vars->size());
    for (const auto& kv : *vars) {
        if (!is_valid_variable_name(kv.first)) {
            throw errors::MalformedDocument("invalid variable name \"" + net::json_escape(kv.first) + "\" in '" + environment_name(env) + "'");
        }
        lines.push_back(kv.first + "=" + (empty_values ? std::string() : format_env_value(kv.second)));
    }
    return lines;
}

std::string join_env_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        out += l;
        out += '\n';
    }
    return out;
}

}
