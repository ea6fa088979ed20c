#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <utility>
#include "errors/Errors.h"
#include "observability/Logging.h"

namespace config {

namespace {

struct OptionSpec {
    const char* name;
    bool takes_value;
};

const OptionSpec kOptions[] = {
    {"account", true},
    {"token", true},
    {"project", true},
    {"deployment", true},
    {"output", true},
    {"file", true},
    {"environment", true},
    {"empty", false},
    {"log-level", true},
};

const OptionSpec* find_option(const std::string& name) {
    for (const auto& o : kOptions) {
        if (name == o.name) return &o;
    }
    return nullptr;
}

const std::set<std::string>& allowed_for(const std::string& command) {
    static const std::map<std::string, std::set<std::string>> table = {
        {"get-env-vars", {"account", "token", "project", "deployment", "output", "log-level"}},
        {"set-env-vars", {"account", "token", "project", "file", "log-level"}},
        {"to-env-file", {"environment", "empty", "output", "log-level"}},
    };
    static const std::set<std::string> none;
    auto it = table.find(command);
    return it == table.end() ? none : it->second;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> lookup(const CommandLine& cl, const EnvLookup& env, const std::string& option, const char* env_name) {
    if (auto v = cl.option(option)) return v;
    if (env_name && env) {
        auto v = env(env_name);
        if (v.has_value() && !v->empty()) {
            observability::log_debug("config_from_env", {{"option", option}, {"env", std::string(env_name)}});
            return v;
        }
    }
    return std::nullopt;
}

std::string require(const CommandLine& cl, const EnvLookup& env, const std::string& option, const char* env_name) {
    auto v = lookup(cl, env, option, env_name);
    if (!v.has_value() || v->empty()) {
        std::string hint = "pass --" + option;
        if (env_name) hint += " or set " + std::string(env_name);
        throw errors::MissingConfiguration(option, hint);
    }
    return *v;
}

bool parse_bool(const std::string& field, const std::string& raw) {
    auto v = lower(raw);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw errors::InvalidConfiguration(field, "expected a boolean, got '" + raw + "'");
}

bool has_line_break(const std::string& s) {
    return s.find('\n') != std::string::npos || s.find('\r') != std::string::npos;
}

Credentials resolve_credentials(const CommandLine& cl, const EnvLookup& env) {
    Credentials c;
    c.account = require(cl, env, "account", "CLOUDFLARE_ACCOUNT");
    c.token = require(cl, env, "token", "CLOUDFLARE_TOKEN");
    if (has_line_break(c.account)) {
        throw errors::InvalidConfiguration("account", "account id must not contain line breaks");
    }
    if (has_line_break(c.token)) {
        throw errors::InvalidConfiguration("token", "token must not contain line breaks");
    }
    return c;
}

void reject_positionals(const CommandLine& cl) {
    if (!cl.positionals.empty()) {
        throw errors::UsageError("unexpected argument '" + cl.positionals.front() + "' for " + cl.command);
    }
}

}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    };
}

EnvLookup map_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };
}

std::optional<std::string> CommandLine::option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cl;
    bool only_positionals = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (!only_positionals && a == "--") { only_positionals = true; continue; }
        if (!only_positionals && (a == "--help" || a == "-h")) { cl.help = true; continue; }
        if (!only_positionals && a == "--version") { cl.version = true; continue; }
        if (!only_positionals && a.size() > 2 && a.rfind("--", 0) == 0) {
            std::string name = a.substr(2);
            std::optional<std::string> inline_value;
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            const OptionSpec* spec = find_option(name);
            if (!spec) throw errors::UsageError("unknown option '--" + name + "'");
            if (!spec->takes_value) {
                cl.options[name] = inline_value.value_or("true");
                continue;
            }
            if (inline_value.has_value()) {
                cl.options[name] = *inline_value;
            } else {
                if (i + 1 >= args.size()) throw errors::UsageError("option '--" + name + "' requires a value");
                cl.options[name] = args[++i];
            }
            continue;
        }
        if (!only_positionals && a.size() > 1 && a[0] == '-') {
            throw errors::UsageError("unknown option '" + a + "'");
        }
        if (cl.command.empty()) cl.command = a;
        else cl.positionals.push_back(a);
    }

    if (!cl.command.empty() && !cl.help) {
        const auto& allowed = allowed_for(cl.command);
        if (allowed.empty()) throw errors::UsageError("unknown command '" + cl.command + "'");
        for (const auto& kv : cl.options) {
            if (!allowed.count(kv.first)) {
                throw errors::UsageError("option '--" + kv.first + "' is not valid for " + cl.command);
            }
        }
    }
    return cl;
}

Config::LogLevel Config::resolve_log_level(const CommandLine& cl, const EnvLookup& env) {
    auto raw = lookup(cl, env, "log-level", "LOG_LEVEL");
    if (!raw.has_value()) return LogLevel::WARN;
    switch (observability::level_from_name(*raw)) {
        case 1: return LogLevel::DEBUG;
        case 2: return LogLevel::INFO;
        case 3: return LogLevel::WARN;
        case 4: return LogLevel::ERROR;
        default: break;
    }
    throw errors::InvalidConfiguration("log-level", "expected DEBUG, INFO, WARN or ERROR, got '" + *raw + "'");
}

Config::GetEnvVars Config::resolve_get_env_vars(const CommandLine& cl, const EnvLookup& env) {
    reject_positionals(cl);
    GetEnvVars c;
    c.credentials = resolve_credentials(cl, env);
    c.project.project = require(cl, env, "project", "CF_PAGES_PROJECT");
    c.project.deployment = lookup(cl, env, "deployment", "CF_PAGES_DEPLOYMENT");
    if (c.project.deployment.has_value() && c.project.deployment->empty()) c.project.deployment.reset();
    c.output = lookup(cl, env, "output", "CF_PAGES_OUTPUT");
    if (c.output.has_value() && c.output->empty()) c.output.reset();
    return c;
}

Config::SetEnvVars Config::resolve_set_env_vars(const CommandLine& cl, const EnvLookup& env) {
    reject_positionals(cl);
    SetEnvVars c;
    c.credentials = resolve_credentials(cl, env);
    c.project.project = require(cl, env, "project", "CF_PAGES_PROJECT");
    c.file = require(cl, env, "file", "CF_PAGES_FILE");
    return c;
}

Config::ToEnvFile Config::resolve_to_env_file(const CommandLine& cl, const EnvLookup& env) {
    ToEnvFile c;
    if (cl.positionals.size() > 1) {
        throw errors::UsageError("to-env-file takes a single input file, got " + std::to_string(cl.positionals.size()));
    }
    if (cl.positionals.empty() || cl.positionals.front().empty()) {
        throw errors::MissingConfiguration("file", "pass the JSON file as the positional argument");
    }
    c.file = cl.positionals.front();

    if (auto raw = lookup(cl, env, "environment", "CF_PAGES_ENVIRONMENT")) {
        auto e = envvars::parse_environment(*raw);
        if (!e.has_value()) {
            if (cl.option("environment").has_value()) {
                throw errors::UsageError("invalid value '" + *raw + "' for --environment (expected production or preview)");
            }
            throw errors::InvalidConfiguration("environment", "CF_PAGES_ENVIRONMENT must be production or preview, got '" + *raw + "'");
        }
        c.environment = *e;
    }
    if (auto raw = lookup(cl, env, "empty", "CF_PAGES_EMPTY")) {
        c.empty = parse_bool("empty", *raw);
    }
    c.output = lookup(cl, env, "output", "CF_PAGES_OUTPUT");
    if (c.output.has_value() && c.output->empty()) c.output.reset();
    return c;
}

int log_level_value(Config::LogLevel l) {
    switch (l) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 3;
}

}
