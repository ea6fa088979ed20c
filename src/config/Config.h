#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "envvars/VariableDocument.h"

namespace config {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment. Empty values count as unset.
EnvLookup process_env();
EnvLookup map_env(std::map<std::string, std::string> vars);

struct CommandLine {
    std::string command;
    std::map<std::string, std::string> options;   // "--project x" -> {"project", "x"}
    std::vector<std::string> positionals;
    bool help = false;
    bool version = false;

    std::optional<std::string> option(const std::string& name) const;
};

// Throws errors::UsageError on malformed arguments (args excludes argv[0]).
CommandLine parse_command_line(const std::vector<std::string>& args);

struct Credentials {
    std::string account;
    std::string token;
};

struct ProjectReference {
    std::string project;
    std::optional<std::string> deployment;
};

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    LogLevel log_level = LogLevel::WARN;

    struct GetEnvVars {
        Credentials credentials;
        ProjectReference project;
        std::optional<std::string> output;
    };
    struct SetEnvVars {
        Credentials credentials;
        ProjectReference project;
        std::string file;
    };
    struct ToEnvFile {
        envvars::Environment environment = envvars::Environment::Production;
        bool empty = false;
        std::optional<std::string> output;
        std::string file;
    };

    static LogLevel resolve_log_level(const CommandLine& cl, const EnvLookup& env);
    static GetEnvVars resolve_get_env_vars(const CommandLine& cl, const EnvLookup& env);
    static SetEnvVars resolve_set_env_vars(const CommandLine& cl, const EnvLookup& env);
    static ToEnvFile resolve_to_env_file(const CommandLine& cl, const EnvLookup& env);
};

int log_level_value(Config::LogLevel l);

}
