#pragma once

#include <string>
#include <vector>
#include "VariableDocument.h"

namespace envvars {

// Values made only of "safe" characters are written bare; anything else is
// double quoted with \\ \" \n \r \t escapes. Empty values are written as KEY=.
std::string format_env_value(const std::string& value);

// One KEY=VALUE line per variable, sorted by key. Throws
// errors::EnvironmentUnavailable when the selected environment is null,
// errors::MalformedDocument for a name that is not a valid .env key.
// With empty_values set every value is written empty.
std::vector<std::string> to_env_lines(const VariableDocument& doc, Environment env, bool empty_values = false);

// Lines joined with '\n', newline terminated; "" for no lines.
std::string join_env_lines(const std::vector<std::string>& lines);

}
