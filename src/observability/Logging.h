#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
using Fields = std::unordered_map<std::string, FieldValue>;

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

// 1=DEBUG 2=INFO 3=WARN 4=ERROR
void set_log_level(int level);
int log_level();
int level_from_name(const std::string& name);

// Defaults to std::cerr; stdout is reserved for command output.
void set_log_sink(std::ostream* sink);

} 
