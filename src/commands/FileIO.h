#pragma once

#include <string>

namespace commands {

// Both throw errors::FileIOError.
std::string read_file(const std::string& path);
// Writes <path>.tmp then renames it over <path>; nothing is left behind on failure.
void write_file_atomic(const std::string& path, const std::string& content);

}
