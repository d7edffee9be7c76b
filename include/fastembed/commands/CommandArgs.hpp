#pragma once
#include "fastembed/core/Options.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace fastembed::commands {

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
bool has_flag(int argc, char** argv, const std::string& key);

// Whole-string non-negative integer no larger than max, else ConfigError naming key.
size_t parse_count(const std::string& key, const std::string& value, size_t max = SIZE_MAX);

// --config file first, then individual flags on top. Throws ConfigError.
InitOptions options_from_args(int argc, char** argv);

} // namespace fastembed::commands
