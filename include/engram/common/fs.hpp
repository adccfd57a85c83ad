#pragma once

#include "engram/common/result.hpp"

#include <filesystem>
#include <string>

namespace engram::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace engram::common
