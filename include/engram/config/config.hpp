#pragma once

#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace engram::config {

[[nodiscard]] common::Result<std::filesystem::path> config_path();

/// Load from ENGRAM_CONFIG_PATH or ~/.engram/config.toml. A missing file yields defaults.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config, const std::filesystem::path &path);

/// Returns warnings on success; hard errors as failure.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace engram::config
