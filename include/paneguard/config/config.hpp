#pragma once

#include "paneguard/common/result.hpp"
#include "paneguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace paneguard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();
void clear_config_path_override();

/// Parses TOML text into a Config, starting from defaults.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Loads the config file (defaults when absent) and applies environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Fatal problems fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace paneguard::config
