#pragma once

#include "paneguard/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace paneguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
/// Creates `path` (and missing parents) with owner-only permissions. Existing
/// directories are accepted as they are; symlinks and non-directories are not.
[[nodiscard]] Result<std::filesystem::path> ensure_private_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace paneguard::common
