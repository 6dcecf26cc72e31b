#include "paneguard/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <pwd.h>
#include <regex>
#include <sstream>
#include <unistd.h>

namespace paneguard::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split(const std::string &value, const char delimiter) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, delimiter)) {
    parts.push_back(part);
  }
  return parts;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  // Services started without a login environment still have a passwd entry.
  std::array<char, 4096> buffer{};
  passwd entry{};
  passwd *found = nullptr;
  if (getpwuid_r(getuid(), &entry, buffer.data(), buffer.size(), &found) == 0 && found != nullptr &&
      found->pw_dir != nullptr && *found->pw_dir != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(found->pw_dir));
  }
  return Result<std::filesystem::path>::failure("HOME is not set and no passwd entry was found");
}

Result<std::filesystem::path> ensure_private_dir(const std::filesystem::path &path) {
  namespace fs = std::filesystem;
  if (path.empty()) {
    return Result<fs::path>::failure("directory path is empty");
  }

  std::error_code ec;
  const auto status = fs::symlink_status(path, ec);
  if (fs::exists(status)) {
    if (fs::is_symlink(status)) {
      return Result<fs::path>::failure("refusing to use symlinked directory: " + path.string());
    }
    if (!fs::is_directory(status)) {
      return Result<fs::path>::failure("not a directory: " + path.string());
    }
    return Result<fs::path>::success(path);
  }

  // Only the components created here are narrowed to the owner; existing
  // parents such as /tmp keep their mode.
  std::vector<fs::path> missing;
  for (fs::path current = path; !current.empty() && !fs::exists(current, ec);
       current = current.parent_path()) {
    missing.push_back(current);
    if (current == current.parent_path()) {
      break;
    }
  }
  fs::create_directories(path, ec);
  if (ec) {
    return Result<fs::path>::failure("Failed to create directory: " + path.string() + ": " +
                                     ec.message());
  }
  for (const auto &created : missing) {
    fs::permissions(created, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
      return Result<fs::path>::failure("Failed to restrict " + created.string() + ": " +
                                       ec.message());
    }
  }
  return Result<fs::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

} // namespace paneguard::common
