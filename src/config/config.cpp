#include "paneguard/config/config.hpp"

#include "paneguard/audit/event.hpp"
#include "paneguard/common/fs.hpp"
#include "paneguard/common/toml.hpp"
#include "paneguard/security/validator.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace paneguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".paneguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("PANEGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

template <typename T>
common::Status read_unsigned(const common::TomlDocument &doc, const std::string &key, T &target) {
  const auto value = doc.require_u64(key, static_cast<std::uint64_t>(target));
  if (!value.ok()) {
    return common::Status::error(value.error());
  }
  if (value.value() > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
    return common::Status::error(key + " is out of range");
  }
  target = static_cast<T>(value.value());
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *socket = std::getenv("PANEGUARD_SOCKET_PATH"); socket != nullptr && *socket) {
    config.tmux.socket_path = socket;
  }
  if (const char *binary = std::getenv("PANEGUARD_TMUX_BINARY"); binary != nullptr && *binary) {
    config.tmux.binary = binary;
  }
  if (const char *audit_dir = std::getenv("PANEGUARD_AUDIT_DIR");
      audit_dir != nullptr && *audit_dir) {
    config.audit.directory = audit_dir;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.tmux.binary = doc.get_string("tmux.binary", config.tmux.binary);
  config.tmux.socket_path = doc.get_string("tmux.socket_path", config.tmux.socket_path);

  config.audit.directory = doc.get_string("audit.directory", config.audit.directory);
  config.audit.file_prefix = doc.get_string("audit.file_prefix", config.audit.file_prefix);
  config.audit.log_level = doc.get_string("audit.log_level", config.audit.log_level);
  config.audit.console_output = doc.get_bool("audit.console_output", config.audit.console_output);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  const common::Status numeric[] = {
      read_unsigned(doc, "rate_limit.window_ms", config.rate_limit.window_ms),
      read_unsigned(doc, "rate_limit.max_requests", config.rate_limit.max_requests),
      read_unsigned(doc, "rate_limit.block_duration_ms", config.rate_limit.block_duration_ms),
      read_unsigned(doc, "rate_limit.max_tracked_sources", config.rate_limit.max_tracked_sources),
      read_unsigned(doc, "execution.max_concurrent_commands",
                    config.execution.max_concurrent_commands),
      read_unsigned(doc, "execution.command_timeout_ms", config.execution.command_timeout_ms),
      read_unsigned(doc, "execution.max_output_bytes", config.execution.max_output_bytes),
      read_unsigned(doc, "audit.max_segment_bytes", config.audit.max_segment_bytes),
      read_unsigned(doc, "audit.rotation_count", config.audit.rotation_count),
      read_unsigned(doc, "audit.flush_interval_ms", config.audit.flush_interval_ms),
      read_unsigned(doc, "audit.flush_threshold", config.audit.flush_threshold),
      read_unsigned(doc, "audit.queue_capacity", config.audit.queue_capacity),
      read_unsigned(doc, "audit.summary_capacity", config.audit.summary_capacity),
  };
  for (const auto &status : numeric) {
    if (!status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = parsed.take();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const auto socket = security::validate_socket_path(config.tmux.socket_path);
  if (!socket.valid) {
    return common::Result<std::vector<std::string>>::failure("tmux.socket_path is invalid: " +
                                                             socket.reason);
  }
  if (common::trim(config.tmux.binary).empty()) {
    return common::Result<std::vector<std::string>>::failure("tmux.binary must not be empty");
  }

  if (config.rate_limit.window_ms == 0 || config.rate_limit.max_requests == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "rate_limit.window_ms and rate_limit.max_requests must be greater than zero");
  }
  if (config.rate_limit.max_tracked_sources == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "rate_limit.max_tracked_sources must be greater than zero");
  }
  if (config.rate_limit.block_duration_ms == 0) {
    warnings.push_back("rate_limit.block_duration_ms is 0; sources over quota are never blocked");
  }

  if (config.execution.max_concurrent_commands == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "execution.max_concurrent_commands must be greater than zero");
  }
  if (config.execution.command_timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "execution.command_timeout_ms must be greater than zero");
  }

  if (!audit::severity_from_string(config.audit.log_level).ok()) {
    return common::Result<std::vector<std::string>>::failure("audit.log_level is unknown: " +
                                                             config.audit.log_level);
  }
  if (config.audit.rotation_count == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "audit.rotation_count must be greater than zero");
  }
  if (config.audit.max_segment_bytes < 4096) {
    return common::Result<std::vector<std::string>>::failure(
        "audit.max_segment_bytes must be at least 4096");
  }
  if (config.audit.queue_capacity == 0 || config.audit.flush_threshold == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "audit.queue_capacity and audit.flush_threshold must be greater than zero");
  }
  if (config.audit.flush_threshold > config.audit.queue_capacity) {
    warnings.push_back("audit.flush_threshold exceeds audit.queue_capacity; size-based flushes "
                       "will never trigger");
  }
  if (common::trim(config.audit.directory).empty()) {
    return common::Result<std::vector<std::string>>::failure("audit.directory must not be empty");
  }
  if (config.audit.file_prefix.empty() || config.audit.file_prefix.find('/') != std::string::npos) {
    return common::Result<std::vector<std::string>>::failure(
        "audit.file_prefix must be a plain file name");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace paneguard::config
