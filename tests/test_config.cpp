#include "test_framework.hpp"

#include "paneguard/common/fs.hpp"
#include "paneguard/common/toml.hpp"
#include "paneguard/config/config.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = paneguard::config::config_path_override();
    if (next.has_value()) {
      paneguard::config::set_config_path_override(*next);
    } else {
      paneguard::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      paneguard::config::set_config_path_override(*old_override);
    } else {
      paneguard::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("paneguard-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<paneguard::tests::TestCase> &tests) {
  using paneguard::tests::require;
  namespace cfg = paneguard::config;

  tests.push_back({"config_path_under_home", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("PANEGUARD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / ".paneguard" / "config.toml",
                             "config lives under ~/.paneguard: " + path.value().string());
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("PANEGUARD_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_socket("PANEGUARD_SOCKET_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().rate_limit.window_ms == 60'000, "default window");
                     require(loaded.value().rate_limit.max_requests == 100, "default quota");
                     require(loaded.value().rate_limit.block_duration_ms == 300'000, "default block");
                     require(loaded.value().execution.max_concurrent_commands == 10,
                             "default ceiling");
                     require(loaded.value().audit.rotation_count == 10, "default rotation");
                     require(loaded.value().audit.max_segment_bytes == 100ULL * 1024 * 1024,
                             "default segment size");
                     require(loaded.value().audit.log_level == "info", "default level");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "paneguard.toml");
                     const EnvGuard env_socket("PANEGUARD_SOCKET_PATH", std::nullopt);

                     write_file(home / "paneguard.toml",
                                R"(
# boundary settings
[tmux]
binary = "/usr/bin/tmux"
socket_path = "/run/paneguard/ops.sock"

[rate_limit]
window_ms = 10_000
max_requests = 20
block_duration_ms = 60000

[execution]
max_concurrent_commands = 4

[audit]
directory = "/var/log/paneguard"
log_level = "medium"
rotation_count = 3
console_output = true
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.tmux.binary == "/usr/bin/tmux", "binary");
                     require(config.tmux.socket_path == "/run/paneguard/ops.sock", "socket");
                     require(config.rate_limit.window_ms == 10'000, "underscored number");
                     require(config.rate_limit.max_requests == 20, "quota");
                     require(config.execution.max_concurrent_commands == 4, "ceiling");
                     require(config.audit.log_level == "medium", "level");
                     require(config.audit.rotation_count == 3, "rotation");
                     require(config.audit.console_output, "console mirror");
                     require(config.audit.flush_interval_ms == 5'000, "unset keys keep defaults");
                   }});

  tests.push_back({"load_config_rejects_bad_numbers", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "bad.toml");
                     write_file(home / "bad.toml", "[rate_limit]\nmax_requests = -5\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "negative quota rejected");
                     require(loaded.error().find("rate_limit.max_requests") != std::string::npos,
                             loaded.error());

                     write_file(home / "bad.toml", "[execution]\nmax_concurrent_commands = 99999999999\n");
                     require(!cfg::load_config().ok(), "value past the field's range");

                     write_file(home / "bad.toml", "this line has no assignment\n");
                     require(!cfg::load_config().ok(), "malformed toml");
                   }});

  tests.push_back({"env_override_precedence", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "config.toml");
                     write_file(home / "config.toml", "[tmux]\nsocket_path = \"/tmp/from-file.sock\"\n");
                     const EnvGuard env_socket("PANEGUARD_SOCKET_PATH",
                                               std::optional<std::string>("/tmp/from-env.sock"));
                     const EnvGuard env_binary("PANEGUARD_TMUX_BINARY",
                                               std::optional<std::string>("/opt/tmux/bin/tmux"));
                     const EnvGuard env_audit("PANEGUARD_AUDIT_DIR",
                                              std::optional<std::string>("/tmp/audit-env"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().tmux.socket_path == "/tmp/from-env.sock",
                             "environment beats the file");
                     require(loaded.value().tmux.binary == "/opt/tmux/bin/tmux", "binary override");
                     require(loaded.value().audit.directory == "/tmp/audit-env", "audit override");
                   }});

  tests.push_back({"config_path_env_and_override", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard env_path("PANEGUARD_CONFIG_PATH",
                                             std::optional<std::string>((home / "env.toml").string()));
                     auto path = cfg::config_path();
                     require(path.ok() && path.value() == home / "env.toml", "env path used");

                     cfg::set_config_path_override(home);
                     path = cfg::config_path();
                     require(path.ok() && path.value() == home / "config.toml",
                             "directory override resolves the file name");
                     const auto dir = cfg::config_dir();
                     require(dir.ok() && dir.value() == home, "directory override is the dir");
                   }});

  tests.push_back({"validate_default_config", [] {
                     cfg::Config config;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().empty(), "defaults produce no warnings");
                   }});

  tests.push_back({"validate_rejects_unsafe_socket_path", [] {
                     cfg::Config config;
                     for (const char *path : {"relative.sock", "/tmp/../root/x.sock", "/tmp/a;b.sock",
                                              "/tmp/$(id).sock", ""}) {
                       config.tmux.socket_path = path;
                       require(!cfg::validate_config(config).ok(),
                               std::string("socket accepted: ") + path);
                     }
                   }});

  tests.push_back({"validate_rejects_zero_limits", [] {
                     cfg::Config config;
                     config.rate_limit.max_requests = 0;
                     require(!cfg::validate_config(config).ok(), "zero quota");

                     config = cfg::Config{};
                     config.execution.max_concurrent_commands = 0;
                     require(!cfg::validate_config(config).ok(), "zero ceiling");

                     config = cfg::Config{};
                     config.execution.command_timeout_ms = 0;
                     require(!cfg::validate_config(config).ok(), "zero timeout");

                     config = cfg::Config{};
                     config.audit.rotation_count = 0;
                     require(!cfg::validate_config(config).ok(), "zero rotation");

                     config = cfg::Config{};
                     config.audit.max_segment_bytes = 100;
                     require(!cfg::validate_config(config).ok(), "tiny segments");

                     config = cfg::Config{};
                     config.audit.log_level = "loud";
                     require(!cfg::validate_config(config).ok(), "unknown level");

                     config = cfg::Config{};
                     config.audit.file_prefix = "a/b";
                     require(!cfg::validate_config(config).ok(), "prefix with a path");
                   }});

  tests.push_back({"validate_soft_problems_are_warnings", [] {
                     cfg::Config config;
                     config.rate_limit.block_duration_ms = 0;
                     config.audit.flush_threshold = config.audit.queue_capacity + 1;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().size() == 2, "two warnings");
                   }});

  tests.push_back({"expand_path_uses_home", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     require(paneguard::common::expand_path("~/.paneguard/audit") ==
                                 (home / ".paneguard/audit").string(),
                             "tilde expanded");
                     require(paneguard::common::expand_path("/abs/path") == "/abs/path",
                             "absolute untouched");
                   }});

  tests.push_back({"private_dir_is_owner_only", [] {
                     namespace fs = std::filesystem;
                     const auto home = make_temp_home();
                     const auto before = fs::status(home).permissions();
                     const auto created = paneguard::common::ensure_private_dir(home / "audit" / "deep");
                     require(created.ok(), created.ok() ? "" : created.error());
                     require(fs::status(home / "audit").permissions() == fs::perms::owner_all,
                             "new parent narrowed");
                     require(fs::status(home / "audit" / "deep").permissions() == fs::perms::owner_all,
                             "new leaf narrowed");
                     require(fs::status(home).permissions() == before, "existing parent untouched");
                     require(paneguard::common::ensure_private_dir(home / "audit").ok(),
                             "existing directory accepted");

                     write_file(home / "plain", "x");
                     require(!paneguard::common::ensure_private_dir(home / "plain").ok(),
                             "file rejected");
                     fs::create_directory_symlink(home / "audit", home / "link");
                     require(!paneguard::common::ensure_private_dir(home / "link").ok(),
                             "symlink rejected");
                     require(!paneguard::common::ensure_private_dir("").ok(), "empty path");
                   }});

  tests.push_back({"toml_parser_strictness", [] {
                     using paneguard::common::parse_toml;
                     const auto doc = parse_toml("[audit]\n"
                                                 "directory = \"/var/log/pg#1\" # trailing\n"
                                                 "file_prefix = \"a\\\"b\"\n"
                                                 "console_output = TRUE\n"
                                                 "[rate_limit]\nmax_requests = 1_000\n");
                     require(doc.ok(), doc.ok() ? "" : doc.error());
                     require(doc.value().get_string("audit.directory") == "/var/log/pg#1",
                             "hash inside string kept");
                     require(doc.value().get_string("audit.file_prefix") == "a\"b", "escaped quote");
                     require(doc.value().get_bool("audit.console_output", false), "bool case-insensitive");
                     const auto quota = doc.value().require_u64("rate_limit.max_requests", 0);
                     require(quota.ok() && quota.value() == 1000, "underscore separators");
                     require(doc.value().get_string("audit.missing", "dflt") == "dflt", "fallback");

                     const auto dup = parse_toml("[tmux]\nbinary = \"a\"\nbinary = \"b\"\n");
                     require(!dup.ok() && dup.error().find("line 3") != std::string::npos,
                             "duplicate key names its line");
                     require(!parse_toml("[tmux]\nbinary = \"open\n").ok(), "unterminated string");
                     require(!parse_toml("[tmux\n").ok(), "unclosed header");
                     require(!parse_toml("[]\n").ok(), "empty section");
                     require(!parse_toml(" = 3\n").ok(), "missing key");
                   }});
}
