#include "paneguard/cli/commands.hpp"

#include "paneguard/audit/audit_logger.hpp"
#include "paneguard/common/fs.hpp"
#include "paneguard/common/json_util.hpp"
#include "paneguard/config/config.hpp"
#include "paneguard/exec/secure_executor.hpp"
#include "paneguard/observability/factory.hpp"
#include "paneguard/observability/global.hpp"
#include "paneguard/security/templates.hpp"
#include "paneguard/security/validator.hpp"

#include <charconv>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace paneguard::cli {

namespace {

std::string version_string() {
#ifdef PANEGUARD_VERSION
  const std::string version = PANEGUARD_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "paneguard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_count(const std::string &text, std::uint64_t &out) {
  const auto *begin = text.data();
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end && out > 0;
}

common::Result<config::Config> load_checked_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return loaded;
}

std::string validation_json(const security::ValidationResult &result) {
  std::string out = "{\"valid\":" + std::string(result.valid ? "true" : "false");
  out += ",\"risk\":" + common::json_quote(security::risk_tier_to_string(result.risk));
  if (result.sanitized_value.has_value()) {
    out += ",\"sanitized\":" + common::json_quote(*result.sanitized_value);
  }
  if (!result.reason.empty()) {
    out += ",\"reason\":" + common::json_quote(result.reason);
  }
  if (result.issue != security::ValidationIssue::None) {
    out += ",\"issue\":" + common::json_quote(security::validation_issue_to_string(result.issue));
  }
  out += "}";
  return out;
}

int run_exec(std::vector<std::string> args) {
  security::SourceIdentity source;
  std::string value;
  if (take_option(args, "--source-address", "", value)) {
    source.client_address = value;
  }
  if (take_option(args, "--user-id", "", value)) {
    source.user_id = value;
  }
  if (take_option(args, "--session-id", "", value)) {
    source.session_id = value;
  }
  if (args.empty()) {
    std::cerr << "usage: paneguard exec <operation> [name=value ...]\n";
    return 1;
  }

  const std::string operation = args.front();
  security::ParamMap parameters;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto eq = args[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "parameters take the form name=value: " << args[i] << "\n";
      return 1;
    }
    parameters[args[i].substr(0, eq)] = args[i].substr(eq + 1);
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << "config error: " << cfg.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto executor = exec::SecureExecutor::create(cfg.value());
  if (!executor.ok()) {
    std::cerr << "startup failed: " << executor.error() << "\n";
    return 1;
  }
  auto &runner = *executor.value();
  const auto result =
      runner.execute(operation, parameters,
                     source.empty() ? std::nullopt : std::optional<security::SourceIdentity>(source));
  runner.shutdown();
  std::cout << exec::execution_result_to_json(result) << "\n";
  return result.success ? 0 : 2;
}

int run_validate(const std::vector<std::string> &args) {
  if (args.size() != 2) {
    std::cerr << "usage: paneguard validate <kind> <value>\n";
    return 1;
  }
  const std::string &kind = args[0];
  const std::string &input = args[1];

  security::ValidationResult result;
  if (kind == "session-name") {
    result = security::validate_session_name(input);
  } else if (kind == "session-id") {
    result = security::validate_session_id(input);
  } else if (kind == "pane-id") {
    result = security::validate_pane_id(input);
  } else if (kind == "window-id") {
    result = security::validate_window_id(input);
  } else if (kind == "socket-path") {
    result = security::validate_socket_path(input);
  } else if (kind == "command") {
    result = security::validate_command_text(input);
  } else if (kind == "target") {
    result = security::validate_target(input);
  } else if (kind == "number") {
    result = security::validate_bounded_number(input, 1, 10'000);
  } else {
    std::cerr << "unknown kind: " << kind << "\n";
    return 1;
  }
  std::cout << validation_json(result) << "\n";
  return result.valid ? 0 : 2;
}

int run_templates() {
  auto registry = security::TemplateRegistry::builtin();
  if (!registry.ok()) {
    std::cerr << registry.error() << "\n";
    return 1;
  }
  for (const auto &name : registry.value().operation_names()) {
    const auto *tmpl = registry.value().find(name);
    std::cout << name << "\n";
    std::cout << "  shape:    " << tmpl->shape << "\n";
    std::cout << "  budget:   " << tmpl->max_duration.count() << "ms\n";
    std::cout << "  risk:     " << security::risk_tier_to_string(tmpl->risk) << "\n";
    for (const auto &param : tmpl->params) {
      std::cout << "  param:    " << param.name << " (" << security::param_role_to_string(param.role)
                << (param.required ? ", required" : ", optional");
      if (param.role == security::ParamRole::BoundedNumber) {
        std::cout << ", " << param.min << ".." << param.max;
      }
      if (param.default_value.has_value()) {
        std::cout << ", default " << *param.default_value;
      }
      std::cout << ")\n";
    }
  }
  std::cout << "free-form: ";
  const auto free_form = registry.value().free_form_operations();
  for (std::size_t i = 0; i < free_form.size(); ++i) {
    std::cout << (i == 0 ? "" : ", ") << free_form[i];
  }
  std::cout << "\n";
  return 0;
}

int run_audit(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: paneguard audit <summary|verify> ...\n";
    return 1;
  }
  const std::string action = args.front();
  args.erase(args.begin());

  if (action == "verify") {
    if (args.size() != 1) {
      std::cerr << "usage: paneguard audit verify <segment>\n";
      return 1;
    }
    const auto report = audit::verify_segment(common::expand_path(args[0]));
    if (!report.ok()) {
      std::cerr << report.error() << "\n";
      return 1;
    }
    const auto &r = report.value();
    std::cout << "lines:   " << r.lines << "\n";
    std::cout << "seq:     " << r.first_seq << ".." << r.last_seq << "\n";
    std::cout << "anchor:  " << r.anchor_hash << "\n";
    std::cout << "head:    " << r.last_hash << "\n";
    if (!r.intact) {
      std::cout << "BROKEN at line " << r.broken_line << ": " << r.problem << "\n";
      return 2;
    }
    std::cout << "chain intact\n";
    return 0;
  }

  if (action == "summary") {
    std::uint64_t hours = 24;
    std::uint64_t top = 5;
    std::string value;
    if (take_option(args, "--hours", "", value) && !parse_count(value, hours)) {
      std::cerr << "--hours expects a positive integer\n";
      return 1;
    }
    if (take_option(args, "--top", "", value) && !parse_count(value, top)) {
      std::cerr << "--top expects a positive integer\n";
      return 1;
    }
    auto cfg = load_checked_config();
    if (!cfg.ok()) {
      std::cerr << "config error: " << cfg.error() << "\n";
      return 1;
    }
    const auto records = audit::load_summary_records(common::expand_path(cfg.value().audit.directory),
                                                     cfg.value().audit.file_prefix);
    if (!records.ok()) {
      std::cerr << records.error() << "\n";
      return 1;
    }
    const auto summary = audit::summarize(records.value(), std::chrono::system_clock::now(),
                                          std::chrono::hours(hours), static_cast<std::size_t>(top));
    std::cout << audit::summary_to_json(summary) << "\n";
    return 0;
  }

  std::cerr << "unknown audit action: " << action << "\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << " - guarded tmux command execution\n\n";
  std::cout << "usage: paneguard [--config PATH] <command> [args]\n\n";
  std::cout << "  exec <operation> [name=value ...]   run one allow-listed tmux operation\n";
  std::cout << "       [--source-address A] [--user-id U] [--session-id S]\n";
  std::cout << "  validate <kind> <value>             classify one input\n";
  std::cout << "       kinds: session-name session-id pane-id window-id socket-path\n";
  std::cout << "              command target number\n";
  std::cout << "  templates                           list permitted operations\n";
  std::cout << "  audit summary [--hours N] [--top N] summarize recorded audit events\n";
  std::cout << "  audit verify <segment>              check a segment's hash chain\n";
  std::cout << "  config-path                         print the config file location\n";
  std::cout << "  version                             print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "exec") {
    return run_exec(std::move(args));
  }
  if (subcommand == "validate") {
    return run_validate(args);
  }
  if (subcommand == "templates") {
    return run_templates();
  }
  if (subcommand == "audit") {
    return run_audit(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace paneguard::cli
