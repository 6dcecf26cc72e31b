#include "paneguard/security/templates.hpp"

#include <algorithm>
#include <set>

namespace paneguard::security {

namespace {

bool is_placeholder_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_';
}

bool is_plain_word_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_' || ch == '-' || ch == '/' || ch == '.' || ch == ':' || ch == ',' ||
         ch == '%' || ch == '@' || ch == '=';
}

struct LexOutput {
  std::vector<std::string> words;
  std::string error;
  std::string violation;
};

// strict=true additionally records the first character that a bound command
// should never contain outside the quoting produced by escape_shell_word.
LexOutput lex_command(const std::string_view command, const bool strict) {
  enum class State { Unquoted, Single, Double };

  LexOutput out;
  State state = State::Unquoted;
  std::string current;
  bool in_word = false;

  auto flag = [&out, strict](std::string message) {
    if (strict && out.violation.empty()) {
      out.violation = std::move(message);
    }
  };

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char ch = command[i];
    switch (state) {
    case State::Unquoted:
      if (ch == ' ') {
        if (in_word) {
          out.words.push_back(std::move(current));
          current.clear();
          in_word = false;
        }
      } else if (ch == '\'') {
        state = State::Single;
        in_word = true;
      } else if (ch == '"') {
        state = State::Double;
        in_word = true;
      } else if (ch == '\\') {
        if (i + 1 >= command.size()) {
          out.error = "dangling escape at end of command";
          return out;
        }
        const char next = command[++i];
        if (next != '\'') {
          flag("unexpected escape sequence outside quotes");
        }
        current.push_back(next);
        in_word = true;
      } else if (ch == '$') {
        if (i + 1 >= command.size() || command[i + 1] < '0' || command[i + 1] > '9') {
          flag("unquoted '$' not followed by a session number");
        }
        current.push_back(ch);
        in_word = true;
      } else {
        if (!is_plain_word_char(ch)) {
          flag(std::string("unquoted character '") + ch + "' is not permitted");
        }
        current.push_back(ch);
        in_word = true;
      }
      break;
    case State::Single:
      if (ch == '\'') {
        state = State::Unquoted;
      } else {
        current.push_back(ch);
      }
      break;
    case State::Double:
      if (ch == '"') {
        state = State::Unquoted;
      } else {
        if (ch == '$' || ch == '`' || ch == '\\') {
          flag(std::string("expansion character '") + ch + "' inside double quotes");
        }
        current.push_back(ch);
      }
      break;
    }
  }

  if (state != State::Unquoted) {
    out.error = "unterminated quote in command";
    return out;
  }
  if (in_word) {
    out.words.push_back(std::move(current));
  }
  return out;
}

common::Status check_template(const CommandTemplate &tmpl) {
  if (tmpl.operation.empty()) {
    return common::Status::error("template has an empty operation name");
  }
  const auto first_space = tmpl.shape.find(' ');
  if (tmpl.shape.substr(0, first_space) != tmpl.operation) {
    return common::Status::error("template '" + tmpl.operation +
                                 "' must start with its operation name");
  }
  if (tmpl.max_duration.count() <= 0) {
    return common::Status::error("template '" + tmpl.operation +
                                 "' needs a positive execution budget");
  }

  const auto placeholders = template_placeholders(tmpl.shape);
  if (!placeholders.ok()) {
    return common::Status::error("template '" + tmpl.operation + "': " + placeholders.error());
  }

  std::set<std::string> declared;
  for (const auto &param : tmpl.params) {
    if (!declared.insert(param.name).second) {
      return common::Status::error("template '" + tmpl.operation + "' declares '" + param.name +
                                   "' twice");
    }
    if (param.role == ParamRole::BoundedNumber && param.min > param.max) {
      return common::Status::error("template '" + tmpl.operation + "' parameter '" + param.name +
                                   "' has an empty range");
    }
    if (param.required && param.default_value.has_value()) {
      return common::Status::error("template '" + tmpl.operation + "' parameter '" + param.name +
                                   "' is required but has a default");
    }
    if (param.default_value.has_value()) {
      const auto check = validate_parameter(param, *param.default_value);
      if (!check.valid) {
        return common::Status::error("template '" + tmpl.operation + "' default for '" +
                                     param.name + "' is invalid: " + check.reason);
      }
    }
  }

  const std::set<std::string> used(placeholders.value().begin(), placeholders.value().end());
  if (used != declared) {
    return common::Status::error("template '" + tmpl.operation +
                                 "' placeholders do not match its declared parameters");
  }

  // Defaults and bound values alike must survive the pre-spawn check.
  ParamMap sample;
  for (const auto &param : tmpl.params) {
    if (param.default_value.has_value()) {
      continue;
    }
    switch (param.role) {
    case ParamRole::SessionName:
    case ParamRole::Target:
      sample[param.name] = "sample";
      break;
    case ParamRole::SessionId:
      sample[param.name] = "$0";
      break;
    case ParamRole::PaneId:
      sample[param.name] = "%0";
      break;
    case ParamRole::WindowId:
      sample[param.name] = "@0";
      break;
    case ParamRole::Command:
      sample[param.name] = escape_shell_word("sample");
      break;
    case ParamRole::BoundedNumber:
      sample[param.name] = std::to_string(param.min);
      break;
    }
  }
  const auto bound = bind_template(tmpl, sample);
  if (!bound.ok()) {
    return common::Status::error("template '" + tmpl.operation + "': " + bound.error());
  }
  const auto lexed = lex_command(bound.value(), true);
  if (!lexed.error.empty() || !lexed.violation.empty()) {
    return common::Status::error("template '" + tmpl.operation + "' does not produce a safe "
                                 "command: " +
                                 (lexed.error.empty() ? lexed.violation : lexed.error));
  }
  return common::Status::success();
}

ParamSpec required(std::string name, const ParamRole role) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.role = role;
  return spec;
}

} // namespace

std::string param_role_to_string(const ParamRole role) {
  switch (role) {
  case ParamRole::SessionName:
    return "session-name";
  case ParamRole::SessionId:
    return "session-id";
  case ParamRole::PaneId:
    return "pane-id";
  case ParamRole::WindowId:
    return "window-id";
  case ParamRole::Target:
    return "target";
  case ParamRole::Command:
    return "command";
  case ParamRole::BoundedNumber:
    return "number";
  }
  return "session-name";
}

const ParamSpec *CommandTemplate::find_param(const std::string_view name) const {
  const auto it = std::find_if(params.begin(), params.end(),
                               [name](const ParamSpec &spec) { return spec.name == name; });
  return it == params.end() ? nullptr : &*it;
}

std::vector<std::string> CommandTemplate::required_params() const {
  std::vector<std::string> names;
  for (const auto &param : params) {
    if (param.required) {
      names.push_back(param.name);
    }
  }
  return names;
}

std::vector<std::string> CommandTemplate::optional_params() const {
  std::vector<std::string> names;
  for (const auto &param : params) {
    if (!param.required) {
      names.push_back(param.name);
    }
  }
  return names;
}

bool CommandTemplate::accepts_free_form() const {
  return std::any_of(params.begin(), params.end(),
                     [](const ParamSpec &spec) { return spec.role == ParamRole::Command; });
}

ValidationResult validate_parameter(const ParamSpec &spec, const std::string_view value) {
  switch (spec.role) {
  case ParamRole::SessionName:
    return validate_session_name(value);
  case ParamRole::SessionId:
    return validate_session_id(value);
  case ParamRole::PaneId:
    return validate_pane_id(value);
  case ParamRole::WindowId:
    return validate_window_id(value);
  case ParamRole::Target:
    return validate_target(value);
  case ParamRole::Command:
    return validate_command_text(value);
  case ParamRole::BoundedNumber:
    return validate_bounded_number(value, spec.min, spec.max);
  }
  return ValidationResult::reject(ValidationIssue::FormatMismatch, "unknown parameter role",
                                  RiskTier::High);
}

common::Result<std::vector<std::string>> template_placeholders(const std::string_view shape) {
  std::vector<std::string> names;
  std::size_t depth = 0;
  for (std::size_t i = 0; i < shape.size(); ++i) {
    const char ch = shape[i];
    if (ch == '{') {
      if (i > 0 && shape[i - 1] == '#') {
        ++depth;
        continue;
      }
      if (depth > 0) {
        return common::Result<std::vector<std::string>>::failure(
            "placeholder nested inside a tmux format");
      }
      const auto close = shape.find('}', i + 1);
      if (close == std::string_view::npos) {
        return common::Result<std::vector<std::string>>::failure("unterminated placeholder");
      }
      const std::string_view name = shape.substr(i + 1, close - i - 1);
      if (name.empty() || !std::all_of(name.begin(), name.end(), is_placeholder_char)) {
        return common::Result<std::vector<std::string>>::failure("malformed placeholder");
      }
      names.emplace_back(name);
      i = close;
    } else if (ch == '}') {
      if (depth == 0) {
        return common::Result<std::vector<std::string>>::failure("unbalanced '}'");
      }
      --depth;
    }
  }
  if (depth != 0) {
    return common::Result<std::vector<std::string>>::failure("unterminated tmux format");
  }
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

common::Result<std::string> bind_template(const CommandTemplate &tmpl, const ParamMap &sanitized) {
  std::string out;
  out.reserve(tmpl.shape.size() + 32);
  const std::string &shape = tmpl.shape;
  for (std::size_t i = 0; i < shape.size(); ++i) {
    const char ch = shape[i];
    if (ch != '{' || (i > 0 && shape[i - 1] == '#')) {
      out.push_back(ch);
      continue;
    }
    const auto close = shape.find('}', i + 1);
    if (close == std::string::npos) {
      return common::Result<std::string>::failure("unterminated placeholder");
    }
    const std::string name = shape.substr(i + 1, close - i - 1);
    const auto it = sanitized.find(name);
    if (it != sanitized.end()) {
      out += it->second;
    } else if (const auto *spec = tmpl.find_param(name);
               spec != nullptr && spec->default_value.has_value()) {
      out += *spec->default_value;
    } else {
      return common::Result<std::string>::failure("no value bound for placeholder '" + name + "'");
    }
    i = close;
  }
  return common::Result<std::string>::success(std::move(out));
}

common::Result<std::vector<std::string>> split_command_words(const std::string_view command) {
  auto lexed = lex_command(command, false);
  if (!lexed.error.empty()) {
    return common::Result<std::vector<std::string>>::failure(lexed.error);
  }
  return common::Result<std::vector<std::string>>::success(std::move(lexed.words));
}

common::Result<TemplateRegistry> TemplateRegistry::create(std::vector<CommandTemplate> templates) {
  TemplateRegistry registry;
  for (auto &tmpl : templates) {
    if (const auto status = check_template(tmpl); !status.ok()) {
      return common::Result<TemplateRegistry>::failure(status.error());
    }
    const std::string key = tmpl.operation;
    if (!registry.templates_.emplace(key, std::move(tmpl)).second) {
      return common::Result<TemplateRegistry>::failure("duplicate template for operation '" + key +
                                                       "'");
    }
  }
  if (registry.templates_.empty()) {
    return common::Result<TemplateRegistry>::failure("template table is empty");
  }
  return common::Result<TemplateRegistry>::success(std::move(registry));
}

common::Result<TemplateRegistry> TemplateRegistry::builtin() { return create(builtin_templates()); }

const CommandTemplate *TemplateRegistry::find(const std::string_view operation) const {
  const auto it = templates_.find(operation);
  return it == templates_.end() ? nullptr : &it->second;
}

bool TemplateRegistry::contains(const std::string_view operation) const {
  return find(operation) != nullptr;
}

std::vector<std::string> TemplateRegistry::operation_names() const {
  std::vector<std::string> names;
  names.reserve(templates_.size());
  for (const auto &[name, tmpl] : templates_) {
    names.push_back(name);
  }
  return names;
}

std::vector<std::string> TemplateRegistry::free_form_operations() const {
  std::vector<std::string> names;
  for (const auto &[name, tmpl] : templates_) {
    if (tmpl.accepts_free_form()) {
      names.push_back(name);
    }
  }
  return names;
}

ValidationResult TemplateRegistry::revalidate(const std::string_view command,
                                              const CommandTemplate &expected) const {
  if (contains_null_byte(command)) {
    return ValidationResult::reject(ValidationIssue::NullByte, "Composed command contains null bytes",
                                    RiskTier::Critical);
  }
  if (contains_control_character(command)) {
    return ValidationResult::reject(ValidationIssue::ControlCharacter,
                                    "Composed command contains control characters",
                                    RiskTier::Critical);
  }

  const auto lexed = lex_command(command, true);
  if (!lexed.error.empty()) {
    return ValidationResult::reject(ValidationIssue::FormatMismatch,
                                    "Composed command is malformed: " + lexed.error,
                                    RiskTier::Critical);
  }
  if (lexed.words.empty()) {
    return ValidationResult::reject(ValidationIssue::Empty, "Composed command is empty",
                                    RiskTier::Critical);
  }

  const std::string &name = lexed.words.front();
  if (!contains(name)) {
    return ValidationResult::reject(ValidationIssue::FormatMismatch,
                                    "Tmux command '" + name + "' is not in the allowed whitelist",
                                    RiskTier::Critical);
  }
  if (name != expected.operation) {
    return ValidationResult::reject(ValidationIssue::FormatMismatch,
                                    "Composed command '" + name + "' does not match operation '" +
                                        expected.operation + "'",
                                    RiskTier::Critical);
  }
  if (!lexed.violation.empty()) {
    return ValidationResult::reject(ValidationIssue::ShellMetacharacter,
                                    "Composed command failed re-validation: " + lexed.violation,
                                    RiskTier::Critical);
  }
  return ValidationResult::accept(std::string(command));
}

std::vector<CommandTemplate> builtin_templates() {
  using std::chrono::milliseconds;

  ParamSpec lines;
  lines.name = "lines";
  lines.role = ParamRole::BoundedNumber;
  lines.required = false;
  lines.min = 1;
  lines.max = 10'000;
  lines.default_value = "100";

  return {
      {"start-server", "start-server", {}, milliseconds(5'000), RiskTier::Low},
      {"new-session",
       R"(new-session -d -s {sessionName} -P -F "#{session_id}")",
       {required("sessionName", ParamRole::SessionName)},
       milliseconds(10'000),
       RiskTier::Medium},
      {"kill-session",
       "kill-session -t {sessionId}",
       {required("sessionId", ParamRole::SessionId)},
       milliseconds(5'000),
       RiskTier::High},
      {"list-sessions",
       R"(list-sessions -F "#{session_id}:#{session_name}:#{session_created}:#{session_attached}")",
       {},
       milliseconds(3'000),
       RiskTier::Low},
      {"list-windows",
       R"(list-windows -t {sessionId} -F "#{window_id}:#{window_index}:#{window_name}:#{window_active}")",
       {required("sessionId", ParamRole::SessionId)},
       milliseconds(3'000),
       RiskTier::Low},
      {"list-panes",
       R"(list-panes -t {windowId} -F "#{pane_id}:#{pane_index}:#{pane_active}:#{pane_width}:#{pane_height}:#{pane_current_command}:#{pane_pid}")",
       {required("windowId", ParamRole::WindowId)},
       milliseconds(3'000),
       RiskTier::Low},
      {"send-keys",
       "send-keys -t {target} {command} Enter",
       {required("target", ParamRole::Target), required("command", ParamRole::Command)},
       milliseconds(1'000),
       RiskTier::High},
      {"capture-pane",
       "capture-pane -t {target} -p -S -{lines}",
       {required("target", ParamRole::Target), lines},
       milliseconds(5'000),
       RiskTier::Medium},
      {"pipe-pane",
       "pipe-pane -t {target} -o cat",
       {required("target", ParamRole::Target)},
       milliseconds(2'000),
       RiskTier::High},
  };
}

} // namespace paneguard::security
