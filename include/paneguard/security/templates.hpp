#pragma once

#include "paneguard/common/result.hpp"
#include "paneguard/security/risk.hpp"
#include "paneguard/security/validator.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paneguard::security {

/// Semantic role of a template parameter; selects the validation rule.
enum class ParamRole : std::uint8_t {
  SessionName,
  SessionId,
  PaneId,
  WindowId,
  Target,
  Command,
  BoundedNumber,
};

[[nodiscard]] std::string param_role_to_string(ParamRole role);

struct ParamSpec {
  std::string name;
  ParamRole role = ParamRole::SessionName;
  bool required = true;
  std::int64_t min = 0;
  std::int64_t max = 0;
  std::optional<std::string> default_value;
};

struct CommandTemplate {
  std::string operation;
  std::string shape;
  std::vector<ParamSpec> params;
  std::chrono::milliseconds max_duration{5'000};
  RiskTier risk = RiskTier::Low;

  [[nodiscard]] const ParamSpec *find_param(std::string_view name) const;
  [[nodiscard]] std::vector<std::string> required_params() const;
  [[nodiscard]] std::vector<std::string> optional_params() const;
  [[nodiscard]] bool accepts_free_form() const;
};

using ParamMap = std::map<std::string, std::string>;

[[nodiscard]] ValidationResult validate_parameter(const ParamSpec &spec, std::string_view value);

/// Placeholder names in a template shape. `{name}` is a placeholder; `#{...}`
/// is a literal tmux format. Unbalanced braces fail.
[[nodiscard]] common::Result<std::vector<std::string>> template_placeholders(std::string_view shape);

/// Single-pass literal substitution of already-sanitized values. Optional
/// parameters fall back to their default. Substituted text is never rescanned.
[[nodiscard]] common::Result<std::string> bind_template(const CommandTemplate &tmpl,
                                                        const ParamMap &sanitized);

/// Splits a composed command into argv words. Understands single quotes,
/// double quotes and backslash escapes; performs no expansion of any kind.
[[nodiscard]] common::Result<std::vector<std::string>> split_command_words(std::string_view command);

/// The closed table of permitted operations. Built once, read-only after.
class TemplateRegistry {
public:
  [[nodiscard]] static common::Result<TemplateRegistry> create(std::vector<CommandTemplate> templates);
  [[nodiscard]] static common::Result<TemplateRegistry> builtin();

  [[nodiscard]] const CommandTemplate *find(std::string_view operation) const;
  [[nodiscard]] bool contains(std::string_view operation) const;
  [[nodiscard]] std::vector<std::string> operation_names() const;
  [[nodiscard]] std::vector<std::string> free_form_operations() const;
  [[nodiscard]] std::size_t size() const { return templates_.size(); }

  /// Checks a fully bound command just before it leaves the process: it must
  /// lex cleanly, name `expected` as its first word, keep unquoted text to a
  /// narrow charset and carry no expansion syntax inside double quotes.
  [[nodiscard]] ValidationResult revalidate(std::string_view command,
                                            const CommandTemplate &expected) const;

private:
  TemplateRegistry() = default;

  std::map<std::string, CommandTemplate, std::less<>> templates_;
};

[[nodiscard]] std::vector<CommandTemplate> builtin_templates();

} // namespace paneguard::security
