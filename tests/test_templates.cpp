#include "test_framework.hpp"

#include "paneguard/security/templates.hpp"

#include <algorithm>
#include <set>

namespace {

using paneguard::security::CommandTemplate;
using paneguard::security::ParamRole;
using paneguard::security::ParamSpec;
using paneguard::security::RiskTier;

ParamSpec param(std::string name, const ParamRole role) {
  ParamSpec spec;
  spec.name = std::move(name);
  spec.role = role;
  return spec;
}

CommandTemplate simple(std::string operation, std::string shape, std::vector<ParamSpec> params) {
  CommandTemplate tmpl;
  tmpl.operation = std::move(operation);
  tmpl.shape = std::move(shape);
  tmpl.params = std::move(params);
  tmpl.max_duration = std::chrono::milliseconds(1'000);
  tmpl.risk = RiskTier::Low;
  return tmpl;
}

} // namespace

void register_templates_tests(std::vector<paneguard::tests::TestCase> &tests) {
  using paneguard::tests::require;
  namespace sec = paneguard::security;

  tests.push_back({"templates_builtin_table_is_the_allow_list", [] {
                     auto registry = sec::TemplateRegistry::builtin();
                     require(registry.ok(), registry.error());
                     const auto names = registry.value().operation_names();
                     const std::set<std::string> expected{
                         "start-server",  "new-session", "kill-session",
                         "list-sessions", "list-windows", "list-panes",
                         "send-keys",     "capture-pane", "pipe-pane"};
                     require(std::set<std::string>(names.begin(), names.end()) == expected,
                             "allow-list must match the closed operation set");
                     require(!registry.value().contains("kill-server"), "kill-server not allowed");
                     require(registry.value().find("run-shell") == nullptr, "run-shell not allowed");
                   }});

  tests.push_back({"templates_builtin_budgets_and_risk", [] {
                     auto registry = sec::TemplateRegistry::builtin();
                     require(registry.ok(), registry.error());
                     const auto &r = registry.value();
                     require(r.find("kill-session")->risk == RiskTier::High, "kill is high");
                     require(r.find("list-sessions")->risk == RiskTier::Low, "listing is low");
                     require(r.find("new-session")->max_duration.count() == 10'000, "new budget");
                     require(r.find("send-keys")->max_duration.count() == 1'000, "send budget");
                     const auto *capture = r.find("capture-pane");
                     require(capture->required_params() == std::vector<std::string>{"target"},
                             "capture requires target");
                     require(capture->optional_params() == std::vector<std::string>{"lines"},
                             "capture takes optional lines");
                   }});

  tests.push_back({"templates_only_send_keys_takes_free_form_text", [] {
                     auto registry = sec::TemplateRegistry::builtin();
                     require(registry.ok(), registry.error());
                     require(registry.value().free_form_operations() ==
                                 std::vector<std::string>{"send-keys"},
                             "free-form set");
                   }});

  tests.push_back({"templates_placeholders_skip_tmux_formats", [] {
                     const auto names = sec::template_placeholders(
                         R"(list-windows -t {sessionId} -F "#{window_id}:#{window_name}")");
                     require(names.ok(), names.error());
                     require(names.value() == std::vector<std::string>{"sessionId"}, "one placeholder");
                     require(!sec::template_placeholders("x {unterminated").ok(), "unterminated");
                     require(!sec::template_placeholders("x {bad name}").ok(), "malformed");
                     require(!sec::template_placeholders("x }").ok(), "stray close");
                   }});

  tests.push_back({"templates_binding_is_single_pass", [] {
                     auto tmpl = simple("send-keys", "send-keys -t {target} {command} Enter",
                                        {param("target", ParamRole::Target),
                                         param("command", ParamRole::Command)});
                     const auto bound =
                         sec::bind_template(tmpl, {{"target", "dev"}, {"command", "'{target}'"}});
                     require(bound.ok(), bound.error());
                     require(bound.value() == "send-keys -t dev '{target}' Enter",
                             "substituted text is not rescanned: " + bound.value());
                     require(!sec::bind_template(tmpl, {{"target", "dev"}}).ok(), "unbound fails");
                   }});

  tests.push_back({"templates_binding_uses_defaults", [] {
                     auto registry = sec::TemplateRegistry::builtin();
                     require(registry.ok(), registry.error());
                     const auto *capture = registry.value().find("capture-pane");
                     const auto bound = sec::bind_template(*capture, {{"target", "%1"}});
                     require(bound.ok(), bound.error());
                     require(bound.value() == "capture-pane -t %1 -p -S -100", bound.value());
                   }});

  tests.push_back({"templates_create_rejects_malformed_tables", [] {
                     auto mismatch = sec::TemplateRegistry::create(
                         {simple("kill-session", "kill-session -t {sessionId}", {})});
                     require(!mismatch.ok(), "placeholder without parameter");

                     auto extra = sec::TemplateRegistry::create({simple(
                         "kill-session", "kill-session", {param("sessionId", ParamRole::SessionId)})});
                     require(!extra.ok(), "parameter without placeholder");

                     auto wrong_head = sec::TemplateRegistry::create(
                         {simple("kill-session", "kill-server", {})});
                     require(!wrong_head.ok(), "shape must start with operation");

                     auto duplicate = sec::TemplateRegistry::create(
                         {simple("start-server", "start-server", {}),
                          simple("start-server", "start-server", {})});
                     require(!duplicate.ok(), "duplicate operation");

                     auto zero_budget = simple("start-server", "start-server", {});
                     zero_budget.max_duration = std::chrono::milliseconds(0);
                     require(!sec::TemplateRegistry::create({zero_budget}).ok(), "zero budget");

                     auto unsafe = sec::TemplateRegistry::create(
                         {simple("run-shell", "run-shell {cmd} ; rm -rf /",
                                 {param("cmd", ParamRole::Command)})});
                     require(!unsafe.ok(), "table that composes unsafe commands is rejected");

                     require(!sec::TemplateRegistry::create({}).ok(), "empty table");
                   }});

  tests.push_back({"templates_custom_registry_for_isolated_tests", [] {
                     auto registry = sec::TemplateRegistry::create(
                         {simple("display-message", "display-message -t {target} -p ok",
                                 {param("target", ParamRole::Target)})});
                     require(registry.ok(), registry.error());
                     require(registry.value().size() == 1, "one template");
                     require(registry.value().contains("display-message"), "custom op present");
                   }});

  tests.push_back({"templates_revalidate_accepts_bound_commands", [] {
                     auto registry = sec::TemplateRegistry::builtin();
                     require(registry.ok(), registry.error());
                     const auto &r = registry.value();
                     const auto ok = r.revalidate(R"(new-session -d -s dev-box -P -F "#{session_id}")",
                                                  *r.find("new-session"));
                     require(ok.valid, ok.reason);
                     const auto escaped = r.revalidate(R"(send-keys -t $1 'it'\''s; rm' Enter)",
                                                       *r.find("send-keys"));
                     require(escaped.valid, escaped.reason);
                   }});

  tests.push_back({"templates_revalidate_rejects_tampering", [] {
                     auto registry = sec::TemplateRegistry::builtin();
                     require(registry.ok(), registry.error());
                     const auto &r = registry.value();
                     const auto *send = r.find("send-keys");
                     const char *bad[] = {
                         "send-keys -t dev ls; rm -rf / Enter",
                         "send-keys -t dev $(id) Enter",
                         "send-keys -t dev \"$HOME\" Enter",
                         "send-keys -t dev 'unterminated Enter",
                         "send-keys -t {target} 'x' Enter",
                         "send-keys -t dev `id` Enter",
                         "kill-server",
                         "list-sessions",
                     };
                     for (const char *command : bad) {
                       const auto result = r.revalidate(command, *send);
                       require(!result.valid, std::string("accepted: ") + command);
                       require(result.risk == RiskTier::Critical, "final check is critical");
                     }
                     require(!r.revalidate(std::string("send-keys -t dev 'a\nb' Enter"), *send).valid,
                             "control characters rejected");
                   }});

  tests.push_back({"templates_split_words_without_expansion", [] {
                     const auto words = sec::split_command_words(
                         R"(send-keys -t dev 'a'\''b $HOME' Enter)");
                     require(words.ok(), words.error());
                     require(words.value() ==
                                 std::vector<std::string>{"send-keys", "-t", "dev", "a'b $HOME",
                                                          "Enter"},
                             "argv words");
                     const auto format = sec::split_command_words(R"(list-sessions -F "#{a}:#{b}")");
                     require(format.ok(), format.error());
                     require(format.value().back() == "#{a}:#{b}", "double quotes removed");
                     require(!sec::split_command_words("a 'b").ok(), "unterminated quote");
                   }});
}
