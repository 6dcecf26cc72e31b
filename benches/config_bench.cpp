#include "bench_common.hpp"

#include "paneguard/config/config.hpp"

void run_config_benchmark() {
  paneguard::bench::run_bench("config_validate", 2000, [] {
    paneguard::config::Config config;
    (void)paneguard::config::validate_config(config);
  });

  paneguard::bench::run_bench("config_parse", 2000, [] {
    (void)paneguard::config::parse_config("[rate_limit]\nmax_requests = 50\n"
                                          "[audit]\nlog_level = \"high\"\n");
  });
}
