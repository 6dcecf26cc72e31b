#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace paneguard::config {

struct TmuxConfig {
  std::string binary = "tmux";
  std::string socket_path = "/tmp/paneguard/default.sock";
};

struct RateLimitConfig {
  std::uint64_t window_ms = 60'000;
  std::uint32_t max_requests = 100;
  std::uint64_t block_duration_ms = 300'000;
  std::size_t max_tracked_sources = 10'000;
};

struct ExecutionConfig {
  std::uint32_t max_concurrent_commands = 10;
  std::uint64_t command_timeout_ms = 30'000;
  std::size_t max_output_bytes = 1024 * 1024;
};

struct AuditConfig {
  std::string directory = "~/.paneguard/audit";
  std::string file_prefix = "paneguard-audit";
  std::string log_level = "info";
  std::uint64_t max_segment_bytes = 100ULL * 1024 * 1024;
  std::uint32_t rotation_count = 10;
  std::uint64_t flush_interval_ms = 5'000;
  std::size_t flush_threshold = 1'000;
  std::size_t queue_capacity = 10'000;
  std::size_t summary_capacity = 10'000;
  bool console_output = false;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  TmuxConfig tmux;
  RateLimitConfig rate_limit;
  ExecutionConfig execution;
  AuditConfig audit;
  ObservabilityConfig observability;
};

} // namespace paneguard::config
