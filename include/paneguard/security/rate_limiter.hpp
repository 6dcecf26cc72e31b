#pragma once

#include "paneguard/config/schema.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace paneguard::security {

/// Caller provenance. Used for rate accounting and audit attribution only.
struct SourceIdentity {
  std::optional<std::string> session_id;
  std::optional<std::string> client_address;
  std::optional<std::string> user_id;

  [[nodiscard]] bool empty() const;
  /// Accounting bucket: client address, then user id, then session id,
  /// then a shared "unknown" bucket.
  [[nodiscard]] std::string key() const;
};

enum class RateDecision : std::uint8_t { Allowed, Blocked, QuotaExceeded };

struct RateCheck {
  RateDecision decision = RateDecision::Allowed;
  std::string source_key;
  std::size_t window_count = 0;
  std::optional<std::chrono::steady_clock::time_point> blocked_until;

  [[nodiscard]] bool allowed() const { return decision == RateDecision::Allowed; }
};

/// Per-source sliding window over a fixed-capacity ring of timestamps. The
/// number of tracked sources is capped; the least recently seen source that
/// is not currently blocked is evicted first.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(const config::RateLimitConfig &config);

  [[nodiscard]] RateCheck check_and_record(const SourceIdentity &source);
  [[nodiscard]] RateCheck check_and_record_at(const SourceIdentity &source, Clock::time_point now);

  [[nodiscard]] bool is_blocked_at(const std::string &source_key, Clock::time_point now);
  [[nodiscard]] std::size_t window_count_at(const std::string &source_key, Clock::time_point now);
  [[nodiscard]] std::size_t blocked_sources_at(Clock::time_point now);
  [[nodiscard]] std::size_t blocked_sources();
  [[nodiscard]] std::size_t tracked_sources();

private:
  struct Window {
    std::vector<Clock::time_point> ring;
    std::size_t head = 0;
    std::size_t size = 0;
    std::optional<Clock::time_point> blocked_until;
    std::list<std::string>::iterator lru;
  };

  void prune_locked(Window &window, Clock::time_point now) const;
  Window &touch_locked(const std::string &key);
  void evict_locked(Clock::time_point now);

  std::mutex mutex_;
  std::unordered_map<std::string, Window> windows_;
  std::list<std::string> lru_;
  std::chrono::milliseconds window_;
  std::chrono::milliseconds block_duration_;
  std::size_t max_requests_;
  std::size_t max_sources_;
};

/// Global ceiling on in-flight executions.
class ConcurrencyGate {
public:
  class Permit {
  public:
    Permit() = default;
    ~Permit();
    Permit(Permit &&other) noexcept;
    Permit &operator=(Permit &&other) noexcept;
    Permit(const Permit &) = delete;
    Permit &operator=(const Permit &) = delete;

    [[nodiscard]] explicit operator bool() const { return gate_ != nullptr; }
    void release();

  private:
    friend class ConcurrencyGate;
    explicit Permit(ConcurrencyGate *gate) : gate_(gate) {}

    ConcurrencyGate *gate_ = nullptr;
  };

  explicit ConcurrencyGate(std::uint32_t limit);

  /// Empty permit when the ceiling is reached.
  [[nodiscard]] Permit try_acquire();

  [[nodiscard]] std::uint32_t limit() const { return limit_; }
  [[nodiscard]] std::uint32_t in_flight() const { return in_flight_.load(); }
  [[nodiscard]] std::uint32_t peak() const { return peak_.load(); }

private:
  void release_one();

  std::uint32_t limit_;
  std::atomic<std::uint32_t> in_flight_{0};
  std::atomic<std::uint32_t> peak_{0};
};

} // namespace paneguard::security
