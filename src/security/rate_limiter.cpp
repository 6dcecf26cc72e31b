#include "paneguard/security/rate_limiter.hpp"

#include <algorithm>

namespace paneguard::security {

bool SourceIdentity::empty() const {
  return !session_id.has_value() && !client_address.has_value() && !user_id.has_value();
}

std::string SourceIdentity::key() const {
  if (client_address.has_value() && !client_address->empty()) {
    return *client_address;
  }
  if (user_id.has_value() && !user_id->empty()) {
    return *user_id;
  }
  if (session_id.has_value() && !session_id->empty()) {
    return *session_id;
  }
  return "unknown";
}

RateLimiter::RateLimiter(const config::RateLimitConfig &config)
    : window_(static_cast<std::chrono::milliseconds::rep>(config.window_ms)),
      block_duration_(static_cast<std::chrono::milliseconds::rep>(config.block_duration_ms)),
      max_requests_(std::max<std::size_t>(1, config.max_requests)),
      max_sources_(std::max<std::size_t>(1, config.max_tracked_sources)) {}

void RateLimiter::prune_locked(Window &window, const Clock::time_point now) const {
  const auto cutoff = now - window_;
  while (window.size > 0 && window.ring[window.head] <= cutoff) {
    window.head = (window.head + 1) % window.ring.size();
    --window.size;
  }
}

RateLimiter::Window &RateLimiter::touch_locked(const std::string &key) {
  auto it = windows_.find(key);
  if (it != windows_.end()) {
    lru_.splice(lru_.begin(), lru_, it->second.lru);
    return it->second;
  }
  lru_.push_front(key);
  Window window;
  window.ring.resize(max_requests_);
  window.lru = lru_.begin();
  return windows_.emplace(key, std::move(window)).first->second;
}

void RateLimiter::evict_locked(const Clock::time_point now) {
  // Walk from the cold end; a blocked source keeps its slot until it expires.
  auto it = lru_.end();
  while (windows_.size() > max_sources_ && it != lru_.begin()) {
    --it;
    const auto found = windows_.find(*it);
    if (found != windows_.end() && found->second.blocked_until.has_value() &&
        *found->second.blocked_until > now) {
      continue;
    }
    if (found != windows_.end()) {
      windows_.erase(found);
    }
    it = lru_.erase(it);
  }
}

RateCheck RateLimiter::check_and_record(const SourceIdentity &source) {
  return check_and_record_at(source, Clock::now());
}

RateCheck RateLimiter::check_and_record_at(const SourceIdentity &source,
                                           const Clock::time_point now) {
  RateCheck result;
  result.source_key = source.key();

  std::lock_guard<std::mutex> lock(mutex_);
  auto &window = touch_locked(result.source_key);

  if (window.blocked_until.has_value()) {
    if (*window.blocked_until > now) {
      result.decision = RateDecision::Blocked;
      result.blocked_until = window.blocked_until;
      result.window_count = window.size;
      return result;
    }
    window.blocked_until.reset();
    window.head = 0;
    window.size = 0;
  }

  prune_locked(window, now);
  if (window.size >= max_requests_) {
    const auto until = now + block_duration_;
    window.blocked_until = std::max(until, window.blocked_until.value_or(until));
    result.decision = RateDecision::QuotaExceeded;
    result.blocked_until = window.blocked_until;
    result.window_count = window.size;
    return result;
  }

  window.ring[(window.head + window.size) % window.ring.size()] = now;
  ++window.size;
  result.window_count = window.size;
  evict_locked(now);
  return result;
}

bool RateLimiter::is_blocked_at(const std::string &source_key, const Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = windows_.find(source_key);
  return it != windows_.end() && it->second.blocked_until.has_value() &&
         *it->second.blocked_until > now;
}

std::size_t RateLimiter::window_count_at(const std::string &source_key,
                                         const Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = windows_.find(source_key);
  if (it == windows_.end()) {
    return 0;
  }
  prune_locked(it->second, now);
  return it->second.size;
}

std::size_t RateLimiter::blocked_sources_at(const Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(windows_.begin(), windows_.end(), [now](const auto &entry) {
        return entry.second.blocked_until.has_value() && *entry.second.blocked_until > now;
      }));
}

std::size_t RateLimiter::blocked_sources() { return blocked_sources_at(Clock::now()); }

std::size_t RateLimiter::tracked_sources() {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.size();
}

ConcurrencyGate::ConcurrencyGate(const std::uint32_t limit) : limit_(limit) {}

ConcurrencyGate::Permit ConcurrencyGate::try_acquire() {
  std::uint32_t current = in_flight_.load();
  while (current < limit_) {
    if (in_flight_.compare_exchange_weak(current, current + 1)) {
      std::uint32_t seen = peak_.load();
      while (current + 1 > seen && !peak_.compare_exchange_weak(seen, current + 1)) {
      }
      return Permit(this);
    }
  }
  return Permit();
}

void ConcurrencyGate::release_one() { in_flight_.fetch_sub(1); }

ConcurrencyGate::Permit::~Permit() { release(); }

ConcurrencyGate::Permit::Permit(Permit &&other) noexcept : gate_(other.gate_) {
  other.gate_ = nullptr;
}

ConcurrencyGate::Permit &ConcurrencyGate::Permit::operator=(Permit &&other) noexcept {
  if (this != &other) {
    release();
    gate_ = other.gate_;
    other.gate_ = nullptr;
  }
  return *this;
}

void ConcurrencyGate::Permit::release() {
  if (gate_ != nullptr) {
    gate_->release_one();
    gate_ = nullptr;
  }
}

} // namespace paneguard::security
