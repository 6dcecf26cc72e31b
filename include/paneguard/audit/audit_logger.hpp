#pragma once

#include "paneguard/audit/event.hpp"
#include "paneguard/common/result.hpp"
#include "paneguard/config/schema.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace paneguard::audit {

inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

[[nodiscard]] std::string sha256_hex(std::string_view text);

/// The fields a summary needs; extracted from live events or parsed back
/// from segment lines.
struct SummaryRecord {
  std::chrono::system_clock::time_point timestamp;
  EventType type = EventType::SuspiciousActivity;
  Severity severity = Severity::Info;
  Outcome outcome = Outcome::Success;
  int risk_score = 1;
};

struct AuditSummary {
  std::size_t total_events = 0;
  std::size_t critical_events = 0;
  std::size_t blocked_events = 0;
  std::vector<std::pair<std::string, std::size_t>> top_event_types;
};

[[nodiscard]] SummaryRecord summary_record(const SecurityEvent &event);
[[nodiscard]] common::Result<SummaryRecord> parse_summary_record(const std::string &line);

/// Critical here means critical severity or a risk score of 8 and above.
[[nodiscard]] AuditSummary summarize(const std::vector<SummaryRecord> &records,
                                     std::chrono::system_clock::time_point now,
                                     std::chrono::milliseconds window, std::size_t top_n = 5);

[[nodiscard]] std::string summary_to_json(const AuditSummary &summary);

/// Active and rotated segments for `prefix` in `directory`, oldest first.
[[nodiscard]] std::vector<std::filesystem::path> list_segments(const std::filesystem::path &directory,
                                                              const std::string &prefix);

[[nodiscard]] common::Result<std::vector<SummaryRecord>>
load_summary_records(const std::filesystem::path &directory, const std::string &prefix);

struct SegmentVerification {
  bool intact = true;
  std::size_t lines = 0;
  std::uint64_t first_seq = 0;
  std::uint64_t last_seq = 0;
  std::string anchor_hash;
  std::string last_hash;
  std::size_t broken_line = 0;
  std::string problem;
};

/// Recomputes the hash chain of one segment. The first line's prev_hash is
/// reported as the anchor linking it to the preceding segment.
[[nodiscard]] common::Result<SegmentVerification> verify_segment(const std::filesystem::path &path);

struct AuditStats {
  std::uint64_t recorded = 0;
  std::uint64_t written = 0;
  std::uint64_t filtered = 0;
  std::uint64_t dropped = 0;
  std::uint64_t write_failures = 0;
  std::uint64_t rotations = 0;
  std::size_t queue_depth = 0;
};

/// Buffered, rotated, hash-chained audit sink. record() never blocks on I/O:
/// a background worker drains a bounded queue on a timer, on reaching the
/// flush threshold, or at once for urgent events.
class AuditLogger {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<AuditLogger>>
  create(const config::AuditConfig &config);

  class ConstructionTag {
    friend class AuditLogger;
    ConstructionTag() = default;
  };

  AuditLogger(ConstructionTag tag, config::AuditConfig config, std::filesystem::path directory,
              Severity min_level);
  ~AuditLogger();
  AuditLogger(const AuditLogger &) = delete;
  AuditLogger &operator=(const AuditLogger &) = delete;

  void record(SecurityEvent event);

  /// Blocks until every event recorded before the call has been written.
  /// Events dropped on a full queue are written as one audit_log_tamper
  /// line carrying lost_events ahead of the next batch.
  void flush();

  /// Emits security_shutdown, drains, and stops the worker. Idempotent.
  void shutdown();

  /// Covers the most recent events written to the trail, so events below
  /// the configured log level are not counted.
  [[nodiscard]] AuditSummary summary(std::chrono::milliseconds window,
                                     std::size_t top_n = 5) const;
  [[nodiscard]] AuditStats stats() const;
  [[nodiscard]] std::filesystem::path active_segment() const;
  [[nodiscard]] std::vector<std::filesystem::path> segments() const;
  [[nodiscard]] const std::filesystem::path &directory() const { return directory_; }

private:
  void worker_loop();
  void write_batch(std::deque<SecurityEvent> batch);
  common::Status rotate_locked();
  common::Status open_new_segment_locked();
  void recover_chain();
  void report_write_failure(const std::vector<std::string> &lines, const std::string &message);
  void remember(const SecurityEvent &event);

  config::AuditConfig config_;
  std::filesystem::path directory_;
  Severity min_level_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable flushed_cv_;
  std::deque<SecurityEvent> queue_;
  std::uint64_t lost_pending_ = 0;
  bool urgent_ = false;
  bool stopping_ = false;
  bool worker_done_ = false;
  std::uint64_t flush_requested_ = 0;
  std::uint64_t flush_completed_ = 0;

  mutable std::mutex file_mutex_;
  std::filesystem::path active_path_;
  std::uint64_t active_bytes_ = 0;
  std::uint64_t segment_counter_ = 0;
  std::uint64_t next_seq_ = 1;
  std::string last_hash_;
  std::deque<SecurityEvent> pending_tamper_;

  mutable std::mutex summary_mutex_;
  std::deque<SummaryRecord> recent_;

  std::atomic<std::uint64_t> recorded_{0};
  std::atomic<std::uint64_t> written_{0};
  std::atomic<std::uint64_t> filtered_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> write_failures_{0};
  std::atomic<std::uint64_t> rotations_{0};

  std::once_flag shutdown_once_;
  std::thread worker_;
};

} // namespace paneguard::audit
