#include "paneguard/audit/audit_logger.hpp"

#include "paneguard/common/fs.hpp"
#include "paneguard/common/json_util.hpp"
#include "paneguard/observability/global.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace paneguard::audit {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kHashMarker = ",\"hash\":\"";
constexpr std::string_view kPrevHashMarker = ",\"prev_hash\":\"";
constexpr std::string_view kSeqMarker = ",\"seq\":";
constexpr std::size_t kMaxPendingTamperEvents = 16;

std::string segment_timestamp(const std::chrono::system_clock::time_point when) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
  const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y%m%dT%H%M%S") << std::setw(3) << std::setfill('0')
      << (millis % 1000) << 'Z';
  return out.str();
}

fs::path backup_path(const fs::path &directory, const std::string &prefix, const std::uint32_t n) {
  return directory / (prefix + ".log." + std::to_string(n));
}

bool is_active_segment(const std::string &name, const std::string &prefix) {
  return common::starts_with(name, prefix + "-") && name.size() > prefix.size() + 5 &&
         name.compare(name.size() - 4, 4, ".log") == 0;
}

std::vector<fs::path> active_segments(const fs::path &directory, const std::string &prefix) {
  std::vector<fs::path> out;
  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && is_active_segment(it->path().filename().string(), prefix)) {
      out.push_back(it->path());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

/// Moves `segment` into slot 1, shifting older backups up and deleting the
/// one that falls past `keep`.
common::Status shift_into_backups(const fs::path &directory, const std::string &prefix,
                                  const std::uint32_t keep, const fs::path &segment) {
  std::error_code ec;
  const auto oldest = backup_path(directory, prefix, keep);
  if (fs::exists(oldest, ec)) {
    fs::remove(oldest, ec);
    if (ec) {
      return common::Status::error("cannot delete " + oldest.string() + ": " + ec.message());
    }
  }
  for (std::uint32_t i = keep; i > 1; --i) {
    const auto from = backup_path(directory, prefix, i - 1);
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::rename(from, backup_path(directory, prefix, i), ec);
    if (ec) {
      return common::Status::error("cannot rename " + from.string() + ": " + ec.message());
    }
  }
  fs::rename(segment, backup_path(directory, prefix, 1), ec);
  if (ec) {
    return common::Status::error("cannot rotate " + segment.string() + ": " + ec.message());
  }
  return common::Status::success();
}

std::optional<std::string> last_line(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::string line;
  std::optional<std::string> last;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      last = line;
    }
  }
  return last;
}

struct ChainLink {
  std::string body;
  std::string hash;
  std::string prev_hash;
  std::uint64_t seq = 0;
};

common::Result<ChainLink> split_chain_line(const std::string &line) {
  const auto hash_pos = line.rfind(kHashMarker);
  if (hash_pos == std::string::npos ||
      line.size() != hash_pos + kHashMarker.size() + kGenesisHash.size() + 2 ||
      line.compare(line.size() - 2, 2, "\"}") != 0) {
    return common::Result<ChainLink>::failure("line carries no hash");
  }
  ChainLink link;
  link.body = line.substr(0, hash_pos);
  link.hash = line.substr(hash_pos + kHashMarker.size(), kGenesisHash.size());

  const auto prev_pos = link.body.rfind(kPrevHashMarker);
  if (prev_pos == std::string::npos) {
    return common::Result<ChainLink>::failure("line carries no prev_hash");
  }
  link.prev_hash = link.body.substr(prev_pos + kPrevHashMarker.size(), kGenesisHash.size());

  const auto seq_pos = link.body.rfind(kSeqMarker);
  if (seq_pos == std::string::npos) {
    return common::Result<ChainLink>::failure("line carries no seq");
  }
  try {
    link.seq = std::stoull(link.body.substr(seq_pos + kSeqMarker.size()));
  } catch (const std::exception &) {
    return common::Result<ChainLink>::failure("line has a malformed seq");
  }
  return common::Result<ChainLink>::success(std::move(link));
}

SecurityEvent queue_overflow_event(const std::uint64_t lost) {
  return make_event(EventType::AuditLogTamper, Severity::Critical, "audit_logger",
                    "Audit queue overflow: " + std::to_string(lost) + " events dropped",
                    Outcome::Failure, 10, {{"lost_events", std::to_string(lost)}});
}

} // namespace

std::string sha256_hex(const std::string_view text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char byte : digest) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

SummaryRecord summary_record(const SecurityEvent &event) {
  return SummaryRecord{.timestamp = event.timestamp,
                       .type = event.type,
                       .severity = event.severity,
                       .outcome = event.outcome,
                       .risk_score = event.risk_score};
}

common::Result<SummaryRecord> parse_summary_record(const std::string &line) {
  const auto type = event_type_from_string(common::json_get_string(line, "event_type"));
  const auto severity = severity_from_string(common::json_get_string(line, "severity"));
  const auto outcome = outcome_from_string(common::json_get_string(line, "outcome"));
  if (!type.ok() || !severity.ok() || !outcome.ok()) {
    return common::Result<SummaryRecord>::failure("not an audit event line");
  }
  SummaryRecord record;
  record.type = type.value();
  record.severity = severity.value();
  record.outcome = outcome.value();
  try {
    record.risk_score = std::stoi(common::json_get_number(line, "risk_score"));
    record.timestamp = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(std::stoll(common::json_get_number(line, "timestamp_ms"))));
  } catch (const std::exception &) {
    return common::Result<SummaryRecord>::failure("audit event line has malformed numbers");
  }
  return common::Result<SummaryRecord>::success(record);
}

AuditSummary summarize(const std::vector<SummaryRecord> &records,
                       const std::chrono::system_clock::time_point now,
                       const std::chrono::milliseconds window, const std::size_t top_n) {
  AuditSummary summary;
  std::map<std::string, std::size_t> counts;
  const auto cutoff = now - window;
  for (const auto &record : records) {
    if (record.timestamp < cutoff) {
      continue;
    }
    ++summary.total_events;
    if (record.severity == Severity::Critical || record.risk_score >= 8) {
      ++summary.critical_events;
    }
    if (record.outcome == Outcome::Blocked) {
      ++summary.blocked_events;
    }
    ++counts[event_type_to_string(record.type)];
  }

  summary.top_event_types.assign(counts.begin(), counts.end());
  std::stable_sort(summary.top_event_types.begin(), summary.top_event_types.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  if (summary.top_event_types.size() > top_n) {
    summary.top_event_types.resize(top_n);
  }
  return summary;
}

std::string summary_to_json(const AuditSummary &summary) {
  std::vector<std::string> types;
  types.reserve(summary.top_event_types.size());
  for (const auto &[type, count] : summary.top_event_types) {
    types.push_back("{\"type\":" + common::json_quote(type) +
                    ",\"count\":" + std::to_string(count) + "}");
  }
  return "{\"total_events\":" + std::to_string(summary.total_events) +
         ",\"critical_events\":" + std::to_string(summary.critical_events) +
         ",\"blocked_events\":" + std::to_string(summary.blocked_events) +
         ",\"top_event_types\":" + common::json_array(types) + "}";
}

std::vector<fs::path> list_segments(const fs::path &directory, const std::string &prefix) {
  std::vector<std::pair<std::uint32_t, fs::path>> backups;
  std::error_code ec;
  const std::string backup_prefix = prefix + ".log.";
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (!common::starts_with(name, backup_prefix)) {
      continue;
    }
    const std::string suffix = name.substr(backup_prefix.size());
    if (suffix.empty() || !std::all_of(suffix.begin(), suffix.end(),
                                       [](const char ch) { return ch >= '0' && ch <= '9'; })) {
      continue;
    }
    try {
      backups.emplace_back(static_cast<std::uint32_t>(std::stoul(suffix)), it->path());
    } catch (const std::exception &) {
      continue;
    }
  }
  std::sort(backups.begin(), backups.end(),
            [](const auto &a, const auto &b) { return a.first > b.first; });

  std::vector<fs::path> out;
  for (auto &[index, path] : backups) {
    out.push_back(std::move(path));
  }
  for (auto &path : active_segments(directory, prefix)) {
    out.push_back(std::move(path));
  }
  return out;
}

common::Result<std::vector<SummaryRecord>> load_summary_records(const fs::path &directory,
                                                                const std::string &prefix) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return common::Result<std::vector<SummaryRecord>>::failure("audit directory not found: " +
                                                               directory.string());
  }
  std::vector<SummaryRecord> records;
  for (const auto &segment : list_segments(directory, prefix)) {
    std::ifstream in(segment, std::ios::binary);
    if (!in) {
      return common::Result<std::vector<SummaryRecord>>::failure("cannot read " +
                                                                 segment.string());
    }
    std::string line;
    while (std::getline(in, line)) {
      if (auto record = parse_summary_record(line); record.ok()) {
        records.push_back(record.value());
      }
    }
  }
  return common::Result<std::vector<SummaryRecord>>::success(std::move(records));
}

common::Result<SegmentVerification> verify_segment(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<SegmentVerification>::failure("cannot open segment: " + path.string());
  }

  SegmentVerification report;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    ++report.lines;
    auto fail = [&report](std::string problem) {
      report.intact = false;
      report.broken_line = report.lines;
      report.problem = std::move(problem);
    };

    const auto link = split_chain_line(line);
    if (!link.ok()) {
      fail(link.error());
      break;
    }
    const auto &parsed = link.value();
    if (sha256_hex(parsed.body) != parsed.hash) {
      fail("hash mismatch");
      break;
    }
    if (report.lines == 1) {
      report.anchor_hash = parsed.prev_hash;
      report.first_seq = parsed.seq;
    } else {
      if (parsed.prev_hash != report.last_hash) {
        fail("prev_hash does not match the preceding line");
        break;
      }
      if (parsed.seq != report.last_seq + 1) {
        fail("sequence gap");
        break;
      }
    }
    report.last_hash = parsed.hash;
    report.last_seq = parsed.seq;
  }
  return common::Result<SegmentVerification>::success(std::move(report));
}

common::Result<std::unique_ptr<AuditLogger>> AuditLogger::create(const config::AuditConfig &config) {
  const auto level = severity_from_string(config.log_level);
  if (!level.ok()) {
    return common::Result<std::unique_ptr<AuditLogger>>::failure(level.error());
  }
  if (config.rotation_count == 0) {
    return common::Result<std::unique_ptr<AuditLogger>>::failure(
        "audit.rotation_count must be at least 1");
  }
  if (config.queue_capacity == 0 || config.flush_threshold == 0) {
    return common::Result<std::unique_ptr<AuditLogger>>::failure(
        "audit queue capacity and flush threshold must be positive");
  }
  if (config.file_prefix.empty() || config.file_prefix.find('/') != std::string::npos) {
    return common::Result<std::unique_ptr<AuditLogger>>::failure(
        "audit.file_prefix must be a plain file name");
  }

  const auto directory = common::ensure_private_dir(common::expand_path(config.directory));
  if (!directory.ok()) {
    return common::Result<std::unique_ptr<AuditLogger>>::failure(directory.error());
  }

  auto logger =
      std::make_unique<AuditLogger>(ConstructionTag{}, config, directory.value(), level.value());
  logger->recover_chain();
  {
    std::lock_guard<std::mutex> lock(logger->file_mutex_);
    if (const auto opened = logger->open_new_segment_locked(); !opened.ok()) {
      return common::Result<std::unique_ptr<AuditLogger>>::failure(opened.error());
    }
  }
  logger->worker_ = std::thread([raw = logger.get()] { raw->worker_loop(); });

  logger->record(make_event(EventType::SecurityInit, Severity::Info, "audit_logger",
                            "Audit logging initialized", Outcome::Success, 1,
                            {{"directory", logger->directory_.string()},
                             {"log_level", severity_to_string(logger->min_level_)},
                             {"rotation_count", std::to_string(config.rotation_count)}}));
  return common::Result<std::unique_ptr<AuditLogger>>::success(std::move(logger));
}

AuditLogger::AuditLogger(ConstructionTag /*tag*/, config::AuditConfig config, fs::path directory,
                         const Severity min_level)
    : config_(std::move(config)), directory_(std::move(directory)), min_level_(min_level),
      last_hash_(kGenesisHash) {}

AuditLogger::~AuditLogger() { shutdown(); }

void AuditLogger::recover_chain() {
  std::lock_guard<std::mutex> lock(file_mutex_);
  const auto leftovers = active_segments(directory_, config_.file_prefix);

  std::vector<fs::path> candidates(leftovers.rbegin(), leftovers.rend());
  candidates.push_back(backup_path(directory_, config_.file_prefix, 1));
  for (const auto &candidate : candidates) {
    const auto line = last_line(candidate);
    if (!line.has_value()) {
      continue;
    }
    const auto link = split_chain_line(*line);
    if (!link.ok()) {
      observability::record_error("audit", "cannot resume hash chain from " +
                                               candidate.string() + ": " + link.error());
      break;
    }
    last_hash_ = link.value().hash;
    next_seq_ = link.value().seq + 1;
    break;
  }

  // Segments left active by an earlier process join the backup sequence.
  for (const auto &segment : leftovers) {
    if (const auto status = shift_into_backups(directory_, config_.file_prefix,
                                               config_.rotation_count, segment);
        !status.ok()) {
      observability::record_error("audit", status.error());
    }
  }
}

common::Status AuditLogger::open_new_segment_locked() {
  std::ostringstream name;
  name << config_.file_prefix << '-' << segment_timestamp(std::chrono::system_clock::now()) << '-'
       << std::setw(6) << std::setfill('0') << ++segment_counter_ << ".log";
  const fs::path path = directory_ / name.str();
  std::ofstream out(path, std::ios::app | std::ios::binary);
  if (!out) {
    return common::Status::error("cannot create audit segment " + path.string());
  }
  active_path_ = path;
  active_bytes_ = 0;
  return common::Status::success();
}

common::Status AuditLogger::rotate_locked() {
  if (const auto status = shift_into_backups(directory_, config_.file_prefix,
                                             config_.rotation_count, active_path_);
      !status.ok()) {
    return status;
  }
  rotations_.fetch_add(1);
  return open_new_segment_locked();
}

void AuditLogger::record(SecurityEvent event) {
  recorded_.fetch_add(1);
  const bool urgent = event.is_urgent();
  bool wake = false;
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (worker_done_) {
      lock.unlock();
      std::deque<SecurityEvent> single;
      single.push_back(std::move(event));
      write_batch(std::move(single));
      return;
    }
    if (queue_.size() >= config_.queue_capacity && !urgent) {
      const auto dropped = dropped_.fetch_add(1) + 1;
      ++lost_pending_;
      urgent_ = true;
      lock.unlock();
      queue_cv_.notify_one();
      observability::record_metric(observability::AuditDroppedMetric{.total = dropped});
      return;
    }
    queue_.push_back(std::move(event));
    if (urgent) {
      urgent_ = true;
    }
    wake = urgent || queue_.size() >= config_.flush_threshold;
  }
  if (wake) {
    queue_cv_.notify_one();
  }
}

void AuditLogger::flush() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  if (worker_done_) {
    return;
  }
  const auto ticket = ++flush_requested_;
  queue_cv_.notify_one();
  flushed_cv_.wait(lock, [this, ticket] { return flush_completed_ >= ticket || worker_done_; });
}

void AuditLogger::shutdown() {
  std::call_once(shutdown_once_, [this] {
    record(make_event(EventType::SecurityShutdown, Severity::Info, "audit_logger",
                      "Audit logging shutting down", Outcome::Success, 1,
                      {{"events_recorded", std::to_string(recorded_.load() + 1)}}));
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      stopping_ = true;
    }
    queue_cv_.notify_all();
    flushed_cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  });
}

void AuditLogger::worker_loop() {
  const auto interval =
      std::chrono::milliseconds(std::max<std::uint64_t>(1, config_.flush_interval_ms));
  for (;;) {
    std::deque<SecurityEvent> batch;
    std::uint64_t lost = 0;
    std::uint64_t ticket = 0;
    bool stopping = false;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait_for(lock, interval, [this] {
        return stopping_ || urgent_ || queue_.size() >= config_.flush_threshold ||
               flush_requested_ > flush_completed_;
      });
      batch.swap(queue_);
      lost = std::exchange(lost_pending_, 0);
      urgent_ = false;
      ticket = flush_requested_;
      stopping = stopping_;
    }

    if (lost > 0) {
      batch.push_front(queue_overflow_event(lost));
    }
    if (!batch.empty()) {
      write_batch(std::move(batch));
    }

    std::size_t depth = 0;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      flush_completed_ = std::max(flush_completed_, ticket);
      depth = queue_.size();
      if (stopping && queue_.empty() && lost_pending_ == 0) {
        worker_done_ = true;
        break;
      }
    }
    flushed_cv_.notify_all();
    observability::record_metric(observability::AuditQueueDepthMetric{.depth = depth});
  }
  flushed_cv_.notify_all();
}

void AuditLogger::write_batch(std::deque<SecurityEvent> batch) {
  std::lock_guard<std::mutex> lock(file_mutex_);

  std::deque<SecurityEvent> pending;
  pending.swap(pending_tamper_);
  for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
    batch.push_front(std::move(*it));
  }

  std::ofstream out(active_path_, std::ios::app | std::ios::binary);
  std::uint64_t lines_written = 0;
  std::uint64_t bytes_written = 0;

  auto fail_remaining = [&](std::deque<SecurityEvent>::iterator from, const std::string &message) {
    std::vector<std::string> lost;
    for (auto it = from; it != batch.end(); ++it) {
      lost.push_back(event_to_text(*it));
    }
    report_write_failure(lost, message);
  };

  if (!out) {
    fail_remaining(batch.begin(), "cannot open " + active_path_.string());
    return;
  }

  for (auto it = batch.begin(); it != batch.end(); ++it) {
    const auto &event = *it;
    if (static_cast<std::uint8_t>(event.severity) < static_cast<std::uint8_t>(min_level_)) {
      filtered_.fetch_add(1);
      continue;
    }
    if (config_.console_output) {
      std::cerr << "[AUDIT] " << event_to_text(event) << "\n";
    }

    const std::string body = "{" + event_fields_json(event) +
                             std::string(kSeqMarker) + std::to_string(next_seq_) +
                             std::string(kPrevHashMarker) + last_hash_ + "\"";
    const std::string hash = sha256_hex(body);
    const std::string line = body + std::string(kHashMarker) + hash + "\"}\n";

    out << line;
    out.flush();
    if (!out) {
      fail_remaining(it, "write to " + active_path_.string() + " failed");
      return;
    }
    last_hash_ = hash;
    ++next_seq_;
    remember(event);
    active_bytes_ += line.size();
    bytes_written += line.size();
    ++lines_written;
    written_.fetch_add(1);

    if (active_bytes_ >= config_.max_segment_bytes) {
      out.close();
      if (const auto rotated = rotate_locked(); !rotated.ok()) {
        fail_remaining(std::next(it), rotated.error());
        return;
      }
      out.open(active_path_, std::ios::app | std::ios::binary);
      if (!out) {
        fail_remaining(std::next(it), "cannot open " + active_path_.string());
        return;
      }
    }
  }

  if (lines_written > 0) {
    observability::record_audit_flush(lines_written, bytes_written);
  }
}

void AuditLogger::report_write_failure(const std::vector<std::string> &lines,
                                       const std::string &message) {
  write_failures_.fetch_add(1);
  for (const auto &line : lines) {
    std::cerr << "[AUDIT-FALLBACK] " << line << "\n";
  }

  auto tamper = make_event(EventType::AuditLogTamper, Severity::Critical, "audit_logger",
                           "Audit log write failed: " + message, Outcome::Failure, 10,
                           {{"segment", active_path_.string()},
                            {"lost_events", std::to_string(lines.size())}});
  std::cerr << "[AUDIT-FALLBACK] " << event_to_text(tamper) << "\n";
  observability::record_audit_failure(active_path_.string(), message);

  // Retried ahead of the next batch; the chain only advances on success.
  if (pending_tamper_.size() >= kMaxPendingTamperEvents) {
    pending_tamper_.pop_front();
  }
  pending_tamper_.push_back(std::move(tamper));
}

void AuditLogger::remember(const SecurityEvent &event) {
  std::lock_guard<std::mutex> lock(summary_mutex_);
  recent_.push_back(summary_record(event));
  while (recent_.size() > std::max<std::size_t>(1, config_.summary_capacity)) {
    recent_.pop_front();
  }
}

AuditSummary AuditLogger::summary(const std::chrono::milliseconds window,
                                  const std::size_t top_n) const {
  std::vector<SummaryRecord> records;
  {
    std::lock_guard<std::mutex> lock(summary_mutex_);
    records.assign(recent_.begin(), recent_.end());
  }
  return summarize(records, std::chrono::system_clock::now(), window, top_n);
}

AuditStats AuditLogger::stats() const {
  AuditStats out;
  out.recorded = recorded_.load();
  out.written = written_.load();
  out.filtered = filtered_.load();
  out.dropped = dropped_.load();
  out.write_failures = write_failures_.load();
  out.rotations = rotations_.load();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  out.queue_depth = queue_.size();
  return out;
}

fs::path AuditLogger::active_segment() const {
  std::lock_guard<std::mutex> lock(file_mutex_);
  return active_path_;
}

std::vector<fs::path> AuditLogger::segments() const {
  return list_segments(directory_, config_.file_prefix);
}

} // namespace paneguard::audit
