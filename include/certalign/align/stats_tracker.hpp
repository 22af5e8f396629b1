#pragma once

#include <certalign/core/error.hpp>
#include <certalign/core/verification_result.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace certalign::align {

/// One completed verification as seen by the statistics tracker.
struct StatsRecord {
  bool passed{false};
  std::uint32_t attempts_used{0};
  /// Per-field outcome of the final (passing, best or last) attempt.
  std::map<std::string, bool> field_passed;
  std::chrono::system_clock::time_point timestamp;
  bool used_cache{false};
  bool used_best_available{false};
  /// Max difference of the final attempt; nullopt when infinite or no attempt was made.
  std::optional<double> max_difference;
};

struct StatsSummary {
  std::size_t total{0};
  std::size_t passes{0};
  std::size_t fails{0};
  /// passes / (passes + fails); 0 when empty.
  double success_rate{0.0};
  double average_attempts{0.0};
  std::map<std::uint32_t, std::size_t> attempts_histogram;
  std::map<std::string, std::size_t> per_field_failure_counts;
  std::optional<std::uint32_t> most_common_attempts;
  std::size_t cache_hits{0};
  std::size_t best_available_count{0};
};

/// Thresholds of the deterministic recommendation rules.
struct RecommendationPolicy {
  double low_success_rate{0.80};
  double moderate_success_rate{0.95};
  double high_average_attempts{10.0};
  double moderate_average_attempts{5.0};
  /// A field is flagged when its failure count exceeds this fraction of failed runs.
  double problem_field_fraction{0.5};
};

/// Bounded ring buffer of verification outcomes with on-demand aggregation.
/// Oldest records are evicted once capacity is reached. Thread-safe.
class StatsTracker {
 public:
  explicit StatsTracker(std::size_t capacity = 100, RecommendationPolicy policy = {});

  StatsTracker(const StatsTracker&) = delete;
  StatsTracker& operator=(const StatsTracker&) = delete;

  void record(const certalign::core::VerificationResult& result);
  void record(StatsRecord record);

  [[nodiscard]] StatsSummary summary() const;

  /// Same buffer contents always yield the same list, in the same order.
  [[nodiscard]] std::vector<std::string> recommendations() const;

  void reset();

  /// {"capacity", "summary", "recommendations", "records"}.
  [[nodiscard]] nlohmann::json export_json() const;

  /// Writes export_json() to \p path. Returns IoError on failure.
  [[nodiscard]] std::expected<void, certalign::core::VerifyError> save(
      const std::string& path) const;

  /// Appends the records of a file written by save() (oldest first, subject to capacity).
  /// A missing file is not an error; a malformed one returns CorruptData and leaves the
  /// tracker unchanged.
  [[nodiscard]] std::expected<std::size_t, certalign::core::VerifyError> load(
      const std::string& path);

  /// Records oldest first.
  [[nodiscard]] std::vector<StatsRecord> records() const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

  [[nodiscard]] static StatsRecord make_record(
      const certalign::core::VerificationResult& result);

 private:
  [[nodiscard]] std::vector<StatsRecord> records_locked() const;
  [[nodiscard]] static StatsSummary summarize(const std::vector<StatsRecord>& records);
  [[nodiscard]] std::vector<std::string> recommend(const StatsSummary& s) const;

  std::size_t capacity_;
  RecommendationPolicy policy_;
  mutable std::mutex mutex_;
  std::vector<StatsRecord> ring_;
  std::size_t head_{0};
};

}  // namespace certalign::align
