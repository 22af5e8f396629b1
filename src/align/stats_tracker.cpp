#include <certalign/align/stats_tracker.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace certalign::align {

namespace cc = certalign::core;
using json = nlohmann::json;

StatsTracker::StatsTracker(std::size_t capacity, RecommendationPolicy policy)
    : capacity_(capacity), policy_(policy) {
  if (capacity_ == 0) {
    throw std::invalid_argument("StatsTracker: capacity must be > 0");
  }
  ring_.reserve(capacity_);
}

StatsRecord StatsTracker::make_record(const cc::VerificationResult& result) {
  StatsRecord r;
  r.passed = result.passed;
  r.attempts_used = result.attempts_used;
  r.timestamp = std::chrono::system_clock::now();
  r.used_cache = result.used_cache;
  r.used_best_available = result.used_best_available;

  if (const auto* a = result.final_attempt()) {
    for (const auto& [name, m] : a->fields) {
      r.field_passed[name] =
          m.difference.is_finite() && m.difference.distance <= result.tolerance_px;
    }
    if (std::isfinite(a->max_difference)) r.max_difference = a->max_difference;
  }
  return r;
}

void StatsTracker::record(const cc::VerificationResult& result) {
  record(make_record(result));
}

void StatsTracker::record(StatsRecord record) {
  spdlog::debug("stats: passed={} attempts={}", record.passed, record.attempts_used);
  std::lock_guard lock(mutex_);
  if (ring_.size() < capacity_) {
    ring_.push_back(std::move(record));
  } else {
    ring_[head_] = std::move(record);
  }
  head_ = (head_ + 1) % capacity_;
}

std::vector<StatsRecord> StatsTracker::records_locked() const {
  if (ring_.size() < capacity_) return ring_;
  std::vector<StatsRecord> out;
  out.reserve(ring_.size());
  for (std::size_t i = 0; i < ring_.size(); ++i) {
    out.push_back(ring_[(head_ + i) % ring_.size()]);
  }
  return out;
}

std::vector<StatsRecord> StatsTracker::records() const {
  std::lock_guard lock(mutex_);
  return records_locked();
}

std::size_t StatsTracker::size() const {
  std::lock_guard lock(mutex_);
  return ring_.size();
}

void StatsTracker::reset() {
  std::lock_guard lock(mutex_);
  ring_.clear();
  head_ = 0;
}

StatsSummary StatsTracker::summarize(const std::vector<StatsRecord>& records) {
  StatsSummary s;
  s.total = records.size();
  if (s.total == 0) return s;

  std::uint64_t attempts_sum = 0;
  for (const auto& r : records) {
    if (r.passed) ++s.passes;
    else ++s.fails;
    if (r.used_cache) ++s.cache_hits;
    if (r.used_best_available) ++s.best_available_count;
    attempts_sum += r.attempts_used;
    ++s.attempts_histogram[r.attempts_used];
    for (const auto& [field, ok] : r.field_passed) {
      if (!ok) ++s.per_field_failure_counts[field];
    }
  }
  s.success_rate = static_cast<double>(s.passes) / static_cast<double>(s.passes + s.fails);
  s.average_attempts = static_cast<double>(attempts_sum) / static_cast<double>(s.total);

  std::size_t best_count = 0;
  for (const auto& [attempts, count] : s.attempts_histogram) {
    if (count > best_count) {
      best_count = count;
      s.most_common_attempts = attempts;
    }
  }
  return s;
}

StatsSummary StatsTracker::summary() const {
  std::vector<StatsRecord> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = ring_;
  }
  return summarize(snapshot);
}

std::vector<std::string> StatsTracker::recommend(const StatsSummary& s) const {
  if (s.total == 0) {
    return {"No verifications recorded yet; generate some certificates to get recommendations."};
  }

  std::vector<std::string> out;
  const double pct = s.success_rate * 100.0;
  if (s.success_rate < policy_.low_success_rate) {
    out.push_back(fmt::format(
        "Low success rate ({:.1f}%). Review the field positions of the template.", pct));
  } else if (s.success_rate < policy_.moderate_success_rate) {
    out.push_back(fmt::format(
        "Moderate success rate ({:.1f}%). Some alignment tuning may improve reliability.", pct));
  } else {
    out.push_back(fmt::format("Good success rate ({:.1f}%).", pct));
  }

  if (s.average_attempts > policy_.high_average_attempts) {
    out.push_back(fmt::format(
        "High average attempts ({:.1f}). Check the renderer's default offsets.",
        s.average_attempts));
  } else if (s.average_attempts > policy_.moderate_average_attempts) {
    out.push_back(fmt::format(
        "Average attempts {:.1f}. Acceptable, but the default layout could be calibrated.",
        s.average_attempts));
  } else {
    out.push_back(fmt::format("Low average attempts ({:.1f}).", s.average_attempts));
  }

  for (const auto& [field, count] : s.per_field_failure_counts) {
    if (static_cast<double>(count) > policy_.problem_field_fraction * static_cast<double>(s.fails)) {
      out.push_back(fmt::format(
          "Problem field '{}': failed in {} of {} failed verifications. "
          "Consider adjusting its baseline offset or search window.",
          field, count, s.fails));
    }
  }

  if (s.most_common_attempts && *s.most_common_attempts == 1) {
    out.push_back("Most certificates align on the first attempt.");
  }
  return out;
}

std::vector<std::string> StatsTracker::recommendations() const {
  return recommend(summary());
}

json StatsTracker::export_json() const {
  std::vector<StatsRecord> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = records_locked();
  }
  const StatsSummary s = summarize(snapshot);

  json histogram = json::object();
  for (const auto& [attempts, count] : s.attempts_histogram) {
    histogram[std::to_string(attempts)] = count;
  }

  json summary = {
      {"total", s.total},
      {"passes", s.passes},
      {"fails", s.fails},
      {"success_rate", s.success_rate},
      {"average_attempts", s.average_attempts},
      {"attempts_histogram", std::move(histogram)},
      {"per_field_failure_counts", s.per_field_failure_counts},
      {"most_common_attempts", s.most_common_attempts ? json(*s.most_common_attempts) : json(nullptr)},
      {"cache_hits", s.cache_hits},
      {"best_available_count", s.best_available_count},
  };

  json records = json::array();
  for (const auto& r : snapshot) {
    records.push_back({
        {"passed", r.passed},
        {"attempts_used", r.attempts_used},
        {"field_passed", r.field_passed},
        {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(
                          r.timestamp.time_since_epoch()).count()},
        {"used_cache", r.used_cache},
        {"used_best_available", r.used_best_available},
        {"max_difference", r.max_difference ? json(*r.max_difference) : json(nullptr)},
    });
  }

  return {
      {"capacity", capacity_},
      {"summary", std::move(summary)},
      {"recommendations", recommend(s)},
      {"records", std::move(records)},
  };
}

std::expected<void, cc::VerifyError> StatsTracker::save(const std::string& path) const {
  std::ofstream f(path);
  if (!f) {
    spdlog::error("could not write statistics to '{}'", path);
    return std::unexpected(cc::VerifyError::IoError);
  }
  f << export_json().dump(2) << '\n';
  if (!f) return std::unexpected(cc::VerifyError::IoError);
  return {};
}

std::expected<std::size_t, cc::VerifyError> StatsTracker::load(const std::string& path) {
  if (!std::filesystem::exists(path)) return 0;

  std::ifstream f(path);
  if (!f) return std::unexpected(cc::VerifyError::IoError);

  std::vector<StatsRecord> loaded;
  try {
    const json doc = json::parse(f);
    for (const auto& j : doc.at("records")) {
      StatsRecord r;
      r.passed = j.at("passed").get<bool>();
      r.attempts_used = j.at("attempts_used").get<std::uint32_t>();
      r.field_passed = j.at("field_passed").get<std::map<std::string, bool>>();
      r.timestamp = std::chrono::system_clock::time_point(
          std::chrono::seconds(j.at("timestamp").get<std::int64_t>()));
      r.used_cache = j.value("used_cache", false);
      r.used_best_available = j.value("used_best_available", false);
      if (j.contains("max_difference") && j.at("max_difference").is_number()) {
        r.max_difference = j.at("max_difference").get<double>();
      }
      loaded.push_back(std::move(r));
    }
  } catch (const json::exception& e) {
    spdlog::warn("could not load statistics '{}': {}", path, e.what());
    return std::unexpected(cc::VerifyError::CorruptData);
  }

  for (auto& r : loaded) record(std::move(r));
  return loaded.size();
}

}  // namespace certalign::align
