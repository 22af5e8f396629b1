#pragma once

#include <certalign/core/field_difference.hpp>
#include <certalign/core/render_parameters.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace certalign::core {

/// Record of one render -> locate -> compare iteration.
struct VerificationAttempt {
  /// 1-based, monotonic within a run.
  std::uint32_t attempt_number{0};
  RenderParameters render_parameters;
  std::map<std::string, FieldMeasurement> fields;
  /// Max distance over required fields; infinite if any required field is undetected
  /// or the render failed.
  double max_difference{kNotDetected};
  bool all_fields_detected{false};
  bool passed{false};
  /// Set when the render callback failed; no image was measured.
  std::optional<std::string> render_error;
  /// Whole-image differing-pixel fraction (diagnostic only, never the pass criterion).
  std::optional<double> image_difference_fraction;
  double duration_ms{0.0};

  [[nodiscard]] bool rendered() const noexcept { return !render_error.has_value(); }
};

/// Why a run stopped.
enum class Termination : std::uint8_t {
  Passed,
  Exhausted,
  Diverged,
  TimedOut,
  Cancelled,
};

[[nodiscard]] std::string_view to_string(Termination t) noexcept;

/// Outcome of a full verification run. Owned by the caller; no persistent identity.
struct VerificationResult {
  std::vector<VerificationAttempt> attempts;
  /// Cache-hit attempt that failed revalidation (not counted in attempts).
  std::optional<VerificationAttempt> cache_probe;
  bool passed{false};
  std::uint32_t attempts_used{0};
  bool used_cache{false};
  bool used_best_available{false};
  /// Attempt number (1-based) of the passing or best-available attempt.
  std::optional<std::uint32_t> best_attempt_index;
  Termination termination{Termination::Exhausted};
  double tolerance_px{0.0};

  /// Passing or best-available attempt; nullptr on total failure.
  [[nodiscard]] const VerificationAttempt* best_attempt() const noexcept;

  /// Attempt whose measurements describe the outcome: best attempt if any, otherwise
  /// the last attempt made. nullptr if no attempt was made.
  [[nodiscard]] const VerificationAttempt* final_attempt() const noexcept;
};

}  // namespace certalign::core
