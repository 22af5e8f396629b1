#pragma once

#include <certalign/core/render_parameters.hpp>
#include <certalign/core/verification_result.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace certalign::align {

struct RefinerOptions {
  /// Step applied on the first attempts; 1.0 applies the full measured error.
  double initial_step{1.0};
  /// Multiplier applied every decay_interval attempts.
  double step_decay{0.5};
  std::uint32_t decay_interval{3};
  double min_step{0.05};
  /// Trailing measured attempts inspected by should_abort (K).
  std::uint32_t convergence_window{3};
};

/// Computes corrective render offsets from measured field errors and detects runs that
/// stopped improving. Stateless: safe to share across concurrent runs.
class ProgressiveRefiner {
 public:
  explicit ProgressiveRefiner(RefinerOptions options = {});

  /// Step for the parameters derived from attempt \p attempt_number:
  /// max(min_step, initial_step * step_decay^floor((attempt_number - 1) / decay_interval)).
  [[nodiscard]] double step_size(std::uint32_t attempt_number) const noexcept;

  /// Parameters for the attempt after \p previous. Every field with a finite difference
  /// has its offset moved by -(candidate - reference) * step_size; undetected fields and
  /// failed renders keep their previous offsets.
  [[nodiscard]] certalign::core::RenderParameters next_parameters(
      const certalign::core::VerificationAttempt& previous,
      std::span<const certalign::core::VerificationAttempt> history) const;

  /// True when the max_difference of the last convergence_window measured attempts
  /// (failed renders skipped) is non-decreasing, i.e. the run is not improving.
  [[nodiscard]] bool should_abort(
      std::span<const certalign::core::VerificationAttempt> history) const;

  /// Fields of \p attempt that could not be corrected because they were not detected.
  [[nodiscard]] static std::vector<std::string> undetected_fields(
      const certalign::core::VerificationAttempt& attempt);

  [[nodiscard]] const RefinerOptions& options() const noexcept { return options_; }

 private:
  RefinerOptions options_;
};

}  // namespace certalign::align
