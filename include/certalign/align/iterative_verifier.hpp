#pragma once

#include <certalign/align/position_cache.hpp>
#include <certalign/align/progressive_refiner.hpp>
#include <certalign/align/stats_tracker.hpp>
#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/image.hpp>
#include <certalign/core/render_callback.hpp>
#include <certalign/core/verification_result.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <stop_token>
#include <vector>

namespace certalign::align {

/// Progress hook: invoked after every attempt with (attempt, max_attempts).
using AttemptCallback =
    std::function<void(const certalign::core::VerificationAttempt&, std::uint32_t)>;

struct VerifierOptions {
  double tolerance_px{2.0};
  std::uint32_t max_attempts{10};
  RefinerOptions refiner{};
  /// Wall-clock budget of one attempt (render + measure); zero disables.
  std::chrono::milliseconds attempt_budget{0};
  /// Wall-clock budget of the whole run, cache probe included; zero disables.
  std::chrono::milliseconds run_budget{0};
  /// Also record the whole-image differing-pixel fraction per attempt.
  bool compute_image_difference{false};
  std::uint8_t image_diff_channel_tolerance{1};
  AttemptCallback on_attempt;
};

/// Checks specs, reference image and options. InvalidConfig or InvalidImage on failure.
[[nodiscard]] std::expected<void, certalign::core::VerifyError> validate_setup(
    const std::vector<certalign::core::FieldSpec>& specs,
    const certalign::core::Image& reference,
    const VerifierOptions& options);

/// Render -> locate -> compare -> refine loop against a fixed reference image.
///
/// Run states: cache probe (advisory, always re-verified), then numbered attempts until
/// the first passing attempt (Passed), the refiner reports no improvement (Diverged),
/// a budget is exceeded (TimedOut), the stop token fires (Cancelled) or max_attempts is
/// reached (Exhausted). Non-passing runs fall back to the attempt with the smallest
/// max_difference among attempts where every required field was detected (earliest on
/// ties); with no such attempt the run is a total failure.
///
/// Thread-safety: verify() is const and may run concurrently from many threads; the
/// attached PositionCache and StatsTracker are internally synchronized. Both are
/// borrowed and must outlive the verifier.
class IterativeVerifier {
 public:
  [[nodiscard]] static std::expected<IterativeVerifier, certalign::core::VerifyError> create(
      std::vector<certalign::core::FieldSpec> specs,
      certalign::core::Image reference,
      VerifierOptions options = {},
      PositionCache* cache = nullptr,
      StatsTracker* stats = nullptr);

  /// Verifies one certificate. Returns UnknownField if \p fields names a field without
  /// a FieldSpec, InvalidConfig if \p render is empty; every run-level condition
  /// (render failure, undetected field, divergence, timeout) yields a result.
  [[nodiscard]] std::expected<certalign::core::VerificationResult, certalign::core::VerifyError>
  verify(const certalign::core::FieldValues& fields,
         const certalign::core::RenderCallback& render,
         std::stop_token stop = {}) const;

  [[nodiscard]] const std::vector<certalign::core::FieldSpec>& specs() const noexcept {
    return specs_;
  }
  [[nodiscard]] const certalign::core::FieldPositions& reference_positions() const noexcept {
    return reference_positions_;
  }
  [[nodiscard]] const VerifierOptions& options() const noexcept { return options_; }

 private:
  IterativeVerifier(std::vector<certalign::core::FieldSpec> specs,
                    certalign::core::Image reference,
                    VerifierOptions options,
                    PositionCache* cache,
                    StatsTracker* stats);

  [[nodiscard]] certalign::core::VerificationAttempt run_attempt(
      std::uint32_t attempt_number,
      const certalign::core::FieldValues& fields,
      const certalign::core::RenderCallback& render,
      const certalign::core::RenderParameters& parameters) const;

  void select_best_available(certalign::core::VerificationResult& result) const;

  std::vector<certalign::core::FieldSpec> specs_;
  certalign::core::Image reference_;
  certalign::core::FieldPositions reference_positions_;
  VerifierOptions options_;
  ProgressiveRefiner refiner_;
  PositionCache* cache_;
  StatsTracker* stats_;
};

/// One-shot verification without cache or statistics.
[[nodiscard]] std::expected<certalign::core::VerificationResult, certalign::core::VerifyError>
verify(const certalign::core::FieldValues& fields,
       const certalign::core::RenderCallback& render,
       const certalign::core::Image& reference,
       const std::vector<certalign::core::FieldSpec>& specs,
       double tolerance_px,
       std::uint32_t max_attempts);

}  // namespace certalign::align
