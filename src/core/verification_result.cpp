#include <certalign/core/verification_result.hpp>

namespace certalign::core {

std::string_view to_string(Termination t) noexcept {
  switch (t) {
    case Termination::Passed:
      return "passed";
    case Termination::Exhausted:
      return "exhausted";
    case Termination::Diverged:
      return "diverged";
    case Termination::TimedOut:
      return "timed_out";
    case Termination::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

const VerificationAttempt* VerificationResult::best_attempt() const noexcept {
  if (!best_attempt_index) return nullptr;
  for (const auto& a : attempts) {
    if (a.attempt_number == *best_attempt_index) return &a;
  }
  return nullptr;
}

const VerificationAttempt* VerificationResult::final_attempt() const noexcept {
  if (const auto* best = best_attempt()) return best;
  if (attempts.empty()) return nullptr;
  return &attempts.back();
}

}  // namespace certalign::core
