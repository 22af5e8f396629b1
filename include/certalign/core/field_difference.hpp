#pragma once

#include <certalign/core/field_spec.hpp>
#include <cmath>
#include <limits>

namespace certalign::core {

inline constexpr double kNotDetected = std::numeric_limits<double>::infinity();

/// Absolute per-axis difference and Euclidean distance between a candidate and a
/// reference position. Infinite in all components when either side was not detected,
/// so "not found" can never read as "perfectly aligned".
struct FieldDifference {
  double dy{kNotDetected};
  double dx{kNotDetected};
  double distance{kNotDetected};

  [[nodiscard]] bool is_finite() const noexcept { return std::isfinite(distance); }

  [[nodiscard]] static FieldDifference not_detected() noexcept { return {}; }
};

/// Candidate vs reference position of one field in one attempt.
struct FieldMeasurement {
  DetectedPosition candidate;
  DetectedPosition reference;
  FieldDifference difference;
  bool required{true};
};

}  // namespace certalign::core
