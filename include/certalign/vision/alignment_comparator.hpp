#pragma once

#include <certalign/core/field_difference.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/image.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace certalign::vision {

/// Difference between two detections of the same field. Infinite when either side is
/// missing a coordinate; otherwise absolute dy/dx and their Euclidean distance.
[[nodiscard]] certalign::core::FieldDifference compare(
    const certalign::core::DetectedPosition& a,
    const certalign::core::DetectedPosition& b) noexcept;

/// Per-field measurements of \p candidate against \p reference for every spec.
/// A field absent from either map counts as not detected.
[[nodiscard]] std::map<std::string, certalign::core::FieldMeasurement> measure(
    const certalign::core::FieldPositions& candidate,
    const certalign::core::FieldPositions& reference,
    const std::vector<certalign::core::FieldSpec>& specs);

/// Max distance over required measurements (infinite if any is undetected, 0 if none
/// is required).
[[nodiscard]] double max_difference(
    const std::map<std::string, certalign::core::FieldMeasurement>& fields) noexcept;

/// True iff every required measurement has a finite difference.
[[nodiscard]] bool all_required_detected(
    const std::map<std::string, certalign::core::FieldMeasurement>& fields) noexcept;

/// Whole-image comparison; a supplementary diagnostic, not a pass criterion.
struct ImageDifference {
  /// Fraction in [0, 1] of pixels whose largest per-channel difference exceeds the tolerance.
  double differing_fraction{1.0};
  std::uint8_t max_channel_difference{255};
  bool size_mismatch{false};
};

/// Compares two images of equal size and format. Mismatched or invalid images report
/// a differing fraction of 1.0.
[[nodiscard]] ImageDifference image_difference(const certalign::core::Image& a,
                                               const certalign::core::Image& b,
                                               std::uint8_t channel_tolerance = 1);

}  // namespace certalign::vision
