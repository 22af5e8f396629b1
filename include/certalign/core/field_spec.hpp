#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace certalign::core {

/// Vertical band of the image to scan, as fractions of image height in [0, 1].
struct SearchWindow {
  double y_min{0.0};
  double y_max{1.0};
};

/// Static configuration for one text field on the certificate.
struct FieldSpec {
  std::string name;
  SearchWindow search_window{};
  /// Luminance strictly below this counts as ink.
  std::uint8_t darkness_threshold{200};
  /// Minimum ink pixels for a row to count as text-bearing.
  std::uint32_t min_ink_pixels{50};
  /// Minimum ink pixels for a column (inside the detected band) to count toward center_x.
  std::uint32_t min_ink_columns{1};
  /// Non-qualifying rows tolerated inside one band (descender/ascender gaps).
  std::uint32_t max_row_gap{2};
  /// Only required fields decide pass/fail and max_difference.
  bool required{true};
};

/// Pixel bounds of a detected text band (inclusive).
struct FieldBounds {
  std::uint32_t top{0};
  std::uint32_t bottom{0};
  std::uint32_t left{0};
  std::uint32_t right{0};
};

/// Result of locating a field in one image. Absence is nullopt, never 0.
struct DetectedPosition {
  std::optional<double> center_x;
  std::optional<double> center_y;
  std::optional<FieldBounds> bounds;

  [[nodiscard]] bool found() const noexcept {
    return center_x.has_value() && center_y.has_value();
  }
};

/// Participant field values keyed by FieldSpec name (e.g. "name", "event", "organiser").
using FieldValues = std::map<std::string, std::string>;

using FieldPositions = std::map<std::string, DetectedPosition>;

/// Returns the names in \p values that have no FieldSpec.
[[nodiscard]] std::vector<std::string> unknown_fields(
    const FieldValues& values, const std::vector<FieldSpec>& specs);

}  // namespace certalign::core
