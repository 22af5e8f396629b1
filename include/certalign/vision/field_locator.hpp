#pragma once

#include <certalign/core/field_spec.hpp>
#include <certalign/core/image.hpp>
#include <vector>

namespace certalign::vision {

/// Locates the text band of \p spec inside \p image.
///
/// Rows of spec.search_window (clamped to the image) are scanned for ink, i.e. pixels
/// whose luminance is below spec.darkness_threshold. A row with at least
/// spec.min_ink_pixels ink pixels is text-bearing. Text-bearing rows separated by at
/// most spec.max_row_gap other rows form one band; the band holding the most ink wins
/// (ties go to the topmost). center_y is the band midpoint, center_x the midpoint of the
/// band's columns holding at least spec.min_ink_columns ink pixels.
///
/// Returns an empty DetectedPosition when nothing qualifies, when the window is empty
/// after clamping, or when the image is invalid. Never throws.
[[nodiscard]] certalign::core::DetectedPosition locate(
    const certalign::core::Image& image, const certalign::core::FieldSpec& spec);

/// Locates every field of \p specs; the luminance conversion is done once.
[[nodiscard]] certalign::core::FieldPositions locate_all(
    const certalign::core::Image& image,
    const std::vector<certalign::core::FieldSpec>& specs);

}  // namespace certalign::vision
