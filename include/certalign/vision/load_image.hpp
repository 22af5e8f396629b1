#pragma once

#include <certalign/core/error.hpp>
#include <certalign/core/image.hpp>
#include <expected>
#include <string>

namespace certalign::vision {

/// Load an image file into an Image (BGR8 or Grayscale8).
/// Returns LoadFailed if the file is missing or cannot be decoded.
std::expected<certalign::core::Image, certalign::core::VerifyError> load_image(
    const std::string& path);

/// Write \p image to \p path (format from extension). Returns IoError on failure.
std::expected<void, certalign::core::VerifyError> save_image(
    const certalign::core::Image& image, const std::string& path);

}  // namespace certalign::vision
