#pragma once

#include <certalign/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace certalign::vision::detail {

/// Wrap Image as cv::Mat (non-owning view). Returns nullopt if format unsupported
/// or the buffer is too small.
std::optional<cv::Mat> image_to_mat(const certalign::core::Image& image);

/// Convert cv::Mat to Image (copy).
certalign::core::Image mat_to_image(const cv::Mat& mat,
                                    certalign::core::PixelFormat format);

/// 8-bit single-channel luminance of \p image (copy for color input).
std::optional<cv::Mat> to_luminance(const certalign::core::Image& image);

}  // namespace certalign::vision::detail
