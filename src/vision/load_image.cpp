#include <certalign/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <certalign/core/image.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

namespace certalign::vision {

std::expected<certalign::core::Image, certalign::core::VerifyError> load_image(
    const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) {
    spdlog::error("could not load image '{}'", path);
    return std::unexpected(certalign::core::VerifyError::LoadFailed);
  }

  certalign::core::PixelFormat format = certalign::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = certalign::core::PixelFormat::Grayscale8;
  else if (mat.channels() == 4) format = certalign::core::PixelFormat::BGRA8;

  if (mat.depth() != CV_8U) {
    spdlog::error("image '{}' is not 8-bit", path);
    return std::unexpected(certalign::core::VerifyError::InvalidImage);
  }

  return detail::mat_to_image(mat, format);
}

std::expected<void, certalign::core::VerifyError> save_image(
    const certalign::core::Image& image, const std::string& path) {
  auto mat = detail::image_to_mat(image);
  if (!mat) {
    return std::unexpected(certalign::core::VerifyError::InvalidImage);
  }
  bool ok = false;
  try {
    ok = cv::imwrite(path, *mat);
  } catch (const cv::Exception& e) {
    spdlog::error("could not write image '{}': {}", path, e.what());
  }
  if (!ok) {
    return std::unexpected(certalign::core::VerifyError::IoError);
  }
  return {};
}

}  // namespace certalign::vision
