#include "image_cv_utils.hpp"
#include <certalign/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace certalign::vision::detail {

namespace cc = certalign::core;

std::optional<cv::Mat> image_to_mat(const cc::Image& image) {
  if (!image.is_valid()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  void* data = const_cast<std::byte*>(image.data().data());
  const std::size_t step = static_cast<std::size_t>(image.width()) *
                           cc::Image::channels(image.format());

  switch (image.format()) {
    case cc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case cc::PixelFormat::RGB8:
    case cc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case cc::PixelFormat::RGBA8:
    case cc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case cc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

cc::Image mat_to_image(const cv::Mat& mat, cc::PixelFormat format) {
  if (mat.empty()) return cc::Image();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return cc::Image(w, h, format, std::move(buffer));
}

std::optional<cv::Mat> to_luminance(const cc::Image& image) {
  auto mat = image_to_mat(image);
  if (!mat) return std::nullopt;

  int code = -1;
  switch (image.format()) {
    case cc::PixelFormat::Grayscale8:
      return *mat;
    case cc::PixelFormat::RGB8:
      code = cv::COLOR_RGB2GRAY;
      break;
    case cc::PixelFormat::BGR8:
      code = cv::COLOR_BGR2GRAY;
      break;
    case cc::PixelFormat::RGBA8:
      code = cv::COLOR_RGBA2GRAY;
      break;
    case cc::PixelFormat::BGRA8:
      code = cv::COLOR_BGRA2GRAY;
      break;
    default:
      return std::nullopt;
  }

  cv::Mat gray;
  cv::cvtColor(*mat, gray, code);
  return gray;
}

}  // namespace certalign::vision::detail
