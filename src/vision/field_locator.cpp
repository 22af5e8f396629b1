#include <certalign/vision/field_locator.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace certalign::vision {

namespace {

namespace cc = certalign::core;

struct Band {
  int top{-1};
  int bottom{-1};
  std::int64_t ink{0};
};

std::pair<int, int> window_rows(const cc::SearchWindow& window, int rows) {
  const double h = static_cast<double>(rows);
  const int y0 = static_cast<int>(std::floor(std::clamp(window.y_min, 0.0, 1.0) * h));
  const int y1 = static_cast<int>(std::ceil(std::clamp(window.y_max, 0.0, 1.0) * h));
  return {std::clamp(y0, 0, rows), std::clamp(y1, 0, rows)};
}

cc::DetectedPosition locate_in(const cv::Mat& gray, const cc::FieldSpec& spec) {
  const auto [y0, y1] = window_rows(spec.search_window, gray.rows);
  if (y0 >= y1 || gray.cols == 0) return {};

  // 1 where luminance < threshold, 0 elsewhere.
  cv::Mat ink = (gray.rowRange(y0, y1) < static_cast<double>(spec.darkness_threshold)) / 255;

  cv::Mat row_counts;
  cv::reduce(ink, row_counts, 1, cv::REDUCE_SUM, CV_32S);

  Band best;
  Band current;
  const int max_gap = static_cast<int>(spec.max_row_gap);
  for (int r = 0; r < row_counts.rows; ++r) {
    const int count = row_counts.at<std::int32_t>(r, 0);
    if (count < static_cast<std::int64_t>(spec.min_ink_pixels)) continue;

    if (current.top >= 0 && r - current.bottom - 1 <= max_gap) {
      current.bottom = r;
      current.ink += count;
      continue;
    }
    if (current.top >= 0 && current.ink > best.ink) best = current;
    current = Band{r, r, count};
  }
  if (current.top >= 0 && current.ink > best.ink) best = current;

  if (best.top < 0) return {};

  cv::Mat col_counts;
  cv::reduce(ink.rowRange(best.top, best.bottom + 1), col_counts, 0, cv::REDUCE_SUM, CV_32S);

  int left = -1;
  int right = -1;
  for (int c = 0; c < col_counts.cols; ++c) {
    if (col_counts.at<std::int32_t>(0, c) < static_cast<std::int64_t>(spec.min_ink_columns)) {
      continue;
    }
    if (left < 0) left = c;
    right = c;
  }
  if (left < 0) return {};

  const int top = y0 + best.top;
  const int bottom = y0 + best.bottom;

  cc::DetectedPosition pos;
  pos.center_y = (static_cast<double>(top) + static_cast<double>(bottom)) / 2.0;
  pos.center_x = (static_cast<double>(left) + static_cast<double>(right)) / 2.0;
  pos.bounds = cc::FieldBounds{static_cast<std::uint32_t>(top),
                               static_cast<std::uint32_t>(bottom),
                               static_cast<std::uint32_t>(left),
                               static_cast<std::uint32_t>(right)};
  return pos;
}

}  // namespace

cc::DetectedPosition locate(const cc::Image& image, const cc::FieldSpec& spec) {
  auto gray = detail::to_luminance(image);
  if (!gray) return {};
  return locate_in(*gray, spec);
}

cc::FieldPositions locate_all(const cc::Image& image,
                              const std::vector<cc::FieldSpec>& specs) {
  cc::FieldPositions out;
  auto gray = detail::to_luminance(image);
  for (const auto& spec : specs) {
    out[spec.name] = gray ? locate_in(*gray, spec) : cc::DetectedPosition{};
  }
  return out;
}

}  // namespace certalign::vision
