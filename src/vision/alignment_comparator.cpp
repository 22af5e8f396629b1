#include <certalign/vision/alignment_comparator.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>

namespace certalign::vision {

namespace cc = certalign::core;

cc::FieldDifference compare(const cc::DetectedPosition& a,
                            const cc::DetectedPosition& b) noexcept {
  if (!a.found() || !b.found()) {
    return cc::FieldDifference::not_detected();
  }
  cc::FieldDifference d;
  d.dy = std::abs(*a.center_y - *b.center_y);
  d.dx = std::abs(*a.center_x - *b.center_x);
  d.distance = std::sqrt(d.dy * d.dy + d.dx * d.dx);
  return d;
}

std::map<std::string, cc::FieldMeasurement> measure(
    const cc::FieldPositions& candidate,
    const cc::FieldPositions& reference,
    const std::vector<cc::FieldSpec>& specs) {
  std::map<std::string, cc::FieldMeasurement> out;
  for (const auto& spec : specs) {
    cc::FieldMeasurement m;
    m.required = spec.required;
    if (auto it = candidate.find(spec.name); it != candidate.end()) m.candidate = it->second;
    if (auto it = reference.find(spec.name); it != reference.end()) m.reference = it->second;
    m.difference = compare(m.candidate, m.reference);
    out.emplace(spec.name, std::move(m));
  }
  return out;
}

double max_difference(const std::map<std::string, cc::FieldMeasurement>& fields) noexcept {
  double worst = 0.0;
  for (const auto& [name, m] : fields) {
    if (!m.required) continue;
    worst = std::max(worst, m.difference.distance);
  }
  return worst;
}

bool all_required_detected(
    const std::map<std::string, cc::FieldMeasurement>& fields) noexcept {
  return std::all_of(fields.begin(), fields.end(), [](const auto& entry) {
    return !entry.second.required || entry.second.difference.is_finite();
  });
}

ImageDifference image_difference(const cc::Image& a,
                                 const cc::Image& b,
                                 std::uint8_t channel_tolerance) {
  ImageDifference out;
  if (a.width() != b.width() || a.height() != b.height() || a.format() != b.format()) {
    out.size_mismatch = true;
    return out;
  }
  auto mat_a = detail::image_to_mat(a);
  auto mat_b = detail::image_to_mat(b);
  if (!mat_a || !mat_b) return out;

  cv::Mat diff;
  cv::absdiff(*mat_a, *mat_b, diff);

  // One row per pixel, one column per channel; keep the largest channel difference.
  cv::Mat per_pixel;
  cv::reduce(diff.reshape(1, static_cast<int>(diff.total())), per_pixel, 1, cv::REDUCE_MAX);

  double max_val = 0.0;
  cv::minMaxLoc(per_pixel, nullptr, &max_val);
  const int differing = cv::countNonZero(per_pixel > static_cast<double>(channel_tolerance));

  out.differing_fraction = static_cast<double>(differing) / static_cast<double>(per_pixel.rows);
  out.max_channel_difference = static_cast<std::uint8_t>(max_val);
  return out;
}

}  // namespace certalign::vision
