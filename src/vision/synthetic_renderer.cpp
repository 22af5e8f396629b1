#include <certalign/vision/synthetic_renderer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace certalign::vision {

namespace cc = certalign::core;

namespace {

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

SyntheticLayout default_certificate_layout() {
  SyntheticLayout layout;
  layout.width = 2000;
  layout.height = 1414;
  layout.fields = {
      {"name", 1000.0, 401.0, 28, 56},
      {"event", 1000.0, 701.0, 20, 40},
      {"organiser", 1000.0, 852.0, 20, 40},
  };
  return layout;
}

SyntheticRenderer::SyntheticRenderer(SyntheticLayout layout)
    : layout_(std::move(layout)) {}

void SyntheticRenderer::set_drift(const std::string& field, cc::FieldOffset drift) {
  drift_[field] = drift;
}

std::expected<cc::Image, cc::VerifyError> SyntheticRenderer::render(
    const cc::FieldValues& fields,
    const cc::RenderParameters& parameters) const {
  if (layout_.width == 0 || layout_.height == 0) {
    return std::unexpected(cc::VerifyError::RenderFailed);
  }

  cv::Mat canvas(static_cast<int>(layout_.height), static_cast<int>(layout_.width),
                 CV_8UC3, cv::Scalar(255, 255, 255));

  for (const auto& f : layout_.fields) {
    auto text = fields.find(f.name);
    if (text == fields.end() || is_blank(text->second)) continue;

    const cc::FieldOffset offset = parameters.offset_for(f.name);
    cc::FieldOffset drift{};
    if (auto it = drift_.find(f.name); it != drift_.end()) drift = it->second;

    const double cx = f.center_x + drift.dx + offset.dx;
    const double cy = f.center_y + drift.dy + offset.dy;
    const int w = static_cast<int>(text->second.size() * f.glyph_width);
    const int h = static_cast<int>(f.line_height);
    const int left = static_cast<int>(std::lround(cx - (w - 1) / 2.0));
    const int top = static_cast<int>(std::lround(cy - (h - 1) / 2.0));

    cv::rectangle(canvas, cv::Rect(left, top, w, h), cv::Scalar(20, 20, 20), cv::FILLED);
  }

  return detail::mat_to_image(canvas, cc::PixelFormat::BGR8);
}

cc::RenderCallback SyntheticRenderer::as_callback() const {
  return [this](const cc::FieldValues& fields, const cc::RenderParameters& parameters) {
    return render(fields, parameters);
  };
}

}  // namespace certalign::vision
