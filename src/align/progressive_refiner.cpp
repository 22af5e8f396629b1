#include <certalign/align/progressive_refiner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace certalign::align {

namespace cc = certalign::core;

ProgressiveRefiner::ProgressiveRefiner(RefinerOptions options)
    : options_(options) {
  if (options_.decay_interval == 0) {
    throw std::invalid_argument("ProgressiveRefiner: decay_interval must be > 0");
  }
  if (options_.convergence_window < 2) {
    throw std::invalid_argument("ProgressiveRefiner: convergence_window must be >= 2");
  }
}

double ProgressiveRefiner::step_size(std::uint32_t attempt_number) const noexcept {
  const std::uint32_t n = attempt_number == 0 ? 0 : attempt_number - 1;
  const double exponent = static_cast<double>(n / options_.decay_interval);
  return std::max(options_.min_step,
                  options_.initial_step * std::pow(options_.step_decay, exponent));
}

cc::RenderParameters ProgressiveRefiner::next_parameters(
    const cc::VerificationAttempt& previous,
    std::span<const cc::VerificationAttempt> /*history*/) const {
  cc::RenderParameters next = previous.render_parameters;
  if (!previous.rendered()) return next;

  const double step = step_size(previous.attempt_number);
  for (const auto& [name, m] : previous.fields) {
    if (!m.difference.is_finite()) continue;

    const double err_x = *m.candidate.center_x - *m.reference.center_x;
    const double err_y = *m.candidate.center_y - *m.reference.center_y;
    cc::FieldOffset& offset = next.offsets[name];
    offset.dx -= err_x * step;
    offset.dy -= err_y * step;

    spdlog::debug("refine '{}': error=({:.2f}, {:.2f})px step={:.3f} offset=({:.2f}, {:.2f})",
                  name, err_x, err_y, step, offset.dx, offset.dy);
  }
  return next;
}

bool ProgressiveRefiner::should_abort(
    std::span<const cc::VerificationAttempt> history) const {
  std::vector<double> window;
  window.reserve(options_.convergence_window);
  for (auto it = history.rbegin();
       it != history.rend() && window.size() < options_.convergence_window; ++it) {
    if (it->rendered()) window.push_back(it->max_difference);
  }
  if (window.size() < options_.convergence_window) return false;

  // window holds newest first; non-decreasing over time means each older value is <= the newer one.
  for (std::size_t i = 0; i + 1 < window.size(); ++i) {
    if (window[i] < window[i + 1]) return false;
  }
  return true;
}

std::vector<std::string> ProgressiveRefiner::undetected_fields(
    const cc::VerificationAttempt& attempt) {
  std::vector<std::string> out;
  for (const auto& [name, m] : attempt.fields) {
    if (!m.difference.is_finite()) out.push_back(name);
  }
  return out;
}

}  // namespace certalign::align
