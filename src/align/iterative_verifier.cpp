#include <certalign/align/iterative_verifier.hpp>
#include <certalign/vision/alignment_comparator.hpp>
#include <certalign/vision/field_locator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <exception>
#include <set>
#include <string>

namespace certalign::align {

namespace cc = certalign::core;
namespace vis = certalign::vision;

namespace {

using SteadyClock = std::chrono::steady_clock;

double elapsed_ms(SteadyClock::time_point since) {
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - since).count());
}

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += ", ";
    out += s;
  }
  return out;
}

}  // namespace

std::expected<void, cc::VerifyError> validate_setup(const std::vector<cc::FieldSpec>& specs,
                                                    const cc::Image& reference,
                                                    const VerifierOptions& options) {
  if (specs.empty()) {
    spdlog::error("no field specs configured");
    return std::unexpected(cc::VerifyError::InvalidConfig);
  }
  std::set<std::string> names;
  for (const auto& s : specs) {
    if (s.name.empty() || !names.insert(s.name).second) {
      spdlog::error("field spec name '{}' is empty or duplicated", s.name);
      return std::unexpected(cc::VerifyError::InvalidConfig);
    }
    const auto& w = s.search_window;
    if (!(w.y_min >= 0.0 && w.y_max <= 1.0 && w.y_min < w.y_max)) {
      spdlog::error("field '{}' has invalid search window [{}, {}]", s.name, w.y_min, w.y_max);
      return std::unexpected(cc::VerifyError::InvalidConfig);
    }
  }
  if (!(options.tolerance_px >= 0.0) || options.max_attempts == 0 ||
      options.refiner.decay_interval == 0 || options.refiner.convergence_window < 2) {
    spdlog::error("invalid verifier options (tolerance={}, max_attempts={})",
                  options.tolerance_px, options.max_attempts);
    return std::unexpected(cc::VerifyError::InvalidConfig);
  }
  if (!reference.is_valid()) {
    spdlog::error("reference image is empty or malformed");
    return std::unexpected(cc::VerifyError::InvalidImage);
  }
  return {};
}

std::expected<IterativeVerifier, cc::VerifyError> IterativeVerifier::create(
    std::vector<cc::FieldSpec> specs,
    cc::Image reference,
    VerifierOptions options,
    PositionCache* cache,
    StatsTracker* stats) {
  if (auto ok = validate_setup(specs, reference, options); !ok) {
    return std::unexpected(ok.error());
  }
  return IterativeVerifier(std::move(specs), std::move(reference), std::move(options), cache,
                           stats);
}

IterativeVerifier::IterativeVerifier(std::vector<cc::FieldSpec> specs,
                                     cc::Image reference,
                                     VerifierOptions options,
                                     PositionCache* cache,
                                     StatsTracker* stats)
    : specs_(std::move(specs)),
      reference_(std::move(reference)),
      options_(std::move(options)),
      refiner_(options_.refiner),
      cache_(cache),
      stats_(stats) {
  reference_positions_ = vis::locate_all(reference_, specs_);
  for (const auto& spec : specs_) {
    if (!reference_positions_[spec.name].found()) {
      spdlog::warn("field '{}' not detected in the reference image; runs cannot pass", spec.name);
    }
  }
}

cc::VerificationAttempt IterativeVerifier::run_attempt(
    std::uint32_t attempt_number,
    const cc::FieldValues& fields,
    const cc::RenderCallback& render,
    const cc::RenderParameters& parameters) const {
  const auto start = SteadyClock::now();

  cc::VerificationAttempt a;
  a.attempt_number = attempt_number;
  a.render_parameters = parameters;

  std::expected<cc::Image, cc::VerifyError> image =
      std::unexpected(cc::VerifyError::RenderFailed);
  try {
    image = render(fields, parameters);
  } catch (const std::exception& e) {
    a.render_error = e.what();
  }
  if (!a.render_error && !image) {
    a.render_error = std::string(cc::to_string(image.error()));
  } else if (!a.render_error && !image->is_valid()) {
    a.render_error = "renderer returned an empty or malformed image";
  }

  if (a.render_error) {
    for (const auto& spec : specs_) {
      cc::FieldMeasurement m;
      m.required = spec.required;
      m.reference = reference_positions_.at(spec.name);
      a.fields.emplace(spec.name, std::move(m));
    }
    spdlog::warn("attempt {}: render failed: {}", attempt_number, *a.render_error);
  } else {
    const auto candidate = vis::locate_all(*image, specs_);
    a.fields = vis::measure(candidate, reference_positions_, specs_);
    a.all_fields_detected = vis::all_required_detected(a.fields);
    a.max_difference = vis::max_difference(a.fields);
    a.passed = a.all_fields_detected && a.max_difference <= options_.tolerance_px;
    if (options_.compute_image_difference) {
      a.image_difference_fraction =
          vis::image_difference(*image, reference_, options_.image_diff_channel_tolerance)
              .differing_fraction;
    }
  }

  a.duration_ms = elapsed_ms(start);
  for (const auto& [name, m] : a.fields) {
    if (m.difference.is_finite()) {
      spdlog::debug("  {}: dy={:.2f}px dx={:.2f}px", name, m.difference.dy, m.difference.dx);
    }
  }
  spdlog::debug("attempt {}: max difference {:.4f}px (tolerance {}px)", attempt_number,
                a.max_difference, options_.tolerance_px);
  return a;
}

void IterativeVerifier::select_best_available(cc::VerificationResult& result) const {
  const cc::VerificationAttempt* best = nullptr;
  for (const auto& a : result.attempts) {
    if (!a.all_fields_detected) continue;
    if (best == nullptr || a.max_difference < best->max_difference) best = &a;
  }
  if (best == nullptr) {
    spdlog::error("no attempt detected every required field; no best-available fallback");
    return;
  }
  result.used_best_available = true;
  result.best_attempt_index = best->attempt_number;
  spdlog::warn("using best available attempt {} (max difference {:.4f}px, tolerance {}px)",
               best->attempt_number, best->max_difference, options_.tolerance_px);
}

std::expected<cc::VerificationResult, cc::VerifyError> IterativeVerifier::verify(
    const cc::FieldValues& fields,
    const cc::RenderCallback& render,
    std::stop_token stop) const {
  if (const auto unknown = cc::unknown_fields(fields, specs_); !unknown.empty()) {
    spdlog::error("unknown fields: {}", join(unknown));
    return std::unexpected(cc::VerifyError::UnknownField);
  }
  if (!render) {
    return std::unexpected(cc::VerifyError::InvalidConfig);
  }

  const auto run_start = SteadyClock::now();
  cc::VerificationResult result;
  result.tolerance_px = options_.tolerance_px;

  if (cache_) {
    if (auto cached = cache_->get(fields)) {
      auto probe = run_attempt(1, fields, render, *cached);
      if (probe.passed) {
        spdlog::info("cached parameters verified (max difference {:.4f}px)", probe.max_difference);
        result.attempts.push_back(std::move(probe));
        result.passed = true;
        result.attempts_used = 1;
        result.used_cache = true;
        result.best_attempt_index = 1;
        result.termination = cc::Termination::Passed;
        if (options_.on_attempt) options_.on_attempt(result.attempts.back(), options_.max_attempts);
        if (stats_) stats_->record(result);
        return result;
      }
      spdlog::warn("cached parameters failed revalidation (max difference {:.4f}px); discarding",
                   probe.max_difference);
      cache_->invalidate(fields);
      result.cache_probe = std::move(probe);
    }
  }

  cc::RenderParameters parameters;
  result.termination = cc::Termination::Exhausted;
  for (std::uint32_t n = 1; n <= options_.max_attempts; ++n) {
    if (stop.stop_requested()) {
      spdlog::info("verification cancelled before attempt {}", n);
      result.termination = cc::Termination::Cancelled;
      break;
    }

    result.attempts.push_back(run_attempt(n, fields, render, parameters));
    const cc::VerificationAttempt& attempt = result.attempts.back();
    if (options_.on_attempt) options_.on_attempt(attempt, options_.max_attempts);

    if (attempt.passed) {
      result.termination = cc::Termination::Passed;
      break;
    }

    if (attempt.rendered()) {
      if (const auto missing = ProgressiveRefiner::undetected_fields(attempt); !missing.empty()) {
        spdlog::warn("attempt {}: fields not detected: {}", n, join(missing));
      }
    }

    const bool attempt_over = options_.attempt_budget.count() > 0 &&
                              attempt.duration_ms > static_cast<double>(options_.attempt_budget.count());
    const bool run_over = options_.run_budget.count() > 0 &&
                          elapsed_ms(run_start) >= static_cast<double>(options_.run_budget.count());
    if (attempt_over || run_over) {
      spdlog::warn("attempt {}: {} budget exceeded", n, attempt_over ? "attempt" : "run");
      result.termination = cc::Termination::TimedOut;
      break;
    }

    if (refiner_.should_abort(result.attempts)) {
      spdlog::warn("no improvement over the last {} attempts; stopping after attempt {}",
                   options_.refiner.convergence_window, n);
      result.termination = cc::Termination::Diverged;
      break;
    }

    if (n < options_.max_attempts) {
      parameters = refiner_.next_parameters(attempt, result.attempts);
    }
  }

  result.attempts_used = static_cast<std::uint32_t>(result.attempts.size());
  if (result.termination == cc::Termination::Passed) {
    const auto& winner = result.attempts.back();
    result.passed = true;
    result.best_attempt_index = winner.attempt_number;
    if (cache_) cache_->set(fields, winner.render_parameters);
    spdlog::info("alignment verified on attempt {}/{} (max difference {:.4f}px)",
                 winner.attempt_number, options_.max_attempts, winner.max_difference);
  } else {
    spdlog::warn("alignment not verified after {} attempts ({})", result.attempts_used,
                 cc::to_string(result.termination));
    select_best_available(result);
  }

  if (stats_) stats_->record(result);
  return result;
}

std::expected<cc::VerificationResult, cc::VerifyError> verify(
    const cc::FieldValues& fields,
    const cc::RenderCallback& render,
    const cc::Image& reference,
    const std::vector<cc::FieldSpec>& specs,
    double tolerance_px,
    std::uint32_t max_attempts) {
  VerifierOptions options;
  options.tolerance_px = tolerance_px;
  options.max_attempts = max_attempts;
  auto verifier = IterativeVerifier::create(specs, reference, std::move(options));
  if (!verifier) return std::unexpected(verifier.error());
  return verifier->verify(fields, render);
}

}  // namespace certalign::align
