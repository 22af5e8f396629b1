#include <certalign/app/report.hpp>
#include <cmath>
#include <optional>
#include <string>

namespace certalign::app {

namespace cc = certalign::core;
using json = nlohmann::json;

namespace {

json number_or_null(double v) { return std::isfinite(v) ? json(v) : json(nullptr); }

json number_or_null(const std::optional<double>& v) { return v ? json(*v) : json(nullptr); }

json position_json(const cc::DetectedPosition& p) {
  if (!p.found()) return nullptr;
  json j = {{"center_x", *p.center_x}, {"center_y", *p.center_y}};
  if (p.bounds) {
    j["bounds"] = {{"top", p.bounds->top},
                   {"bottom", p.bounds->bottom},
                   {"left", p.bounds->left},
                   {"right", p.bounds->right}};
  }
  return j;
}

}  // namespace

json to_json(const cc::VerificationAttempt& attempt) {
  json fields = json::object();
  for (const auto& [name, m] : attempt.fields) {
    fields[name] = {
        {"detected", m.difference.is_finite()},
        {"required", m.required},
        {"dy", number_or_null(m.difference.dy)},
        {"dx", number_or_null(m.difference.dx)},
        {"distance", number_or_null(m.difference.distance)},
        {"candidate", position_json(m.candidate)},
        {"reference", position_json(m.reference)},
    };
  }

  json offsets = json::object();
  for (const auto& [name, off] : attempt.render_parameters.offsets) {
    offsets[name] = {{"dx", off.dx}, {"dy", off.dy}};
  }

  json j = {
      {"attempt_number", attempt.attempt_number},
      {"render_parameters", std::move(offsets)},
      {"fields", std::move(fields)},
      {"max_difference", number_or_null(attempt.max_difference)},
      {"all_fields_detected", attempt.all_fields_detected},
      {"passed", attempt.passed},
      {"duration_ms", attempt.duration_ms},
  };
  if (attempt.render_error) j["render_error"] = *attempt.render_error;
  if (attempt.image_difference_fraction) {
    j["image_difference_fraction"] = number_or_null(attempt.image_difference_fraction);
  }
  return j;
}

json to_json(const cc::VerificationResult& result) {
  json attempts = json::array();
  for (const auto& a : result.attempts) attempts.push_back(to_json(a));

  json j = {
      {"passed", result.passed},
      {"attempts_used", result.attempts_used},
      {"used_cache", result.used_cache},
      {"used_best_available", result.used_best_available},
      {"best_attempt_index",
       result.best_attempt_index ? json(*result.best_attempt_index) : json(nullptr)},
      {"termination", std::string(cc::to_string(result.termination))},
      {"tolerance_px", result.tolerance_px},
      {"attempts", std::move(attempts)},
  };
  if (const auto* final_attempt = result.final_attempt()) {
    j["max_difference"] = number_or_null(final_attempt->max_difference);
  } else {
    j["max_difference"] = nullptr;
  }
  if (result.cache_probe) j["cache_probe"] = to_json(*result.cache_probe);
  return j;
}

}  // namespace certalign::app
