#pragma once

#include <certalign/align/iterative_verifier.hpp>
#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace certalign::app {

/// Application configuration: reference image, field specs, verifier and storage settings.
struct AppConfig {
  std::string reference_path;
  std::vector<certalign::core::FieldSpec> fields;
  certalign::align::VerifierOptions verifier;
  std::chrono::seconds cache_ttl{std::chrono::hours(24)};
  std::string cache_file;  // empty = in-memory only
  std::size_t stats_capacity{100};
  std::string stats_file;  // empty = no export
  std::string log_level{"info"};
};

/// name / event / organiser fields of the certificate template.
std::vector<certalign::core::FieldSpec> default_field_specs();

/// Default config when no file is provided.
AppConfig default_config();

/// Parse key=value lines (one per line, '#' comments). Each
/// `field = name, y_min, y_max[, threshold[, min_ink[, optional]]]` line adds a field;
/// the first one replaces the default fields. Returns InvalidConfig on malformed values
/// or an unusable result.
std::expected<AppConfig, certalign::core::VerifyError> parse_config(std::string_view text);

/// Load config from a key=value file. Returns LoadFailed if it cannot be read.
std::expected<AppConfig, certalign::core::VerifyError> load_config(const std::string& path);

}  // namespace certalign::app
