#pragma once

#include <certalign/core/verification_result.hpp>
#include <nlohmann/json.hpp>

namespace certalign::app {

/// JSON form of a verification run for logs and API responses. Infinite differences
/// and missing coordinates are written as null.
[[nodiscard]] nlohmann::json to_json(const certalign::core::VerificationAttempt& attempt);
[[nodiscard]] nlohmann::json to_json(const certalign::core::VerificationResult& result);

}  // namespace certalign::app
