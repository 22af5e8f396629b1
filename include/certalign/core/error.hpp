#pragma once

#include <string_view>

namespace certalign::core {

/// Setup and boundary error codes; used with std::expected for recoverable failures.
/// Run-level conditions (render failure, undetected field, timeout) are not errors:
/// they are recorded on the VerificationResult.
enum class VerifyError {
  None = 0,
  InvalidImage,
  LoadFailed,
  RenderFailed,
  InvalidConfig,
  UnknownField,
  IoError,
  CorruptData,
};

[[nodiscard]] std::string_view to_string(VerifyError e) noexcept;

}  // namespace certalign::core
