#include <certalign/core/error.hpp>

namespace certalign::core {

std::string_view to_string(VerifyError e) noexcept {
  switch (e) {
    case VerifyError::None:
      return "None";
    case VerifyError::InvalidImage:
      return "InvalidImage";
    case VerifyError::LoadFailed:
      return "LoadFailed";
    case VerifyError::RenderFailed:
      return "RenderFailed";
    case VerifyError::InvalidConfig:
      return "InvalidConfig";
    case VerifyError::UnknownField:
      return "UnknownField";
    case VerifyError::IoError:
      return "IoError";
    case VerifyError::CorruptData:
      return "CorruptData";
    default:
      return "Unknown";
  }
}

}  // namespace certalign::core
