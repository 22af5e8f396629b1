#pragma once

#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/image.hpp>
#include <certalign/core/render_callback.hpp>
#include <certalign/core/render_parameters.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace certalign::vision {

/// Default placement of one field's text block.
struct FieldLayout {
  std::string name;
  double center_x{0.0};
  double center_y{0.0};
  /// Width in pixels contributed by each character of the field text.
  std::uint32_t glyph_width{12};
  std::uint32_t line_height{24};
};

struct SyntheticLayout {
  std::uint32_t width{800};
  std::uint32_t height{600};
  std::vector<FieldLayout> fields;
};

/// Certificate layout matching default_field_specs(): 2000x1414 with name, event and
/// organiser blocks at 28.4%, 49.6% and 60.3% of the height.
[[nodiscard]] SyntheticLayout default_certificate_layout();

/// Deterministic stand-in renderer (for tests/demo): draws each non-blank field as a
/// solid dark block sized by its text length, centered at its layout position plus the
/// configured drift plus the requested render offset. Produces BGR8 images.
class SyntheticRenderer {
 public:
  explicit SyntheticRenderer(SyntheticLayout layout);

  /// Simulated renderer error for \p field, added to every render.
  void set_drift(const std::string& field, certalign::core::FieldOffset drift);
  void clear_drift() { drift_.clear(); }

  [[nodiscard]] std::expected<certalign::core::Image, certalign::core::VerifyError>
  render(const certalign::core::FieldValues& fields,
         const certalign::core::RenderParameters& parameters) const;

  /// Callback bound to this renderer; the renderer must outlive it.
  [[nodiscard]] certalign::core::RenderCallback as_callback() const;

  [[nodiscard]] const SyntheticLayout& layout() const noexcept { return layout_; }

 private:
  SyntheticLayout layout_;
  std::map<std::string, certalign::core::FieldOffset> drift_;
};

}  // namespace certalign::vision
