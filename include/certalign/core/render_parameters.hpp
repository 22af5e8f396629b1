#pragma once

#include <map>
#include <string>

namespace certalign::core {

/// Pixel offset applied by the renderer to one field relative to its default layout.
struct FieldOffset {
  double dx{0.0};
  double dy{0.0};

  friend bool operator==(const FieldOffset&, const FieldOffset&) = default;
};

/// Input of one render call besides the field text. Fields without an entry are drawn
/// at their default position.
struct RenderParameters {
  std::map<std::string, FieldOffset> offsets;

  [[nodiscard]] FieldOffset offset_for(const std::string& field) const {
    auto it = offsets.find(field);
    return it == offsets.end() ? FieldOffset{} : it->second;
  }

  friend bool operator==(const RenderParameters&, const RenderParameters&) = default;
};

}  // namespace certalign::core
