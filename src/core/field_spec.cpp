#include <certalign/core/field_spec.hpp>
#include <algorithm>

namespace certalign::core {

std::vector<std::string> unknown_fields(const FieldValues& values,
                                        const std::vector<FieldSpec>& specs) {
  std::vector<std::string> out;
  for (const auto& [name, text] : values) {
    const bool known = std::any_of(specs.begin(), specs.end(),
                                   [&name](const FieldSpec& s) { return s.name == name; });
    if (!known) out.push_back(name);
  }
  return out;
}

}  // namespace certalign::core
