#pragma once

#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/image.hpp>
#include <certalign/core/render_parameters.hpp>
#include <expected>
#include <functional>

namespace certalign::core {

/// External renderer: (field values, render parameters) -> certificate image.
/// Should be a pure function of its inputs; refinement cannot converge otherwise.
/// Called from the verifying thread; must be thread-safe if shared across a batch.
using RenderCallback = std::function<std::expected<Image, VerifyError>(
    const FieldValues& fields, const RenderParameters& parameters)>;

}  // namespace certalign::core
