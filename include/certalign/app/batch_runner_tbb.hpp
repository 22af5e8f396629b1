#pragma once

#include <certalign/align/iterative_verifier.hpp>
#include <certalign/app/batch_runner.hpp>
#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/image.hpp>
#include <certalign/core/render_parameters.hpp>
#include <expected>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef CERTALIGN_HAS_TBB

namespace certalign::app {

/// Renderer shared by several templates; receives the template_id of the item being rendered.
using TemplateRenderCallback = std::function<std::expected<certalign::core::Image, certalign::core::VerifyError>(
    const std::string& template_id,
    const certalign::core::FieldValues& fields,
    const certalign::core::RenderParameters& parameters)>;

/// Callback for each finished job; receives (template_id, job, outcome).
/// May be invoked from TBB worker threads; must be thread-safe.
using TemplateVerificationCallback = std::function<void(
    const std::string& template_id, const CertificateJob& job, const VerificationOutcome& outcome)>;

/// Verifies a batch of (template_id, job) work items in parallel using TBB.
///
/// **One verifier per template:** each certificate template (reference image + field
/// specs) has its own verifier. Verifiers are immutable after creation, so the same
/// verifier may serve many TBB tasks concurrently; its cache and statistics are
/// internally synchronized. Work items whose template_id has no verifier are skipped.
///
/// \param verifiers Map from template_id to verifier. Caller keeps ownership.
/// \param work_items Flat list of (template_id, job) pairs.
/// \param render Must be thread-safe.
/// \param callback Invoked for each finished job. Must be thread-safe.
void run_verification_multi_template_tbb(
    const std::unordered_map<std::string, const certalign::align::IterativeVerifier*>& verifiers,
    const std::vector<std::pair<std::string, CertificateJob>>& work_items,
    const TemplateRenderCallback& render,
    TemplateVerificationCallback callback);

}  // namespace certalign::app

#endif  // CERTALIGN_HAS_TBB
