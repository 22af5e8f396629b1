#pragma once

#include <certalign/align/iterative_verifier.hpp>
#include <certalign/core/error.hpp>
#include <certalign/core/field_spec.hpp>
#include <certalign/core/render_callback.hpp>
#include <certalign/core/verification_result.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace certalign::app {

/// One certificate to verify: caller-chosen id (e.g. participant id) and field values.
struct CertificateJob {
  std::string id;
  certalign::core::FieldValues fields;
};

using VerificationOutcome =
    std::expected<certalign::core::VerificationResult, certalign::core::VerifyError>;

/// Callback for each finished job; may be invoked from worker threads.
/// Must be thread-safe if using run_verification_batch_parallel.
using VerificationCallback =
    std::function<void(const CertificateJob& job, const VerificationOutcome& outcome)>;

/// Verifies jobs one after another; calls callback for each outcome.
/// Jobs not yet started when \p stop fires are skipped; the running one ends Cancelled.
void run_verification_batch(const certalign::align::IterativeVerifier& verifier,
                            const std::vector<CertificateJob>& jobs,
                            const certalign::core::RenderCallback& render,
                            VerificationCallback callback,
                            std::stop_token stop = {});

/// Verifies jobs in parallel using a thread pool, one run per worker at a time.
/// The verifier's cache and statistics are shared by all workers; \p render and
/// \p callback must be thread-safe. num_workers 0 = use hardware concurrency.
void run_verification_batch_parallel(const certalign::align::IterativeVerifier& verifier,
                                     const std::vector<CertificateJob>& jobs,
                                     const certalign::core::RenderCallback& render,
                                     VerificationCallback callback,
                                     std::size_t num_workers = 0,
                                     std::stop_token stop = {});

}  // namespace certalign::app
