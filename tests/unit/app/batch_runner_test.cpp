#include <certalign/app/batch_runner.hpp>
#include <certalign/vision/synthetic_renderer.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace ca = certalign::align;
namespace capp = certalign::app;
namespace cc = certalign::core;
namespace cv_ = certalign::vision;
namespace ct = certalign::test_support;

namespace {

ca::IterativeVerifier make_verifier() {
  cv_::SyntheticRenderer renderer(ct::small_layout());
  auto ref = renderer.render(ct::sample_fields(), {});
  if (!ref) throw std::runtime_error("reference render failed");
  auto v = ca::IterativeVerifier::create(ct::small_specs(), std::move(*ref));
  if (!v) throw std::runtime_error("verifier setup failed");
  return std::move(*v);
}

std::vector<capp::CertificateJob> make_jobs(std::size_t n) {
  std::vector<capp::CertificateJob> jobs;
  for (std::size_t i = 0; i < n; ++i) {
    auto fields = ct::sample_fields();
    fields["name"] = "Participant " + std::to_string(i);
    jobs.push_back({"p" + std::to_string(i), std::move(fields)});
  }
  return jobs;
}

}  // namespace

TEST(BatchRunner, SequentialRunsEveryJobInOrder) {
  auto verifier = make_verifier();
  cv_::SyntheticRenderer renderer(ct::small_layout());
  auto jobs = make_jobs(3);

  std::vector<std::string> ids;
  capp::run_verification_batch(
      verifier, jobs, renderer.as_callback(),
      [&ids](const capp::CertificateJob& job, const capp::VerificationOutcome& outcome) {
        ASSERT_TRUE(outcome.has_value());
        EXPECT_TRUE(outcome->passed);
        ids.push_back(job.id);
      });
  EXPECT_EQ(ids, (std::vector<std::string>{"p0", "p1", "p2"}));
}

TEST(BatchRunner, SequentialReportsUnknownField) {
  auto verifier = make_verifier();
  cv_::SyntheticRenderer renderer(ct::small_layout());
  auto jobs = make_jobs(1);
  jobs[0].fields["venue"] = "Hall";

  int calls = 0;
  capp::run_verification_batch(
      verifier, jobs, renderer.as_callback(),
      [&calls](const capp::CertificateJob&, const capp::VerificationOutcome& outcome) {
        ++calls;
        ASSERT_FALSE(outcome.has_value());
        EXPECT_EQ(outcome.error(), cc::VerifyError::UnknownField);
      });
  EXPECT_EQ(calls, 1);
}

TEST(BatchRunner, StoppedBatchSkipsJobs) {
  auto verifier = make_verifier();
  cv_::SyntheticRenderer renderer(ct::small_layout());
  std::stop_source source;
  source.request_stop();

  int calls = 0;
  capp::run_verification_batch(
      verifier, make_jobs(4), renderer.as_callback(),
      [&calls](const capp::CertificateJob&, const capp::VerificationOutcome&) { ++calls; },
      source.get_token());
  EXPECT_EQ(calls, 0);
}

TEST(BatchRunner, ParallelRunsEveryJobOnce) {
  auto verifier = make_verifier();
  cv_::SyntheticRenderer renderer(ct::small_layout());
  auto jobs = make_jobs(16);

  std::atomic<std::size_t> passed{0};
  std::mutex mutex;
  std::vector<std::string> ids;
  capp::run_verification_batch_parallel(
      verifier, jobs, renderer.as_callback(),
      [&](const capp::CertificateJob& job, const capp::VerificationOutcome& outcome) {
        if (outcome && outcome->passed) ++passed;
        std::lock_guard lock(mutex);
        ids.push_back(job.id);
      },
      4);
  EXPECT_EQ(passed.load(), 16u);
  ASSERT_EQ(ids.size(), 16u);
  std::sort(ids.begin(), ids.end());
  EXPECT_TRUE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
}

TEST(BatchRunner, ParallelEmptyJobsNoCallback) {
  auto verifier = make_verifier();
  cv_::SyntheticRenderer renderer(ct::small_layout());
  int calls = 0;
  capp::run_verification_batch_parallel(
      verifier, {}, renderer.as_callback(),
      [&calls](const capp::CertificateJob&, const capp::VerificationOutcome&) { ++calls; }, 2);
  EXPECT_EQ(calls, 0);
}
