#include <certalign/app/batch_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace certalign::app {

void run_verification_batch(const certalign::align::IterativeVerifier& verifier,
                            const std::vector<CertificateJob>& jobs,
                            const certalign::core::RenderCallback& render,
                            VerificationCallback callback,
                            std::stop_token stop) {
  for (const auto& job : jobs) {
    if (stop.stop_requested()) break;
    auto outcome = verifier.verify(job.fields, render, stop);
    if (callback) callback(job, outcome);
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_verification_batch_parallel(const certalign::align::IterativeVerifier& verifier,
                                     const std::vector<CertificateJob>& jobs,
                                     const certalign::core::RenderCallback& render,
                                     VerificationCallback callback,
                                     std::size_t num_workers,
                                     std::stop_token stop) {
  const std::size_t n = jobs.size();
  if (n == 0) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_verification_batch(verifier, jobs, render, std::move(callback), stop);
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (!stop.stop_requested()) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto outcome = verifier.verify(jobs[idx].fields, render, stop);
      if (callback) callback(jobs[idx], outcome);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace certalign::app
