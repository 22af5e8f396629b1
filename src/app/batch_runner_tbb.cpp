#include <certalign/app/batch_runner_tbb.hpp>

#ifdef CERTALIGN_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace certalign::app {

void run_verification_multi_template_tbb(
    const std::unordered_map<std::string, const certalign::align::IterativeVerifier*>& verifiers,
    const std::vector<std::pair<std::string, CertificateJob>>& work_items,
    const TemplateRenderCallback& render,
    TemplateVerificationCallback callback) {
  if (work_items.empty() || !callback || !render) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&verifiers, &work_items, &render, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& template_id = work_items[i].first;
          const CertificateJob& job = work_items[i].second;
          auto it = verifiers.find(template_id);
          if (it == verifiers.end() || it->second == nullptr) continue;

          const certalign::core::RenderCallback bound =
              [&render, &template_id](const certalign::core::FieldValues& fields,
                                      const certalign::core::RenderParameters& parameters) {
                return render(template_id, fields, parameters);
              };
          auto outcome = it->second->verify(job.fields, bound);
          callback(template_id, job, outcome);
        }
      });
}

}  // namespace certalign::app

#endif  // CERTALIGN_HAS_TBB
