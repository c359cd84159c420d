/**
 * @file merge_orchestrator.hpp
 * @brief The job state machine: collect, merge, paginate, outline, publish.
 */

#ifndef BINDER_MERGE_ORCHESTRATOR_HPP
#define BINDER_MERGE_ORCHESTRATOR_HPP

#include "compressor.hpp"
#include "config.hpp"
#include "converter_registry.hpp"
#include "job.hpp"
#include "pdf_processor.hpp"
#include <atomic>
#include <memory>

namespace binder {

/**
 * @brief Runs one merge job end to end.
 *
 * @details Stages run strictly in sequence:
 * Validating, Collecting, ProvisionalMerge, TocGeneration, FinalAssembly,
 * Pagination, Bookmarking, Compressing (only with a compressor), Publishing
 * and Done. Cancellation is checked at every stage boundary and inside
 * collection. All intermediate files live in one job directory that is
 * removed on every exit path. The requested output is written once, at
 * the end, through atomic_copy(); a failed or cancelled job leaves it as it
 * was.
 *
 * Only one job may run at a time; run() called while another job is in
 * flight returns JobStatus::Busy immediately.
 */
class MergeOrchestrator {
public:
    explicit MergeOrchestrator(const Config& config);

    /// @param compressor Compressor to use instead of the configured command; may be null.
    MergeOrchestrator(const Config& config, std::unique_ptr<ICompressor> compressor);

    MergeOrchestrator(const MergeOrchestrator&) = delete;
    MergeOrchestrator& operator=(const MergeOrchestrator&) = delete;

    /**
     * @brief Execute @p request. Never throws for job failures.
     * @return Succeeded with warnings, Cancelled, Failed with stage and cause, or Busy.
     */
    JobOutcome run(const JobRequest& request);

    [[nodiscard]] bool busy() const noexcept { return busy_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /// Converters used by the next job; replace() entries to customize them.
    [[nodiscard]] ConverterRegistry& registry() noexcept { return registry_; }

private:
    Config config_;
    ConverterRegistry registry_;
    PdfProcessor pdf_;
    std::atomic<bool> busy_{false};

    JobOutcome execute(const JobRequest& request);
};

} // namespace binder

#endif // BINDER_MERGE_ORCHESTRATOR_HPP
