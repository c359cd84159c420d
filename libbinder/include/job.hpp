/**
 * @file job.hpp
 * @brief Input and result types of a merge job.
 */

#ifndef BINDER_JOB_HPP
#define BINDER_JOB_HPP

#include "errors.hpp"
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace binder {

class EventBus;

/**
 * @brief Pipeline stages, in execution order.
 */
enum class Stage {
    Validating,
    Collecting,
    ProvisionalMerge,
    TocGeneration,
    FinalAssembly,
    Pagination,
    Bookmarking,
    Compressing,
    Publishing,
    Done
};

const char* to_string(Stage stage) noexcept;

/**
 * @brief Caller's hint about the folder layout.
 */
enum class PlanHint {
    Auto,       ///< Run StructureDetector
    TwoLevel,   ///< Sections containing files
    ThreeLevel  ///< Sections containing subsections containing files
};

/**
 * @brief Text for a generated cover page.
 *
 * Used only when the input tree carries no cover document of its own.
 */
struct CoverInfo {
    std::string title;    ///< Empty means no generated cover
    std::string subtitle;
};

/**
 * @brief Everything a merge run needs. Built once by the caller.
 */
struct JobRequest {
    std::filesystem::path root;       ///< Input directory
    std::filesystem::path output;     ///< Destination PDF
    PlanHint plan = PlanHint::Auto;
    CoverInfo cover;
    bool compress = true;             ///< Run the compressor if one is configured
    std::stop_token cancel;           ///< Polled at stage and retry boundaries
    EventBus* events = nullptr;       ///< Optional progress sink, not owned
};

enum class WarningKind {
    SkippedFile,       ///< Unsupported format
    FailedFile,        ///< Conversion failed, section kept
    EmptySection,      ///< Directory produced no pages and was left out
    CompressionFailed  ///< Output kept uncompressed
};

const char* to_string(WarningKind kind) noexcept;

struct Warning {
    WarningKind kind;
    std::filesystem::path path;
    std::string message;
};

enum class JobStatus {
    Succeeded,
    Cancelled,
    Failed,
    Busy     ///< Rejected because another job is in flight
};

const char* to_string(JobStatus status) noexcept;

/**
 * @brief Why a job failed.
 */
struct JobFailure {
    Stage stage = Stage::Validating;
    ErrorKind kind = ErrorKind::Processing;
    std::filesystem::path path;       ///< Offending file or directory, if known
    std::string message;
    std::vector<std::string> causes;  ///< Outermost first
};

/**
 * @brief Outward result of a merge run.
 */
struct JobOutcome {
    JobStatus status = JobStatus::Failed;
    std::filesystem::path output;     ///< Set on success
    std::vector<Warning> warnings;
    std::optional<JobFailure> failure;
    int page_count = 0;

    [[nodiscard]] bool ok() const noexcept { return status == JobStatus::Succeeded; }
};

} // namespace binder

#endif // BINDER_JOB_HPP
