#include "../../include/job.hpp"

namespace binder {

const char* to_string(const Stage stage) noexcept {
    switch (stage) {
        case Stage::Validating:       return "validating";
        case Stage::Collecting:       return "collecting";
        case Stage::ProvisionalMerge: return "provisional-merge";
        case Stage::TocGeneration:    return "toc-generation";
        case Stage::FinalAssembly:    return "final-assembly";
        case Stage::Pagination:       return "pagination";
        case Stage::Bookmarking:      return "bookmarking";
        case Stage::Compressing:      return "compressing";
        case Stage::Publishing:       return "publishing";
        case Stage::Done:             return "done";
    }
    return "unknown";
}

const char* to_string(const WarningKind kind) noexcept {
    switch (kind) {
        case WarningKind::SkippedFile:       return "skipped-file";
        case WarningKind::FailedFile:        return "failed-file";
        case WarningKind::EmptySection:      return "empty-section";
        case WarningKind::CompressionFailed: return "compression-failed";
    }
    return "unknown";
}

const char* to_string(const JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Busy:      return "busy";
    }
    return "unknown";
}

} // namespace binder
