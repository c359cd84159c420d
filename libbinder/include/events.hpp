/**
 * @file events.hpp
 * @brief Progress events published on the EventBus during a merge job.
 */

#ifndef BINDER_EVENTS_HPP
#define BINDER_EVENTS_HPP

#include "job.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace binder {

/**
 * @brief Emitted when the orchestrator enters a stage.
 */
struct StageEnteredEvent {
    Stage stage; ///< The stage being entered
};

/**
 * @brief Emitted when a source file produced a PDF fragment.
 */
struct FileConvertedEvent {
    std::filesystem::path source;   ///< Original document
    std::filesystem::path fragment; ///< Resulting PDF in the job directory
    int attempts = 1;               ///< Attempts used, including the successful one
};

/**
 * @brief Emitted for files that are not converted because of their format.
 */
struct FileSkippedEvent {
    std::filesystem::path source; ///< Skipped file
    std::string reason;           ///< Human readable reason
};

/**
 * @brief Emitted when a file could not be converted after all attempts.
 */
struct FileFailedEvent {
    std::filesystem::path source; ///< Failed file
    std::string reason;           ///< Failure category
    std::string message;          ///< Last error message
    int attempts = 0;             ///< Attempts used
};

/**
 * @brief Emitted when a directory yields no pages.
 */
struct SectionEmptyEvent {
    std::filesystem::path directory;         ///< The section directory
    std::vector<std::string> failed_formats; ///< Extensions that were recognized but failed
};

/**
 * @brief Overall completion, 0 to 100.
 */
struct ProgressEvent {
    double percent = 0.0;
};

/**
 * @brief Emitted once when the job ends, whatever the outcome.
 */
struct JobFinishedEvent {
    JobStatus status;
};

} // namespace binder

#endif // BINDER_EVENTS_HPP
