/**
 * @file binder.hpp
 * @brief Public API for the binder library.
 */

#ifndef BINDER_HPP
#define BINDER_HPP

#include "config.hpp"
#include "job.hpp"
#include <filesystem>
#include <future>
#include <memory>
#include <string>

namespace binder {

/**
 * @brief Interface for receiving progress and status events during a job.
 *
 * Callbacks run on the job's thread.
 */
struct BinderObserver {
    virtual ~BinderObserver() = default;

    virtual void onStage(Stage stage) {}

    virtual void onFileConverted(const std::filesystem::path& source, int attempts) {}

    virtual void onFileSkipped(const std::filesystem::path& source, const std::string& reason) {}

    virtual void onFileFailed(const std::filesystem::path& source, const std::string& reason,
                              const std::string& message) {}

    virtual void onSectionEmpty(const std::filesystem::path& directory) {}

    virtual void onProgress(double percent) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface of the library.
 *
 * @details Wraps MergeOrchestrator behind a small API. run() blocks on the
 * calling thread; start() runs the job on a worker thread so an interactive
 * caller stays responsive. Uses PIMPL to keep qpdf and the converters out
 * of the public headers.
 */
class Binder {
public:
    Binder();
    explicit Binder(const Config& config);
    ~Binder();

    Binder(const Binder&) = delete;
    Binder& operator=(const Binder&) = delete;
    Binder(Binder&&) noexcept;
    Binder& operator=(Binder&&) noexcept;

    [[nodiscard]] const Config& config() const;

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(BinderObserver* observer);

    /**
     * @brief Runs a job. Blocks until completion.
     *
     * The request's cancel token and the stop() of this object both cancel
     * the job. request.events, when set, receives the raw events too.
     */
    JobOutcome run(JobRequest request);

    /**
     * @brief Runs a job on a worker thread.
     * @return Future of the outcome; already JobStatus::Busy if a job is running.
     */
    std::future<JobOutcome> start(JobRequest request);

    /// @return True while a job is in flight.
    [[nodiscard]] bool running() const;

    /**
     * @brief Requests cancellation of the running job. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace binder

#endif // BINDER_HPP
