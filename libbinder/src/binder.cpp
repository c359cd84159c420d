/**
 * @file binder.cpp
 * @brief Implementation of the public Binder API.
 */

#include "../include/binder.hpp"

#include "../include/event_bus.hpp"
#include "../include/events.hpp"
#include "../include/log_sink.hpp"
#include "../include/logger.hpp"
#include "../include/merge_orchestrator.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace binder {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    BinderObserver* observer_;
public:
    explicit BridgeLogSink(BinderObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

// clears the started flag on every exit path unless disarmed
struct StartedGuard {
    std::atomic<bool>& flag;
    bool armed = true;
    ~StartedGuard() {
        if (armed) flag.store(false);
    }
};

// unregisters the bridge sink on every exit path
struct SinkGuard {
    ILogSink* sink;
    ~SinkGuard() {
        if (sink) Logger::remove_sink(sink);
    }
};

struct Binder::Impl {
    MergeOrchestrator orchestrator;
    EventBus eventBus;
    BinderObserver* observer = nullptr;

    std::mutex mtx;                 ///< Guards stopSource and worker
    std::stop_source stopSource;
    std::jthread worker;
    std::atomic<bool> started{false};

    explicit Impl(const Config& config) : orchestrator(config) {}

    void setupEventBridging(EventBus* forward) {
        eventBus.clear();
        eventBus.subscribe<StageEnteredEvent>([this, forward](const StageEnteredEvent& e) {
            if (observer) observer->onStage(e.stage);
            if (forward) forward->publish(e);
        });
        eventBus.subscribe<FileConvertedEvent>([this, forward](const FileConvertedEvent& e) {
            if (observer) observer->onFileConverted(e.source, e.attempts);
            if (forward) forward->publish(e);
        });
        eventBus.subscribe<FileSkippedEvent>([this, forward](const FileSkippedEvent& e) {
            if (observer) observer->onFileSkipped(e.source, e.reason);
            if (forward) forward->publish(e);
        });
        eventBus.subscribe<FileFailedEvent>([this, forward](const FileFailedEvent& e) {
            if (observer) observer->onFileFailed(e.source, e.reason, e.message);
            if (forward) forward->publish(e);
        });
        eventBus.subscribe<SectionEmptyEvent>([this, forward](const SectionEmptyEvent& e) {
            if (observer) observer->onSectionEmpty(e.directory);
            if (forward) forward->publish(e);
        });
        eventBus.subscribe<ProgressEvent>([this, forward](const ProgressEvent& e) {
            if (observer) observer->onProgress(e.percent);
            if (forward) forward->publish(e);
        });
        eventBus.subscribe<JobFinishedEvent>([forward](const JobFinishedEvent& e) {
            if (forward) forward->publish(e);
        });
    }

    JobOutcome execute(JobRequest request, std::stop_token own) {
        // either the caller's token or stop() cancels the job
        std::stop_source combined;
        std::optional<std::stop_callback<std::function<void()>>> fromCaller;
        std::optional<std::stop_callback<std::function<void()>>> fromBinder;
        if (request.cancel.stop_possible()) {
            fromCaller.emplace(request.cancel, [&combined] { combined.request_stop(); });
        }
        fromBinder.emplace(own, [&combined] { combined.request_stop(); });
        request.cancel = combined.get_token();

        setupEventBridging(request.events);
        request.events = &eventBus;

        SinkGuard sink{observer ? Logger::add_sink(std::make_unique<BridgeLogSink>(observer)) : nullptr};
        return orchestrator.run(request);
    }
};

Binder::Binder() : Binder(Config{}) {}

Binder::Binder(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

Binder::~Binder() {
    if (impl_) {
        stop();
        std::lock_guard lock(impl_->mtx);
        if (impl_->worker.joinable()) impl_->worker.join();
    }
}

Binder::Binder(Binder&&) noexcept = default;
Binder& Binder::operator=(Binder&&) noexcept = default;

const Config& Binder::config() const {
    return impl_->orchestrator.config();
}

void Binder::setObserver(BinderObserver* observer) {
    impl_->observer = observer;
}

JobOutcome Binder::run(JobRequest request) {
    if (impl_->started.exchange(true)) {
        JobOutcome busy;
        busy.status = JobStatus::Busy;
        return busy;
    }
    StartedGuard guard{impl_->started};
    std::stop_token token;
    {
        std::lock_guard lock(impl_->mtx);
        impl_->stopSource = std::stop_source();
        token = impl_->stopSource.get_token();
    }
    return impl_->execute(std::move(request), token);
}

std::future<JobOutcome> Binder::start(JobRequest request) {
    if (impl_->started.exchange(true)) {
        std::promise<JobOutcome> p;
        JobOutcome busy;
        busy.status = JobStatus::Busy;
        p.set_value(std::move(busy));
        return p.get_future();
    }

    StartedGuard launching{impl_->started};
    std::lock_guard lock(impl_->mtx);
    if (impl_->worker.joinable()) impl_->worker.join();
    impl_->stopSource = std::stop_source();

    auto promise = std::make_shared<std::promise<JobOutcome>>();
    auto future = promise->get_future();
    Impl* impl = impl_.get();
    impl_->worker = std::jthread([impl, promise, request = std::move(request),
                                  token = impl_->stopSource.get_token()](std::stop_token) mutable {
        std::optional<JobOutcome> outcome;
        std::exception_ptr failure;
        {
            StartedGuard guard{impl->started};
            try {
                outcome = impl->execute(std::move(request), token);
            } catch (...) {
                failure = std::current_exception();
            }
        }
        // the flag is clear before the caller can observe the result
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value(std::move(*outcome));
        }
    });
    // the worker owns the flag from here
    launching.armed = false;
    return future;
}

bool Binder::running() const {
    return impl_->started.load();
}

void Binder::stop() {
    std::lock_guard lock(impl_->mtx);
    impl_->stopSource.request_stop();
}

} // namespace binder
