#include <iostream>
#include <cassert>
#include "test_support.hpp"
#include "../libbinder/include/binder.hpp"
#include "../libbinder/include/event_bus.hpp"
#include "../libbinder/include/events.hpp"
#include "../libbinder/include/logger.hpp"
#include <stdexcept>

using namespace binder;

class RecordingObserver : public BinderObserver {
public:
    void onStage(const Stage stage) override { stages.push_back(stage); }
    void onFileConverted(const std::filesystem::path& source, int) override { converted.push_back(source); }
    void onFileSkipped(const std::filesystem::path& source, const std::string&) override { skipped.push_back(source); }
    void onProgress(const double percent) override { last_progress = percent; }
    void onLog(int, const std::string&, const std::string&) override { ++logs; }

    std::vector<Stage> stages;
    std::vector<std::filesystem::path> converted;
    std::vector<std::filesystem::path> skipped;
    double last_progress = 0.0;
    int logs = 0;
};

int main() {
    test::TempTree tree("binder");
    const auto in = tree.dir("in");
    test::make_pdf(tree.dir("in/Handouts") / "sheet.pdf", "Sheet");
    test::make_png(in / "Handouts" / "photo.png");
    tree.file("in/Handouts/list.csv", "a,b");

    Binder binder(test::fast_config(tree.dir("tmp")));
    RecordingObserver observer;
    binder.setObserver(&observer);

    std::cout << "[Test] Blocking run reports through the observer..." << std::endl;
    JobRequest request;
    request.root = in;
    request.output = tree.path() / "handouts.pdf";
    const auto outcome = binder.run(request);
    assert(outcome.ok());
    assert(outcome.page_count == 4);
    assert(observer.converted.size() == 2);
    assert(observer.skipped.size() == 1 && observer.skipped[0].filename() == "list.csv");
    assert(observer.stages.front() == Stage::Validating && observer.stages.back() == Stage::Done);
    assert(observer.last_progress == 100.0);
    assert(observer.logs > 0);
    assert(!binder.running());

    std::cout << "[Test] Background run delivers the outcome through the future..." << std::endl;
    request.output = tree.path() / "background.pdf";
    auto future = binder.start(request);
    const auto background = future.get();
    assert(background.ok());
    assert(test::pages_text(request.output).size() == 4);

    std::cout << "[Test] A cancelled caller token cancels the job..." << std::endl;
    std::stop_source stop;
    stop.request_stop();
    request.output = tree.path() / "cancelled.pdf";
    request.cancel = stop.get_token();
    const auto cancelled = binder.start(request).get();
    assert(cancelled.status == JobStatus::Cancelled);
    assert(!std::filesystem::exists(request.output));

    std::cout << "[Test] stop() between jobs does not poison the next one..." << std::endl;
    binder.stop();
    request.cancel = {};
    request.output = tree.path() / "after_stop.pdf";
    assert(binder.run(request).ok());
    assert(test::dir_is_empty_or_missing(tree.path() / "tmp"));

    std::cout << "[Test] A throwing listener leaves the facade usable..." << std::endl;
    EventBus listener;
    listener.subscribe<JobFinishedEvent>([](const JobFinishedEvent&) {
        throw std::runtime_error("listener failed");
    });
    request.output = tree.path() / "listener.pdf";
    request.events = &listener;
    bool threw = false;
    try {
        (void)binder.run(request);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!binder.running());
    const int logs_before = observer.logs;
    Logger::log(LogLevel::Info, "outside any job", "binder_test");
    assert(observer.logs == logs_before);

    threw = false;
    try {
        (void)binder.start(request).get();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!binder.running());

    request.events = nullptr;
    request.output = tree.path() / "recovered.pdf";
    const auto recovered = binder.run(request);
    assert(recovered.status == JobStatus::Succeeded);
    assert(test::pages_text(request.output).size() == 4);

    std::cout << "[PASS] Binder facade behaves as expected." << std::endl;
    return 0;
}
