#include <iostream>
#include <cassert>
#include <sstream>
#include "test_support.hpp"
#include "../libbinder/include/event_bus.hpp"
#include "../libbinder/include/events.hpp"
#include "../libbinder/include/merge_orchestrator.hpp"

using namespace binder;
namespace fs = std::filesystem;

class BrokenCompressor : public ICompressor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "BrokenCompressor"; }
    bool compress(const fs::path&, const fs::path&) override { return false; }
};

// orchestrator whose office converter is a FakeConverter
struct Harness {
    explicit Harness(const test::TempTree& tree, Config config = {},
                     std::unique_ptr<ICompressor> compressor = nullptr)
        : temp_root(tree.dir("tmp")),
          orchestrator([&] {
              config.retry.base_backoff = std::chrono::milliseconds(10);
              config.temp_root = temp_root;
              return config;
          }(), std::move(compressor)) {
        auto fake = std::make_unique<test::FakeConverter>(ConverterKind::OfficeDocument);
        office = fake.get();
        orchestrator.registry().replace(ConverterKind::OfficeDocument, std::move(fake));
    }

    fs::path temp_root;
    MergeOrchestrator orchestrator;
    test::FakeConverter* office = nullptr;
};

JobRequest request_for(const fs::path& root, const fs::path& output) {
    JobRequest r;
    r.root = root;
    r.output = output;
    return r;
}

void test_full_job() {
    std::cout << "[Test] Cover, TOC, sections, page numbers and bookmarks..." << std::endl;
    test::TempTree tree("full");
    const auto in = tree.dir("in");
    tree.file("in/Cover.docx");
    tree.file("in/Section A/doc1.docx");
    test::make_png(in / "Section A" / "img1.png");
    tree.file("in/Section B/doc2.xlsx");
    const auto out = tree.path() / "binder.pdf";

    Harness h(tree);
    EventBus bus;
    std::vector<Stage> stages;
    std::vector<double> progress;
    int finished = 0;
    bus.subscribe<StageEnteredEvent>([&](const StageEnteredEvent& e) { stages.push_back(e.stage); });
    bus.subscribe<ProgressEvent>([&](const ProgressEvent& e) { progress.push_back(e.percent); });
    bus.subscribe<JobFinishedEvent>([&](const JobFinishedEvent& e) {
        ++finished;
        assert(e.status == JobStatus::Succeeded);
    });

    auto request = request_for(in, out);
    request.events = &bus;
    const auto outcome = h.orchestrator.run(request);

    assert(outcome.ok());
    assert(!outcome.failure);
    assert(outcome.warnings.empty());
    assert(outcome.output == out);
    assert(outcome.page_count == 7);
    assert(finished == 1);
    assert(!h.orchestrator.busy());

    assert((stages == std::vector<Stage>{Stage::Validating, Stage::Collecting, Stage::ProvisionalMerge,
                                         Stage::TocGeneration, Stage::FinalAssembly, Stage::Pagination,
                                         Stage::Bookmarking, Stage::Publishing, Stage::Done}));
    assert(!progress.empty() && progress.back() == 100.0);
    for (std::size_t i = 1; i < progress.size(); ++i) assert(progress[i] >= progress[i - 1]);

    const auto pages = test::pages_text(out);
    assert(pages.size() == 7);
    assert(test::contains(pages[0], "(doc:Cover)"));
    assert(test::contains(pages[1], "(Table of Contents)"));
    assert(test::contains(pages[1], "(Section A)") && test::contains(pages[1], "(3)"));
    assert(test::contains(pages[1], "(Section B)") && test::contains(pages[1], "(6)"));
    assert(test::contains(pages[2], "(Section A)"));
    assert(test::contains(pages[3], "(doc:doc1)"));
    assert(test::contains(pages[4], "/Im0 Do"));
    assert(test::contains(pages[5], "(Section B)"));
    assert(test::contains(pages[6], "(doc:doc2)"));

    assert(!test::contains(pages[0], "/BnPageNo"));
    assert(!test::contains(pages[1], "/BnPageNo"));
    for (std::size_t i = 2; i < pages.size(); ++i) {
        assert(test::contains(pages[i], "(" + std::to_string(i + 1) + ") Tj"));
    }

    QPDF doc;
    doc.processFile(out.c_str());
    const auto all = QPDFPageDocumentHelper(doc).getAllPages();
    auto outlines = doc.getRoot().getKey("/Outlines");
    assert(outlines.getKey("/Count").getIntValue() == 2);
    auto first = outlines.getKey("/First");
    auto second = first.getKey("/Next");
    assert(first.getKey("/Title").getUTF8Value() == "Section A");
    assert(second.getKey("/Title").getUTF8Value() == "Section B");
    assert(first.getKey("/Dest").getArrayItem(0).getObjGen() == all[2].getObjectHandle().getObjGen());
    assert(second.getKey("/Dest").getArrayItem(0).getObjGen() == all[5].getObjectHandle().getObjGen());

    assert(test::dir_is_empty_or_missing(h.temp_root));
    assert(h.office->calls == 3);
}

void test_skipped_file_and_generated_cover() {
    std::cout << "[Test] Unsupported files become warnings; a title makes a cover..." << std::endl;
    test::TempTree tree("skip");
    const auto in = tree.dir("in");
    tree.file("in/Plan/agenda.docx");
    tree.file("in/Plan/notes.txt");
    const auto out = tree.path() / "out.pdf";

    Config config;
    config.page_number_start = 1;
    Harness h(tree, config);
    auto request = request_for(in, out);
    request.cover = {"Spring Festival", "Programme"};
    request.plan = PlanHint::TwoLevel;
    const auto outcome = h.orchestrator.run(request);

    assert(outcome.ok());
    assert(outcome.warnings.size() == 1);
    assert(outcome.warnings[0].kind == WarningKind::SkippedFile);
    assert(outcome.warnings[0].path == in / "Plan" / "notes.txt");

    const auto pages = test::pages_text(out);
    assert(pages.size() == 4);
    assert(test::contains(pages[0], "(Spring Festival)") && test::contains(pages[0], "(Programme)"));
    assert(test::contains(pages[0], "(1) Tj"));
    assert(test::contains(pages[1], "(Plan)") && test::contains(pages[1], "(3)"));
    assert(test::contains(pages[3], "(doc:agenda)"));
}

void test_failures_leave_output_alone() {
    std::cout << "[Test] An all-failed section fails the job in collection..." << std::endl;
    test::TempTree tree("fail");
    const auto in = tree.dir("in");
    tree.file("in/Good/ok.docx");
    tree.file("in/Broken/bad.docx");
    const auto out = tree.file("previous.pdf", "previous contents");

    Harness h(tree);
    h.office->fail_names_containing = "bad";
    EventBus bus;
    JobStatus finished = JobStatus::Succeeded;
    bus.subscribe<JobFinishedEvent>([&](const JobFinishedEvent& e) { finished = e.status; });
    auto request = request_for(in, out);
    request.events = &bus;
    const auto outcome = h.orchestrator.run(request);

    assert(outcome.status == JobStatus::Failed);
    assert(finished == JobStatus::Failed);
    assert(outcome.failure);
    assert(outcome.failure->stage == Stage::Collecting);
    assert(outcome.failure->kind == ErrorKind::Structure);
    assert(outcome.failure->path == in / "Broken");
    assert(!outcome.failure->causes.empty());
    assert(test::read_text(out) == "previous contents");
    assert(test::dir_is_empty_or_missing(h.temp_root));
    assert(h.office->cleanups > 0);

    std::cout << "[Test] Bad requests fail during validation..." << std::endl;
    const auto missing = h.orchestrator.run(request_for(in / "nope", out));
    assert(missing.status == JobStatus::Failed);
    assert(missing.failure->stage == Stage::Validating);
    assert(missing.failure->kind == ErrorKind::Path);

    const auto no_dir = h.orchestrator.run(request_for(in, tree.path() / "nowhere" / "out.pdf"));
    assert(no_dir.failure && no_dir.failure->kind == ErrorKind::Path);

    std::cout << "[Test] A tree without documents fails..." << std::endl;
    tree.file("empty/readme.txt");
    const auto empty = h.orchestrator.run(request_for(tree.path() / "empty", out));
    assert(empty.status == JobStatus::Failed);
    assert(empty.failure->kind == ErrorKind::Structure);
    assert(test::read_text(out) == "previous contents");
}

void test_compression_warning() {
    std::cout << "[Test] A failing compressor keeps the uncompressed output..." << std::endl;
    test::TempTree tree("compress");
    const auto in = tree.dir("in");
    tree.file("in/A/one.docx");
    const auto out = tree.path() / "out.pdf";

    Harness h(tree, Config{}, std::make_unique<BrokenCompressor>());
    const auto outcome = h.orchestrator.run(request_for(in, out));
    assert(outcome.ok());
    assert(outcome.warnings.size() == 1);
    assert(outcome.warnings[0].kind == WarningKind::CompressionFailed);
    assert(test::pages_text(out).size() == 3);

    auto request = request_for(in, out);
    request.compress = false;
    assert(h.orchestrator.run(request).warnings.empty());
}

void test_cancellation() {
    std::cout << "[Test] Cancellation mid-collection leaves nothing behind..." << std::endl;
    test::TempTree tree("cancel");
    const auto in = tree.dir("in");
    for (int i = 1; i <= 5; ++i) tree.file("in/Docs/file" + std::to_string(i) + ".docx");
    const auto out = tree.file("out.pdf", "untouched");

    Harness h(tree);
    std::stop_source stop;
    h.office->before_convert = [&](const fs::path&) {
        if (h.office->calls == 3) stop.request_stop();
    };
    auto request = request_for(in, out);
    request.cancel = stop.get_token();
    const auto outcome = h.orchestrator.run(request);

    assert(outcome.status == JobStatus::Cancelled);
    assert(!outcome.failure);
    assert(h.office->calls == 3);
    assert(test::read_text(out) == "untouched");
    assert(test::dir_is_empty_or_missing(h.temp_root));
    assert(!h.orchestrator.busy());
}

void test_single_job_at_a_time() {
    std::cout << "[Test] A second job is rejected while one is running..." << std::endl;
    test::TempTree tree("busy");
    const auto in = tree.dir("in");
    tree.file("in/A/one.docx");

    Harness h(tree);
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    h.office->before_convert = [&](const fs::path&) {
        entered = true;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    };

    JobOutcome first;
    std::thread worker([&] { first = h.orchestrator.run(request_for(in, tree.path() / "first.pdf")); });
    while (!entered) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    assert(h.orchestrator.busy());
    const auto second = h.orchestrator.run(request_for(in, tree.path() / "second.pdf"));
    assert(second.status == JobStatus::Busy);
    assert(!fs::exists(tree.path() / "second.pdf"));

    release = true;
    worker.join();
    assert(first.ok());
    assert(!h.orchestrator.busy());

    h.office->before_convert = nullptr;
    assert(h.orchestrator.run(request_for(in, tree.path() / "second.pdf")).ok());
}

void test_office_scratch_under_job_dir() {
    std::cout << "[Test] Office sessions live inside the job directory..." << std::endl;
    test::TempTree tree("scratch");
    const auto in = tree.dir("in");
    tree.file("in/old.doc");
    test::make_png(in / "Photos" / "img.png");
    const auto log = tree.path() / "profiles.log";
    const auto temp_root = tree.dir("tmp");

    Config config;
    config.retry.base_backoff = std::chrono::milliseconds(10);
    config.temp_root = temp_root;
    // records the profile directory it was given, then fails
    config.office_command = "sh -c \"echo $1 >> " + log.string() + "; exit 1\" office {profile} {input}";
    MergeOrchestrator orchestrator(config);
    assert(orchestrator.registry().scratch_root() == temp_root);

    const auto outcome = orchestrator.run(request_for(in, tree.path() / "out.pdf"));
    assert(outcome.ok());
    assert(outcome.page_count == 3);
    assert(outcome.warnings.size() == 1);
    assert(outcome.warnings[0].kind == WarningKind::FailedFile);
    assert(outcome.warnings[0].path == in / "old.doc");

    std::istringstream lines(test::read_text(log));
    std::string profile;
    int sessions = 0;
    while (std::getline(lines, profile)) {
        ++sessions;
        const std::string job_root = (temp_root / "binder-job").string() + "/";
        assert(profile.starts_with(job_root));
        assert(test::contains(profile, "/binder-office/"));
        assert(!fs::exists(profile));
    }
    assert(sessions >= 1);
    assert(!fs::exists(temp_root / "binder-office"));
    assert(test::dir_is_empty_or_missing(temp_root / "binder-job"));
    assert(orchestrator.registry().scratch_root() == temp_root);
}

int main() {
    test_full_job();
    test_skipped_file_and_generated_cover();
    test_failures_leave_output_alone();
    test_compression_warning();
    test_cancellation();
    test_single_job_at_a_time();
    test_office_scratch_under_job_dir();
    std::cout << "[PASS] Merge jobs behave as expected." << std::endl;
    return 0;
}
