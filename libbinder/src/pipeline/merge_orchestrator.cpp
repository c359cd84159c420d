#include "../../include/merge_orchestrator.hpp"
#include "../../include/atomic_file.hpp"
#include "../../include/document_collector.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/structure_detector.hpp"
#include <numeric>
#include <optional>

namespace binder {

namespace {

constexpr std::string_view kTag = "Orchestrator";
constexpr int kMaxTocPasses = 4;
constexpr double kCollectingShare = 70.0;

// percent reached once a stage has completed
double progress_after(const Stage stage) {
    switch (stage) {
        case Stage::Validating:       return 0.0;
        case Stage::Collecting:       return kCollectingShare;
        case Stage::ProvisionalMerge: return 76.0;
        case Stage::TocGeneration:    return 80.0;
        case Stage::FinalAssembly:    return 86.0;
        case Stage::Pagination:       return 90.0;
        case Stage::Bookmarking:      return 93.0;
        case Stage::Compressing:      return 97.0;
        case Stage::Publishing:       return 99.0;
        case Stage::Done:             return 100.0;
    }
    return 0.0;
}

// releases the in-flight flag on every exit path
struct BusyGuard {
    std::atomic<bool>& flag;
    ~BusyGuard() { flag.store(false); }
};

void validate_request(const JobRequest& request) {
    std::error_code ec;
    if (request.root.empty()) {
        throw Error(ErrorKind::Path, "no input directory given");
    }
    if (!std::filesystem::is_directory(request.root, ec)) {
        throw Error(ErrorKind::Path, "input directory does not exist: " + request.root.string(), request.root);
    }
    if (request.output.empty() || !request.output.has_filename()) {
        throw Error(ErrorKind::Path, "no output file given", request.output);
    }
    if (std::filesystem::is_directory(request.output, ec)) {
        throw Error(ErrorKind::Path, "output is a directory: " + request.output.string(), request.output);
    }
    const auto parent = request.output.has_parent_path() ? request.output.parent_path() : std::filesystem::path(".");
    if (!std::filesystem::is_directory(parent, ec)) {
        throw Error(ErrorKind::Path, "output directory does not exist: " + parent.string(), parent);
    }
}

} // namespace

MergeOrchestrator::MergeOrchestrator(const Config& config)
    : MergeOrchestrator(config, make_compressor(config)) {}

MergeOrchestrator::MergeOrchestrator(const Config& config, std::unique_ptr<ICompressor> compressor)
    : config_(config),
      registry_(config_, config_.effective_temp_root()),
      pdf_(config_, std::move(compressor)) {}

JobOutcome MergeOrchestrator::run(const JobRequest& request) {
    if (busy_.exchange(true)) {
        Logger::log(LogLevel::Warning, "A job is already running; request for " + request.root.string() + " rejected", kTag);
        JobOutcome busy;
        busy.status = JobStatus::Busy;
        return busy;
    }
    BusyGuard guard{busy_};
    JobOutcome outcome = execute(request);
    if (request.events) request.events->publish(JobFinishedEvent{outcome.status});
    return outcome;
}

JobOutcome MergeOrchestrator::execute(const JobRequest& request) {
    JobOutcome outcome;
    Stage stage = Stage::Validating;
    std::optional<ScopedTempDir> job_dir;
    const std::filesystem::path idle_scratch = registry_.scratch_root();

    auto publish_progress = [&](const double percent) {
        if (request.events) request.events->publish(ProgressEvent{percent});
    };
    auto enter = [&](const Stage next) {
        throw_if_cancelled(request.cancel.stop_requested(), to_string(next));
        if (stage != next) publish_progress(progress_after(stage));
        stage = next;
        Logger::log(LogLevel::Debug, std::string("Entering ") + to_string(stage), kTag);
        if (request.events) request.events->publish(StageEnteredEvent{stage});
    };

    Logger::log(LogLevel::Info, "Job started: " + request.root.string() + " -> " + request.output.string(), kTag);

    try {
        enter(Stage::Validating);
        config_.validate();
        validate_request(request);
        job_dir.emplace(request.root, "job", config_.effective_temp_root());
        const auto& dir = job_dir->path();
        registry_.set_scratch_root(dir);

        enter(Stage::Collecting);
        const StructureDetector detector(config_);
        const FolderStructure structure = detector.resolve(request.root, request.plan);
        DocumentCollector collector(config_, registry_, pdf_, dir, request.events);
        collector.set_progress_range(0.0, kCollectingShare);
        MergePlan plan = collector.collect_and_convert(request.root, structure, request.cancel);
        outcome.warnings = plan.warnings;
        if (plan.body.empty()) {
            throw Error(ErrorKind::Structure, "no convertible documents under " + request.root.string(), request.root);
        }

        enter(Stage::ProvisionalMerge);
        const auto body_pdf = dir / "body.pdf";
        const std::vector<int> body_counts = pdf_.merge(plan.body_paths(), body_pdf);

        enter(Stage::TocGeneration);
        std::optional<std::filesystem::path> cover_pdf;
        if (plan.cover) {
            cover_pdf = plan.cover->pdf;
        } else if (!request.cover.title.empty()) {
            cover_pdf = dir / "cover.pdf";
            pdf_.create_cover_pdf(request.cover, *cover_pdf);
        }
        const int cover_pages = cover_pdf ? pdf_.page_count(*cover_pdf) : 0;

        // the TOC length shifts every page number after it, so repeat until it settles
        const auto toc_pdf = dir / "toc.pdf";
        int toc_pages = pdf_.toc_page_count(plan.anchors.size());
        std::vector<TocEntry> entries;
        bool settled = false;
        for (int pass = 0; pass < kMaxTocPasses && !settled; ++pass) {
            entries = plan.resolve(body_counts, cover_pages + toc_pages);
            const int written = pdf_.create_toc_pdf(entries, toc_pdf);
            settled = written == toc_pages;
            toc_pages = written;
        }
        if (!settled) {
            throw Error(ErrorKind::Processing, "table of contents page count did not settle", toc_pdf);
        }
        validate_toc(entries);

        enter(Stage::FinalAssembly);
        std::vector<std::filesystem::path> parts;
        if (cover_pdf) parts.push_back(*cover_pdf);
        parts.push_back(toc_pdf);
        parts.push_back(body_pdf);
        const auto assembled = dir / "assembled.pdf";
        const auto part_counts = pdf_.merge(parts, assembled);
        const int total_pages = std::accumulate(part_counts.begin(), part_counts.end(), 0);

        enter(Stage::Pagination);
        const int start = config_.page_number_start.value_or(cover_pages + toc_pages + 1);
        if (start <= total_pages) {
            pdf_.add_page_numbers(assembled, start);
        } else {
            Logger::log(LogLevel::Warning,
                "Page numbering starts at " + std::to_string(start) + " but the document has " +
                std::to_string(total_pages) + " pages; nothing stamped", kTag);
        }

        enter(Stage::Bookmarking);
        pdf_.set_bookmarks(assembled, entries);

        if (request.compress && pdf_.has_compressor()) {
            enter(Stage::Compressing);
            if (!pdf_.compress(assembled)) {
                outcome.warnings.push_back({WarningKind::CompressionFailed, request.output,
                                            "compression failed; the uncompressed document was kept"});
            }
        }

        enter(Stage::Publishing);
        atomic_copy(assembled, request.output);

        enter(Stage::Done);
        publish_progress(progress_after(Stage::Done));
        outcome.status = JobStatus::Succeeded;
        outcome.output = request.output;
        outcome.page_count = total_pages;
        Logger::log(LogLevel::Info,
            "Job finished: " + request.output.string() + " (" + std::to_string(total_pages) + " pages, " +
            std::to_string(outcome.warnings.size()) + " warning(s))", kTag);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled) {
            Logger::log(LogLevel::Info, std::string("Job cancelled: ") + e.what(), kTag);
            outcome.status = JobStatus::Cancelled;
        } else {
            Logger::log(LogLevel::Error, std::string("Job failed in ") + to_string(stage) + ": " + e.what(), kTag);
            outcome.status = JobStatus::Failed;
            outcome.failure = JobFailure{stage, e.kind(), e.path(), e.what(), describe_chain(std::current_exception())};
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Job failed in ") + to_string(stage) + ": " + e.what(), kTag);
        outcome.status = JobStatus::Failed;
        outcome.failure = JobFailure{stage, ErrorKind::Processing, {}, e.what(), describe_chain(std::current_exception())};
    }

    // converter sessions end here, before the job directory goes away
    registry_.set_scratch_root(idle_scratch);
    job_dir.reset();
    return outcome;
}

} // namespace binder
