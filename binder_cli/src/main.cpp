#include <algorithm>
#include <iostream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <chrono>
#include <clocale>
#include <iomanip>
#include <future>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libbinder/include/binder.hpp"
#include "../../libbinder/include/config.hpp"
#include "../../libbinder/include/errors.hpp"
#include "../../libbinder/include/event_bus.hpp"
#include "../../libbinder/include/events.hpp"
#include "../../libbinder/include/logger.hpp"

// simple progress bar printer
inline void print_progress_bar(const double percent, const std::string& stage, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 60u ? term_width - 60u : 20u);

    const double progress = std::clamp(percent / 100.0, 0.0, 1.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && progress < 1.0) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
              << " " << std::left << std::setw(18) << stage << std::right
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace binder;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static int exit_code_for(const JobStatus status) {
    switch (status) {
        case JobStatus::Succeeded: return 0;
        case JobStatus::Failed:    return 1;
        case JobStatus::Busy:      return 3;
        case JobStatus::Cancelled: return 130; // standard exit code for SIGINT
    }
    return 1;
}

int main(int argc, char* argv[]) {

    CLI::App app{"binder: merge a folder of documents into one navigable PDF."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        app.exit(e);
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file.string(), false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
            return 2;
        }
        Logger::add_sink(std::move(fileSink));
    }
    {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->silent = settings.log_level == "NONE";
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }
    init_utf8_locale();

    Config config;
    try {
        if (!settings.config_path.empty()) {
            config = Config::load(settings.config_path);
        }
    } catch (const Error& e) {
        std::cerr << RED << "Configuration error: " << e.what() << RESET << std::endl;
        for (const auto& cause : describe_chain(std::current_exception())) {
            Logger::log(LogLevel::Debug, cause, "main");
        }
        return 1;
    }

    Binder binder(config);
    EventBus bus;

    const auto start_total = std::chrono::steady_clock::now();
    const auto elapsed = [&] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
    };

    std::atomic<double> last_percent{0.0};
    std::string stage_name = to_string(Stage::Validating);

    bus.subscribe<StageEnteredEvent>([&](const StageEnteredEvent& e) {
        stage_name = to_string(e.stage);
        if (!settings.quiet) print_progress_bar(last_percent.load(), stage_name, elapsed());
    });

    bus.subscribe<ProgressEvent>([&](const ProgressEvent& e) {
        last_percent.store(e.percent);
        if (!settings.quiet) print_progress_bar(e.percent, stage_name, elapsed());
    });

    bus.subscribe<FileSkippedEvent>([&](const FileSkippedEvent& e) {
        if (!settings.quiet) {
            std::cerr << YELLOW << "\n[SKIP] " << e.source.filename().string()
                      << " (" << e.reason << ")" << RESET << std::endl;
        }
    });

    bus.subscribe<FileFailedEvent>([&](const FileFailedEvent& e) {
        if (!settings.quiet) {
            std::cerr << RED << "\n[FAIL] " << e.source.filename().string()
                      << " after " << e.attempts << " attempt(s): " << e.message << RESET << std::endl;
        }
    });

    JobRequest request;
    request.root = settings.root;
    request.output = settings.output_path;
    request.plan = settings.plan;
    request.cover = CoverInfo{settings.title, settings.subtitle};
    request.compress = !settings.no_compress;
    request.events = &bus;

    auto future = binder.start(std::move(request));
    bool stop_sent = false;
    while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (interrupted.load() && !stop_sent) {
            std::cerr << CYAN
                      << "\n[INTERRUPT] Stop detected. Waiting for the current file to finish..."
                      << RESET << std::endl;
            binder.stop();
            stop_sent = true;
        }
    }

    JobOutcome outcome;
    try {
        outcome = future.get();
    } catch (const std::exception& e) {
        std::cerr << RED << "\nUnexpected error: " << e.what() << RESET << std::endl;
        return 1;
    }

    const double total_seconds = elapsed();
    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(outcome, total_seconds);
    } else if (outcome.status == JobStatus::Failed && outcome.failure) {
        std::cerr << RED << "Failed during " << to_string(outcome.failure->stage) << ": "
                  << outcome.failure->message << RESET << std::endl;
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(outcome, settings.report_path, total_seconds) && outcome.ok()) {
            return 1;
        }
    }

    return exit_code_for(outcome.status);
}
