#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libbinder/include/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

void print_console_report(const binder::JobOutcome& outcome, const double total_seconds) {
    const bool use_colors = is_stdout_a_tty();
    const auto color = [use_colors](const char* c) { return use_colors ? c : ""; };
    const unsigned width = std::min(get_terminal_width(), 100u);

    std::cout << "\n" << std::string(width, '=') << "\n";
    switch (outcome.status) {
        case binder::JobStatus::Succeeded:
            std::cout << color(GREEN) << "Done: " << outcome.output.string()
                      << " (" << outcome.page_count << " pages)" << color(RESET) << "\n";
            break;
        case binder::JobStatus::Cancelled:
            std::cout << color(CYAN) << "Cancelled. The output was not modified." << color(RESET) << "\n";
            break;
        case binder::JobStatus::Busy:
            std::cout << color(YELLOW) << "Another job is running." << color(RESET) << "\n";
            break;
        case binder::JobStatus::Failed:
            std::cout << color(RED) << "Failed";
            if (outcome.failure) {
                const auto& f = *outcome.failure;
                std::cout << " during " << binder::to_string(f.stage)
                          << " (" << binder::to_string(f.kind) << ")";
                if (!f.path.empty()) std::cout << "\n  at " << f.path.string();
                for (const auto& cause : f.causes) {
                    std::cout << "\n  " << cause;
                }
            }
            std::cout << color(RESET) << "\n";
            break;
    }

    if (!outcome.warnings.empty()) {
        std::cout << "\n" << color(YELLOW) << outcome.warnings.size() << " warning(s):" << color(RESET) << "\n";
        for (const auto& w : outcome.warnings) {
            std::cout << "  [" << std::left << std::setw(18) << binder::to_string(w.kind) << "] "
                      << w.path.string() << ": " << w.message << "\n";
        }
    }
    std::cout << "\nElapsed: " << std::fixed << std::setprecision(1) << total_seconds << "s\n";
    std::cout << std::string(width, '=') << std::endl;
}

bool export_csv_report(const binder::JobOutcome& outcome,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path, std::ios::trunc);
    if (!out) {
        binder::Logger::log(binder::LogLevel::Error, "Cannot write report " + output_path.string(), "report");
        return false;
    }
    out << "kind,path,message\n";
    for (const auto& w : outcome.warnings) {
        out << binder::to_string(w.kind) << ','
            << csv_escape(w.path.string()) << ','
            << csv_escape(w.message) << '\n';
    }
    if (outcome.failure) {
        out << "failed," << csv_escape(outcome.failure->path.string()) << ','
            << csv_escape(std::string(binder::to_string(outcome.failure->stage)) + ": " + outcome.failure->message) << '\n';
    }
    out << "\n# status," << binder::to_string(outcome.status)
        << "\n# pages," << outcome.page_count
        << "\n# seconds," << std::fixed << std::setprecision(2) << total_seconds << '\n';
    return static_cast<bool>(out);
}
