#ifndef BINDER_REPORT_GENERATOR_HPP
#define BINDER_REPORT_GENERATOR_HPP

#include "../../../libbinder/include/job.hpp"
#include <filesystem>

/**
 * @brief Print a human readable summary of a finished job to stdout.
 */
void print_console_report(const binder::JobOutcome& outcome, double total_seconds);

/**
 * @brief Write the job's warnings as CSV (kind, path, message).
 * @return False if the file could not be written.
 */
bool export_csv_report(const binder::JobOutcome& outcome,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif // BINDER_REPORT_GENERATOR_HPP
