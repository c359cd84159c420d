#ifndef BINDER_CLI_PARSER_HPP
#define BINDER_CLI_PARSER_HPP

#include "../../../libbinder/include/job.hpp"
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool quiet = false;
    bool no_compress = false;

    std::filesystem::path root;
    std::filesystem::path output_path;
    std::filesystem::path config_path;
    std::filesystem::path report_path;
    std::filesystem::path log_file;
    std::string log_level = "ERROR";

    binder::PlanHint plan = binder::PlanHint::Auto;
    std::string title;
    std::string subtitle;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // BINDER_CLI_PARSER_HPP
