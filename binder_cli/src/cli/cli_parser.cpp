#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <map>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, summary).");

    app.add_flag("--no-compress", settings.no_compress,
                 "Skip the compression stage even if a compressor is configured.");

    // --- Options ---
    app.add_option("-o,--output", settings.output_path,
                   "Destination PDF. Replaced only if the whole job succeeds.")
                   ->required();

    app.add_option("--config", settings.config_path,
                   "JSON configuration file (defaults are used for missing keys).")
                   ->check(CLI::ExistingFile);

    app.add_option("--plan", settings.plan, "Folder layout: 'auto' (default), 'two-level' or 'three-level'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, binder::PlanHint>{
                {"auto", binder::PlanHint::Auto},
                {"two-level", binder::PlanHint::TwoLevel},
                {"three-level", binder::PlanHint::ThreeLevel}
            }, CLI::ignore_case));

    app.add_option("--title", settings.title,
                   "Title of a generated cover page (used when the folder has no cover document).");

    app.add_option("--subtitle", settings.subtitle,
                   "Subtitle of the generated cover page.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("root", settings.root, "Folder holding the documents to bind.")
        ->required()
        ->check(CLI::ExistingDirectory);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a file, not a directory.");
        }
        if (!settings.subtitle.empty() && settings.title.empty()) {
            throw CLI::ValidationError("--subtitle requires --title.");
        }
    });
}
