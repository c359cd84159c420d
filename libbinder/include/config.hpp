/**
 * @file config.hpp
 * @brief Per-job tunables with documented defaults.
 */

#ifndef BINDER_CONFIG_HPP
#define BINDER_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace binder {

/**
 * @brief Retry policy for the automation-backed converters.
 */
struct RetryPolicy {
    int max_attempts = 3;                              ///< Attempts per file, including the first
    std::chrono::milliseconds base_backoff{2000};      ///< Wait before attempt n+1 is n * base_backoff
    std::chrono::seconds office_timeout{120};          ///< Budget of one office conversion attempt
    std::chrono::seconds legacy_timeout{120};          ///< Budget of one legacy conversion attempt
    std::chrono::seconds legacy_ready_timeout{30};     ///< Time for the legacy output file to appear
    int output_stable_polls = 3;                       ///< Polls with unchanged size before output is final
};

/**
 * @brief Immutable configuration threaded from the orchestrator into every component.
 *
 * Every member carries its default. Values are injected by the caller,
 * typically via Config::load() on a JSON file; no component reads
 * settings from anywhere else.
 */
struct Config {
    RetryPolicy retry;

    /// argv template; {input}, {outdir} and {profile} are substituted per attempt.
    std::string office_command =
        "soffice --headless --norestore -env:UserInstallation=file://{profile} "
        "--convert-to pdf --outdir {outdir} {input}";
    /// argv template with {input} and {output}; empty disables the legacy converter.
    std::string legacy_command;

    std::vector<std::string> cover_keywords{"cover", "\xE8\xA1\xA8\xE7\xB4\x99"};
    std::vector<std::string> category_keywords;   ///< Folder names typical of three-level plans
    double confidence_threshold = 0.7;
    int max_scan_depth = 10;

    bool separator_for_subsections = true;
    bool fail_on_empty_section = true;
    bool strip_numeric_prefix = true;

    std::string toc_title = "Table of Contents";
    std::string empty_toc_text = "No entries";
    double toc_font_size = 12.0;
    double title_font_size = 24.0;

    std::optional<int> page_number_start;          ///< 1-based physical page; default is after cover and TOC
    double page_number_font_size = 10.0;
    double page_number_bottom_margin = 30.0;

    /// argv template with {input} and {output}; empty means no compressor.
    std::string compressor_command;
    std::chrono::seconds compressor_timeout{300};

    std::filesystem::path temp_root;               ///< Empty means the system temp directory

    /**
     * @brief Parse a JSON document. Missing keys keep their defaults.
     * @throws Error(ErrorKind::Configuration) on malformed JSON, wrong types
     * or values that fail validate().
     */
    static Config from_json(const std::string& text);

    /**
     * @brief Load and validate a JSON configuration file.
     * @throws Error(ErrorKind::Configuration) if the file cannot be read or parsed.
     */
    static Config load(const std::filesystem::path& path);

    /**
     * @brief Check ranges and required values.
     * @throws Error(ErrorKind::Configuration) naming the first bad setting.
     */
    void validate() const;

    /// @return Directory under which job directories are created.
    [[nodiscard]] std::filesystem::path effective_temp_root() const;
};

} // namespace binder

#endif // BINDER_CONFIG_HPP
