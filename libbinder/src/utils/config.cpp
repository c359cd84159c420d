#include "../../include/config.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace binder {

namespace {

using nlohmann::json;

// copies j[key] into out when present; type mismatches become configuration errors
template <typename T>
void read(const json& j, const char* section, const char* key, T& out) {
    if (!j.is_object() || !j.contains(key)) {
        return;
    }
    try {
        out = j.at(key).get<T>();
    } catch (const json::exception&) {
        throw_nested(ErrorKind::Configuration,
                     std::string("invalid value for ") + section + "." + key);
    }
}

template <typename Rep, typename Period>
void read_duration(const json& j, const char* section, const char* key,
                   std::chrono::duration<Rep, Period>& out) {
    Rep count = out.count();
    read(j, section, key, count);
    out = std::chrono::duration<Rep, Period>(count);
}

const json& section_of(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name)) {
        return empty;
    }
    const json& s = root.at(name);
    if (!s.is_object()) {
        throw Error(ErrorKind::Configuration, std::string("section '") + name + "' must be an object");
    }
    return s;
}

} // namespace

Config Config::from_json(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error&) {
        throw_nested(ErrorKind::Configuration, "configuration is not valid JSON");
    }
    if (!root.is_object()) {
        throw Error(ErrorKind::Configuration, "configuration root must be an object");
    }

    Config c;

    const json& retry = section_of(root, "retry");
    read(retry, "retry", "max_attempts", c.retry.max_attempts);
    read_duration(retry, "retry", "base_backoff_ms", c.retry.base_backoff);
    read_duration(retry, "retry", "office_timeout_s", c.retry.office_timeout);
    read_duration(retry, "retry", "legacy_timeout_s", c.retry.legacy_timeout);
    read_duration(retry, "retry", "legacy_ready_timeout_s", c.retry.legacy_ready_timeout);
    read(retry, "retry", "output_stable_polls", c.retry.output_stable_polls);

    const json& conv = section_of(root, "converters");
    read(conv, "converters", "office_command", c.office_command);
    read(conv, "converters", "legacy_command", c.legacy_command);

    const json& structure = section_of(root, "structure");
    read(structure, "structure", "cover_keywords", c.cover_keywords);
    read(structure, "structure", "category_keywords", c.category_keywords);
    read(structure, "structure", "confidence_threshold", c.confidence_threshold);
    read(structure, "structure", "max_scan_depth", c.max_scan_depth);

    const json& collector = section_of(root, "collector");
    read(collector, "collector", "separator_for_subsections", c.separator_for_subsections);
    read(collector, "collector", "fail_on_empty_section", c.fail_on_empty_section);
    read(collector, "collector", "strip_numeric_prefix", c.strip_numeric_prefix);

    const json& layout = section_of(root, "layout");
    read(layout, "layout", "toc_title", c.toc_title);
    read(layout, "layout", "empty_toc_text", c.empty_toc_text);
    read(layout, "layout", "toc_font_size", c.toc_font_size);
    read(layout, "layout", "title_font_size", c.title_font_size);
    if (layout.contains("page_number_start") && !layout.at("page_number_start").is_null()) {
        int start = 0;
        read(layout, "layout", "page_number_start", start);
        c.page_number_start = start;
    }
    read(layout, "layout", "page_number_font_size", c.page_number_font_size);
    read(layout, "layout", "page_number_bottom_margin", c.page_number_bottom_margin);

    const json& compressor = section_of(root, "compressor");
    read(compressor, "compressor", "command", c.compressor_command);
    read_duration(compressor, "compressor", "timeout_s", c.compressor_timeout);

    std::string temp_root;
    read(root, "root", "temp_root", temp_root);
    c.temp_root = temp_root;

    c.validate();
    return c;
}

Config Config::load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error(ErrorKind::Configuration, "cannot read configuration file: " + path.string(), path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    Logger::log(LogLevel::Debug, "Loading configuration from " + path.string(), "Config");
    try {
        return from_json(ss.str());
    } catch (const Error&) {
        throw_nested(ErrorKind::Configuration, "invalid configuration file: " + path.string(), path);
    }
}

void Config::validate() const {
    auto fail = [](const std::string& what) {
        throw Error(ErrorKind::Configuration, what);
    };
    if (retry.max_attempts < 1) fail("retry.max_attempts must be at least 1");
    if (retry.base_backoff.count() < 0) fail("retry.base_backoff_ms must not be negative");
    if (retry.office_timeout.count() <= 0) fail("retry.office_timeout_s must be positive");
    if (retry.legacy_timeout.count() <= 0) fail("retry.legacy_timeout_s must be positive");
    if (retry.legacy_ready_timeout.count() <= 0) fail("retry.legacy_ready_timeout_s must be positive");
    if (retry.output_stable_polls < 1) fail("retry.output_stable_polls must be at least 1");
    if (office_command.find("{input}") == std::string::npos) fail("converters.office_command must contain {input}");
    if (!legacy_command.empty() &&
        (legacy_command.find("{input}") == std::string::npos ||
         legacy_command.find("{output}") == std::string::npos)) {
        fail("converters.legacy_command must contain {input} and {output}");
    }
    if (confidence_threshold < 0.0 || confidence_threshold > 1.0) fail("structure.confidence_threshold must be within [0, 1]");
    if (max_scan_depth < 1) fail("structure.max_scan_depth must be at least 1");
    if (toc_font_size <= 0.0 || title_font_size <= 0.0 || page_number_font_size <= 0.0) fail("layout font sizes must be positive");
    if (page_number_bottom_margin < 0.0) fail("layout.page_number_bottom_margin must not be negative");
    if (page_number_start && *page_number_start < 1) fail("layout.page_number_start must be at least 1");
    if (!compressor_command.empty() &&
        (compressor_command.find("{input}") == std::string::npos ||
         compressor_command.find("{output}") == std::string::npos)) {
        fail("compressor.command must contain {input} and {output}");
    }
    if (compressor_timeout.count() <= 0) fail("compressor.timeout_s must be positive");
}

std::filesystem::path Config::effective_temp_root() const {
    return temp_root.empty() ? std::filesystem::temp_directory_path() : temp_root;
}

} // namespace binder
