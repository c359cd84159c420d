#include "../../include/document_collector.hpp"
#include "../../include/converter_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/pdf_processor.hpp"
#include <algorithm>
#include <cstdio>
#include <iterator>

namespace binder {

namespace {

constexpr std::string_view kTag = "DocumentCollector";

std::string join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s.empty() ? "(none)" : s;
    }
    return out;
}

// moves the fragments of a finished section behind those already in parent
void commit(std::vector<Fragment>& fragments, std::vector<TocAnchor>& anchors,
            std::vector<Fragment>&& section_fragments, std::vector<TocAnchor>&& section_anchors) {
    const std::size_t base = fragments.size();
    for (auto& a : section_anchors) {
        a.fragment += base;
        anchors.push_back(std::move(a));
    }
    std::ranges::move(section_fragments, std::back_inserter(fragments));
}

} // namespace

DocumentCollector::DocumentCollector(const Config& config,
                                     ConverterRegistry& registry,
                                     PdfProcessor& pdf,
                                     std::filesystem::path job_dir,
                                     EventBus* events)
    : config_(config), registry_(registry), pdf_(pdf), job_dir_(std::move(job_dir)), events_(events) {}

void DocumentCollector::set_progress_range(const double from, const double to) noexcept {
    progress_from_ = from;
    progress_to_ = to;
}

template <typename Event>
void DocumentCollector::publish(const Event& e) const {
    if (events_) events_->publish(e);
}

std::string DocumentCollector::sanitize_title(const std::string_view name, const bool strip_numeric_prefix) {
    if (!strip_numeric_prefix) return std::string(name);
    std::size_t i = 0;
    while (i < name.size()) {
        const char c = name[i];
        if ((c >= '0' && c <= '9') || c == ' ' || c == '.' || c == '-' || c == '_') {
            ++i;
        } else {
            break;
        }
    }
    std::string title(name.substr(i));
    std::ranges::replace(title, '_', ' ');
    while (!title.empty() && title.back() == ' ') title.pop_back();
    return title.empty() ? std::string(name) : title;
}

std::vector<std::filesystem::directory_entry> DocumentCollector::ordered_entries(
    const std::filesystem::path& dir, std::vector<std::filesystem::path>* skipped_links) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw Error(ErrorKind::Path, "cannot read directory " + dir.string() + ": " + ec.message(), dir);
    }
    std::vector<std::filesystem::directory_entry> entries;
    for (const auto& entry : it) {
        if (entry.is_symlink(ec)) {
            Logger::log(LogLevel::Debug, "Not following symlink " + entry.path().string(), kTag);
            if (skipped_links) skipped_links->push_back(entry.path());
            continue;
        }
        if (entry.is_directory(ec) || entry.is_regular_file(ec)) {
            entries.push_back(entry);
        }
    }
    std::ranges::sort(entries, [](const auto& a, const auto& b) {
        std::error_code e1, e2;
        const bool da = a.is_directory(e1);
        const bool db = b.is_directory(e2);
        if (da != db) return da;
        return a.path().filename().string() < b.path().filename().string();
    });
    return entries;
}

bool DocumentCollector::is_cover_name(const std::filesystem::path& file) const {
    const std::string stem = ascii_lower(file.stem().string());
    return std::ranges::any_of(config_.cover_keywords, [&](const std::string& k) {
        return !k.empty() && stem.find(ascii_lower(k)) != std::string::npos;
    });
}

std::filesystem::path DocumentCollector::next_fragment_path(const std::filesystem::path& source,
                                                            const std::string_view stem_override) {
    char index[16];
    std::snprintf(index, sizeof(index), "%04zu_", ++sequence_);
    std::string stem = stem_override.empty() ? source.stem().string() : std::string(stem_override);
    if (stem.size() > 64) stem.resize(64);
    return job_dir_ / (index + stem + ".pdf");
}

std::size_t DocumentCollector::count_files(const std::filesystem::path& dir, const int depth, const int max_depth) const {
    if (depth > max_depth) return 0;
    std::size_t n = 0;
    for (const auto& entry : ordered_entries(dir)) {
        std::error_code ec;
        if (entry.is_directory(ec)) {
            n += count_files(entry.path(), depth + 1, max_depth);
        } else if (!ConverterRegistry::is_ignorable(entry.path())) {
            ++n;
        }
    }
    return n;
}

void DocumentCollector::file_done() {
    ++files_done_;
    if (files_total_ == 0) return;
    const double share = static_cast<double>(std::min(files_done_, files_total_)) / static_cast<double>(files_total_);
    publish(ProgressEvent{progress_from_ + (progress_to_ - progress_from_) * share});
}

MergePlan DocumentCollector::collect_and_convert(const std::filesystem::path& root,
                                                 const FolderStructure& structure,
                                                 std::stop_token stop) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw Error(ErrorKind::Path, "input is not a directory: " + root.string(), root);
    }
    stop_ = std::move(stop);
    files_done_ = 0;
    files_total_ = count_files(root, 0, structure.max_depth);
    Logger::log(LogLevel::Info,
        "Collecting " + std::to_string(files_total_) + " file(s) from " + root.string() +
        " as " + to_string(structure.variant), kTag);

    MergePlan plan;
    Section root_files;
    std::vector<std::filesystem::path> loose_files;
    bool cover_taken = false;

    std::vector<std::filesystem::path> links;
    for (const auto& entry : ordered_entries(root, &links)) {
        throw_if_cancelled(stop_.stop_requested(), "collection");
        std::error_code e;
        if (entry.is_directory(e)) {
            Section sections;
            collect_directory(entry.path(), 1, structure, sections);
            commit(plan.body, plan.anchors, std::move(sections.fragments), std::move(sections.anchors));
            std::ranges::move(sections.warnings, std::back_inserter(plan.warnings));
            continue;
        }
        const auto& file = entry.path();
        if (!cover_taken && !ConverterRegistry::is_ignorable(file) && ConverterRegistry::kind_for(file) &&
            is_cover_name(file)) {
            cover_taken = true;
            // a cover that fails to convert is reported and left out
            collect_cover(file, plan);
            continue;
        }
        loose_files.push_back(file);
    }

    for (const auto& file : loose_files) {
        collect_file(file, root_files);
    }
    skip_links(links, root_files.warnings);
    commit(plan.body, plan.anchors, std::move(root_files.fragments), std::move(root_files.anchors));
    std::ranges::move(root_files.warnings, std::back_inserter(plan.warnings));

    Logger::log(LogLevel::Info,
        "Collected " + std::to_string(plan.body.size()) + " fragment(s), " +
        std::to_string(plan.anchors.size()) + " TOC entr" + (plan.anchors.size() == 1 ? "y" : "ies") + ", " +
        std::to_string(plan.warnings.size()) + " warning(s)" + (plan.cover ? ", with cover" : ""),
        kTag);
    return plan;
}

bool DocumentCollector::collect_cover(const std::filesystem::path& file, MergePlan& plan) {
    throw_if_cancelled(stop_.stop_requested(), "collection");
    const auto result = registry_.convert(file, next_fragment_path(file), stop_);
    file_done();
    if (!result.ok()) {
        const std::string reason = result.failure_reason ? to_string(*result.failure_reason) : "failed";
        Logger::log(LogLevel::Warning, "Cover " + file.string() + " failed: " + result.message, kTag);
        plan.warnings.push_back({WarningKind::FailedFile, file, "cover: " + reason + ": " + result.message});
        publish(FileFailedEvent{file, reason, result.message, result.attempts_used});
        return false;
    }
    plan.cover = Fragment{*result.pdf_path, FragmentRole::Cover, file};
    publish(FileConvertedEvent{file, *result.pdf_path, result.attempts_used});
    Logger::log(LogLevel::Info, "Using " + file.filename().string() + " as cover", kTag);
    return true;
}

void DocumentCollector::collect_directory(const std::filesystem::path& dir, const int depth,
                                          const FolderStructure& structure, Section& parent) {
    throw_if_cancelled(stop_.stop_requested(), "collection");
    if (depth > structure.max_depth) {
        skip_too_deep(dir, structure.max_depth, parent.warnings);
        return;
    }

    const int level = structure.level_for_depth(depth);
    if (level == 0) {
        collect_entries(dir, depth, structure, parent);
        return;
    }

    const std::string title = sanitize_title(dir.filename().string(), config_.strip_numeric_prefix);
    Section section;
    collect_entries(dir, depth, structure, section);
    std::ranges::move(section.warnings, std::back_inserter(parent.warnings));

    if (section.content_count == 0) {
        const std::vector<std::string> formats(section.failed_formats.begin(), section.failed_formats.end());
        publish(SectionEmptyEvent{dir, formats});
        if (!section.failed_formats.empty()) {
            const std::string message = "section '" + title + "' has no convertible documents; failed formats: " +
                                        join(section.failed_formats);
            if (config_.fail_on_empty_section) {
                throw Error(ErrorKind::Structure, message, dir);
            }
            Logger::log(LogLevel::Warning, message, kTag);
            parent.warnings.push_back({WarningKind::EmptySection, dir, message});
        } else {
            const std::string message = "section '" + title + "' has no convertible documents";
            Logger::log(LogLevel::Warning, message, kTag);
            parent.warnings.push_back({WarningKind::EmptySection, dir, message});
        }
        parent.failed_formats.insert(section.failed_formats.begin(), section.failed_formats.end());
        return;
    }

    const bool with_separator = level == 1 || config_.separator_for_subsections;
    if (with_separator) {
        const auto sep = next_fragment_path(dir, "separator");
        pdf_.create_separator_pdf(title, sep);
        section.fragments.insert(section.fragments.begin(), Fragment{sep, FragmentRole::Separator, dir});
        for (auto& a : section.anchors) ++a.fragment;
    }
    // the heading points at the separator, or at the first document when there is none
    section.anchors.insert(section.anchors.begin(), TocAnchor{TocEntry{title, level, 0}, 0});

    parent.content_count += section.content_count;
    commit(parent.fragments, parent.anchors, std::move(section.fragments), std::move(section.anchors));
}

void DocumentCollector::collect_entries(const std::filesystem::path& dir, const int depth,
                                        const FolderStructure& structure, Section& into) {
    std::vector<std::filesystem::path> links;
    for (const auto& entry : ordered_entries(dir, &links)) {
        throw_if_cancelled(stop_.stop_requested(), "collection");
        std::error_code ec;
        if (entry.is_directory(ec)) {
            collect_directory(entry.path(), depth + 1, structure, into);
        } else {
            collect_file(entry.path(), into);
        }
    }
    skip_links(links, into.warnings);
}

void DocumentCollector::skip_too_deep(const std::filesystem::path& dir, const int max_depth,
                                      std::vector<Warning>& warnings) {
    const std::string reason = "deeper than " + std::to_string(max_depth) + " levels";
    Logger::log(LogLevel::Warning, "Skipping " + dir.string() + ": " + reason, kTag);
    std::size_t listed = 0;
    std::vector<std::filesystem::path> links;
    for (const auto& entry : ordered_entries(dir, &links)) {
        std::error_code ec;
        if (entry.is_directory(ec)) {
            const std::size_t before = warnings.size();
            skip_too_deep(entry.path(), max_depth, warnings);
            listed += warnings.size() - before;
        } else if (!ConverterRegistry::is_ignorable(entry.path())) {
            warnings.push_back({WarningKind::SkippedFile, entry.path(), reason});
            publish(FileSkippedEvent{entry.path(), reason});
            ++listed;
        }
    }
    skip_links(links, warnings);
    // an empty directory is still named so the skip is visible
    if (listed == 0 && links.empty()) {
        warnings.push_back({WarningKind::SkippedFile, dir, reason});
    }
}

void DocumentCollector::skip_links(const std::vector<std::filesystem::path>& links, std::vector<Warning>& warnings) {
    for (const auto& link : links) {
        const std::string reason = "symbolic link not followed";
        Logger::log(LogLevel::Warning, "Skipping " + link.string() + ": " + reason, kTag);
        warnings.push_back({WarningKind::SkippedFile, link, reason});
        publish(FileSkippedEvent{link, reason});
    }
}

void DocumentCollector::collect_file(const std::filesystem::path& file, Section& into) {
    throw_if_cancelled(stop_.stop_requested(), "collection");
    if (ConverterRegistry::is_ignorable(file)) {
        Logger::log(LogLevel::Debug, "Ignoring " + file.string(), kTag);
        return;
    }
    if (!ConverterRegistry::kind_for(file)) {
        const std::string reason = "unsupported format '" + file.extension().string() + "'";
        Logger::log(LogLevel::Warning, "Skipping " + file.string() + ": " + reason, kTag);
        into.warnings.push_back({WarningKind::SkippedFile, file, reason});
        publish(FileSkippedEvent{file, reason});
        file_done();
        return;
    }

    const auto result = registry_.convert(file, next_fragment_path(file), stop_);
    file_done();
    if (result.ok()) {
        into.fragments.push_back(Fragment{*result.pdf_path, FragmentRole::Content, file});
        ++into.content_count;
        publish(FileConvertedEvent{file, *result.pdf_path, result.attempts_used});
        return;
    }

    const std::string reason = result.failure_reason ? to_string(*result.failure_reason) : "failed";
    into.failed_formats.insert(lower_extension(file));
    into.warnings.push_back({WarningKind::FailedFile, file, reason + ": " + result.message});
    publish(FileFailedEvent{file, reason, result.message, result.attempts_used});
}

} // namespace binder
