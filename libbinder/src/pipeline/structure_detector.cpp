#include "../../include/structure_detector.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace binder {

namespace {

constexpr std::string_view kTag = "StructureDetector";
constexpr double kMaxRootFileRatioForEducation = 0.3;

struct DirInfo {
    int subfolder_count = 0;
    int total_files = 0;
    int max_depth = 0;
    std::string name;
};

bool is_hidden_or_temp(const std::string& name) {
    return name.starts_with('.') || name.starts_with('~') || name == "__pycache__";
}

bool contains_keyword(const std::string& name, const std::vector<std::string>& keywords) {
    const std::string lower = ascii_lower(name);
    for (const auto& k : keywords) {
        if (!k.empty() && lower.find(ascii_lower(k)) != std::string::npos) return true;
    }
    return false;
}

DirInfo analyze(const std::filesystem::path& dir, const int depth, const int max_scan_depth) {
    DirInfo info;
    info.name = dir.filename().string();
    info.max_depth = depth;
    if (depth > max_scan_depth) return info;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Cannot read " + dir.string() + ": " + ec.message(), kTag);
        return info;
    }
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (name.starts_with('.') || name.starts_with('~')) continue;
        if (entry.is_symlink(ec)) {
            Logger::log(LogLevel::Debug, "Skipping symlink " + entry.path().string(), kTag);
            continue;
        }
        if (entry.is_directory(ec)) {
            const DirInfo sub = analyze(entry.path(), depth + 1, max_scan_depth);
            ++info.subfolder_count;
            info.total_files += sub.total_files;
            info.max_depth = std::max(info.max_depth, sub.max_depth);
        } else if (entry.is_regular_file(ec)) {
            ++info.total_files;
        }
    }
    return info;
}

std::string fmt(const double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

} // namespace

const char* to_string(const StructureVariant variant) noexcept {
    switch (variant) {
        case StructureVariant::TwoLevel: return "two-level";
        case StructureVariant::ThreeLevel: return "three-level";
        case StructureVariant::Unknown: return "unknown";
    }
    return "unknown";
}

int FolderStructure::level_for_depth(const int depth) const noexcept {
    if (depth < 1 || depth > max_depth) return 0;
    switch (variant) {
        case StructureVariant::TwoLevel: return depth == 1 ? 1 : 0;
        case StructureVariant::ThreeLevel: return depth <= 2 ? depth : 0;
        case StructureVariant::Unknown: return 1;
    }
    return 0;
}

StructureDetector::StructureDetector(const Config& config) : config_(config) {}

FolderStructure StructureDetector::detect(const std::filesystem::path& root) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw Error(ErrorKind::Path, "not a directory: " + root.string(), root);
    }
    Logger::log(LogLevel::Info, "Analyzing folder structure of " + root.string(), kTag);

    std::filesystem::directory_iterator it(root, ec);
    if (ec) {
        throw Error(ErrorKind::Path, "cannot read " + root.string() + ": " + ec.message(), root);
    }

    std::vector<DirInfo> main_dirs;
    int root_files = 0;
    int max_depth = 1;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (is_hidden_or_temp(name) || contains_keyword(entry.path().stem().string(), config_.cover_keywords)) {
            continue;
        }
        if (entry.is_symlink(ec)) continue;
        if (entry.is_directory(ec)) {
            main_dirs.push_back(analyze(entry.path(), 2, config_.max_scan_depth));
            max_depth = std::max(max_depth, main_dirs.back().max_depth);
        } else if (entry.is_regular_file(ec)) {
            ++root_files;
        }
    }

    FolderStructure result;
    result.max_depth = config_.max_scan_depth;
    auto& ev = result.evidence;
    ev.main_dir_count = static_cast<int>(main_dirs.size());
    ev.root_file_count = root_files;
    ev.max_depth = max_depth;
    ev.total_files = root_files;
    for (const auto& d : main_dirs) ev.total_files += d.total_files;
    ev.root_file_ratio = ev.total_files > 0 ? static_cast<double>(root_files) / ev.total_files : 0.0;

    // three-level score
    double education = ev.main_dir_count * 2.0;
    if (ev.main_dir_count > 0) {
        int subfolders = 0;
        for (const auto& d : main_dirs) subfolders += d.subfolder_count;
        education += static_cast<double>(subfolders) / ev.main_dir_count * 1.5;
    }
    if (ev.max_depth >= 3) education += 3.0;
    if (ev.root_file_ratio < kMaxRootFileRatioForEducation) education += 2.0;
    for (const auto& d : main_dirs) {
        if (contains_keyword(d.name, config_.category_keywords)) education += 2.0;
    }

    // two-level score
    double event = ev.root_file_count * 1.0;
    if (ev.main_dir_count <= 3) event += 1.5;
    if (ev.max_depth <= 2) event += 3.0;
    if (ev.root_file_ratio > 0.5) event += 2.0;

    ev.education_score = education;
    ev.event_score = event;
    const double total = education + event;
    result.confidence = total > 0 ? std::abs(education - event) / total : 0.0;

    if (ev.total_files == 0) {
        result.variant = StructureVariant::Unknown;
        result.confidence = 0.0;
        result.issues.emplace_back("no files found under " + root.string());
    } else if (result.confidence < config_.confidence_threshold) {
        result.variant = StructureVariant::Unknown;
        result.issues.emplace_back("low confidence " + fmt(result.confidence) +
                                   "; choose the plan type explicitly");
    } else {
        result.variant = education > event ? StructureVariant::ThreeLevel : StructureVariant::TwoLevel;
    }

    Logger::log(LogLevel::Info,
        std::string("Detected ") + to_string(result.variant) + " (confidence " + fmt(result.confidence) +
        ", education=" + fmt(education) + ", event=" + fmt(event) + ")",
        kTag);
    for (const auto& issue : result.issues) {
        Logger::log(LogLevel::Warning, issue, kTag);
    }
    return result;
}

FolderStructure StructureDetector::resolve(const std::filesystem::path& root, const PlanHint hint) const {
    if (hint == PlanHint::Auto) return detect(root);
    FolderStructure forced;
    forced.variant = hint == PlanHint::ThreeLevel ? StructureVariant::ThreeLevel : StructureVariant::TwoLevel;
    forced.confidence = 1.0;
    forced.max_depth = config_.max_scan_depth;
    Logger::log(LogLevel::Info, std::string("Using requested structure ") + to_string(forced.variant), kTag);
    return forced;
}

} // namespace binder
