#include "../../include/toc.hpp"

namespace binder {

void validate_toc(const std::vector<TocEntry>& entries) {
    int previous_level = 0;
    int previous_page = 0;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        const std::string where = "TOC entry " + std::to_string(i + 1) + " '" + e.title + "'";
        if (e.level < 1) {
            throw Error(ErrorKind::Structure, where + " has level " + std::to_string(e.level));
        }
        if (e.level > previous_level + 1) {
            throw Error(ErrorKind::Structure,
                        where + " jumps from level " + std::to_string(previous_level) +
                        " to level " + std::to_string(e.level));
        }
        if (e.page_number != 0 && e.page_number < previous_page) {
            throw Error(ErrorKind::Structure,
                        where + " points to page " + std::to_string(e.page_number) +
                        " before page " + std::to_string(previous_page));
        }
        previous_level = e.level;
        if (e.page_number != 0) previous_page = e.page_number;
    }
}

std::vector<std::filesystem::path> MergePlan::body_paths() const {
    std::vector<std::filesystem::path> paths;
    paths.reserve(body.size());
    for (const auto& f : body) paths.push_back(f.pdf);
    return paths;
}

std::vector<TocEntry> MergePlan::resolve(const std::vector<int>& body_page_counts,
                                         const int front_pages) const {
    if (body_page_counts.size() != body.size()) {
        throw Error(ErrorKind::Processing, "page counts do not match the merge plan");
    }
    // offsets[i] = pages preceding body fragment i
    std::vector<int> offsets(body.size(), 0);
    int running = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        offsets[i] = running;
        running += body_page_counts[i];
    }
    std::vector<TocEntry> entries;
    entries.reserve(anchors.size());
    for (const auto& a : anchors) {
        if (a.fragment >= body.size()) {
            throw Error(ErrorKind::Structure, "TOC entry '" + a.entry.title + "' has no pages");
        }
        TocEntry e = a.entry;
        e.page_number = front_pages + offsets[a.fragment] + 1;
        entries.push_back(std::move(e));
    }
    return entries;
}

} // namespace binder
