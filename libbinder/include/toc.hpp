/**
 * @file toc.hpp
 * @brief Table-of-contents model and the merge plan built from it.
 */

#ifndef BINDER_TOC_HPP
#define BINDER_TOC_HPP

#include "job.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace binder {

/**
 * @brief One row of the table of contents.
 *
 * Entries correspond to directories (sections and subsections), never to
 * single files. page_number is the 1-based physical page in the final
 * document and stays 0 until the provisional merge has measured every
 * fragment.
 */
struct TocEntry {
    std::string title;
    int level = 1;
    int page_number = 0;
};

/**
 * @brief Check nesting and page order of a TOC sequence.
 *
 * The first entry must be level 1, levels are at least 1, a level may
 * exceed the previous entry's level by at most one, and assigned page
 * numbers never decrease.
 *
 * @throws Error(ErrorKind::Structure) describing the first violation.
 */
void validate_toc(const std::vector<TocEntry>& entries);

enum class FragmentRole {
    Cover,     ///< Cover document or generated cover page
    Separator, ///< Generated section title page
    Content    ///< Converted source document
};

/**
 * @brief One intermediate PDF in document order.
 */
struct Fragment {
    std::filesystem::path pdf;     ///< File inside the job directory
    FragmentRole role = FragmentRole::Content;
    std::filesystem::path source;  ///< Originating document, empty for generated pages
};

/**
 * @brief A TOC entry tied to the body fragment where its section starts.
 */
struct TocAnchor {
    TocEntry entry;
    std::size_t fragment = 0; ///< Index into MergePlan::body
};

/**
 * @brief Ordered fragments and TOC model of one job.
 *
 * Produced by DocumentCollector, completed by MergeOrchestrator. Never
 * persisted: the fragments live in the job directory and go away with it.
 */
struct MergePlan {
    std::optional<Fragment> cover;
    std::vector<Fragment> body;          ///< Separators and content in final order
    std::vector<TocAnchor> anchors;      ///< Insertion order is document order
    std::vector<Warning> warnings;

    /// @return Paths of the body fragments, in order.
    [[nodiscard]] std::vector<std::filesystem::path> body_paths() const;

    /**
     * @brief Resolve page numbers of every anchor.
     * @param body_page_counts Pages of each body fragment, same order as body.
     * @param front_pages Cover plus TOC pages preceding the body.
     * @return TOC entries with page_number assigned.
     */
    [[nodiscard]] std::vector<TocEntry> resolve(const std::vector<int>& body_page_counts,
                                                int front_pages) const;
};

} // namespace binder

#endif // BINDER_TOC_HPP
