/**
 * @file document_collector.hpp
 * @brief Walks the input tree and turns it into an ordered merge plan.
 */

#ifndef BINDER_DOCUMENT_COLLECTOR_HPP
#define BINDER_DOCUMENT_COLLECTOR_HPP

#include "config.hpp"
#include "structure_detector.hpp"
#include "toc.hpp"
#include <cstddef>
#include <filesystem>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace binder {

class ConverterRegistry;
class EventBus;
class PdfProcessor;

/**
 * @brief Converts every document of a tree and records where sections start.
 *
 * @details Traversal order is deterministic: at each level directories
 * come before files, and names are compared byte by byte. A root-level
 * file whose name contains a cover keyword becomes the cover. Each
 * directory that has a heading level (see FolderStructure::level_for_depth)
 * gets one TOC entry and, for sections and optionally subsections, a
 * generated separator page. Directories without a heading level are
 * inlined into the enclosing section. Files directly under the root follow
 * all sections and have no TOC entry.
 *
 * Failure policy: a file that cannot be converted is skipped with a
 * warning. A section that ends up with no converted document is an
 * Error(ErrorKind::Structure) naming the formats that failed, unless
 * Config::fail_on_empty_section is false, in which case the section is
 * dropped with a warning. Sections that simply hold nothing convertible
 * are dropped with a warning. Symlinks and the files of directories deeper
 * than FolderStructure::max_depth are not collected; each one is listed as
 * a WarningKind::SkippedFile warning.
 */
class DocumentCollector {
public:
    /**
     * @param config Job configuration.
     * @param registry Converters used for every file.
     * @param pdf Used to generate separator pages.
     * @param job_dir Directory receiving the fragments ("NNNN_<stem>.pdf").
     * @param events Optional progress sink.
     */
    DocumentCollector(const Config& config,
                      ConverterRegistry& registry,
                      PdfProcessor& pdf,
                      std::filesystem::path job_dir,
                      EventBus* events = nullptr);

    /**
     * @brief Map ProgressEvent percentages of this collection onto [from, to].
     */
    void set_progress_range(double from, double to) noexcept;

    /**
     * @brief Collect and convert the whole tree.
     * @return The plan: cover, body fragments in order, TOC anchors and warnings.
     * @throws Error(ErrorKind::Cancelled) when @p stop is requested.
     * @throws Error(ErrorKind::Structure) for a section whose every document failed.
     * @throws Error(ErrorKind::Path) if @p root cannot be read.
     */
    MergePlan collect_and_convert(const std::filesystem::path& root,
                                  const FolderStructure& structure,
                                  std::stop_token stop = {});

    /**
     * @brief Section title from a directory name.
     *
     * With @p strip_numeric_prefix, leading digits, spaces, '.' and '-' are
     * removed and underscores become spaces ("01_Annual Plan" becomes
     * "Annual Plan"). The name is returned unchanged if nothing would be left.
     */
    static std::string sanitize_title(std::string_view name, bool strip_numeric_prefix);

    /**
     * @return Entries of @p dir in traversal order, without symlinks.
     * @param skipped_links When set, receives the symlinks that were left out.
     */
    static std::vector<std::filesystem::directory_entry> ordered_entries(
        const std::filesystem::path& dir, std::vector<std::filesystem::path>* skipped_links = nullptr);

private:
    /// Fragments of one section, committed to the parent only if it has content.
    struct Section {
        std::vector<Fragment> fragments;
        std::vector<TocAnchor> anchors;   ///< fragment indices local to this section
        std::vector<Warning> warnings;
        std::set<std::string> failed_formats;
        std::size_t content_count = 0;
    };

    void collect_directory(const std::filesystem::path& dir, int depth,
                           const FolderStructure& structure, Section& parent);
    void collect_entries(const std::filesystem::path& dir, int depth,
                         const FolderStructure& structure, Section& into);
    void collect_file(const std::filesystem::path& file, Section& into);
    bool collect_cover(const std::filesystem::path& file, MergePlan& plan);
    void skip_too_deep(const std::filesystem::path& dir, int max_depth, std::vector<Warning>& warnings);
    void skip_links(const std::vector<std::filesystem::path>& links, std::vector<Warning>& warnings);

    [[nodiscard]] bool is_cover_name(const std::filesystem::path& file) const;
    [[nodiscard]] std::filesystem::path next_fragment_path(const std::filesystem::path& source, std::string_view stem_override = {});
    std::size_t count_files(const std::filesystem::path& dir, int depth, int max_depth) const;
    void file_done();

    template <typename Event>
    void publish(const Event& e) const;

    Config config_;
    ConverterRegistry& registry_;
    PdfProcessor& pdf_;
    std::filesystem::path job_dir_;
    EventBus* events_;
    std::stop_token stop_;
    std::size_t sequence_ = 0;
    std::size_t files_total_ = 0;
    std::size_t files_done_ = 0;
    double progress_from_ = 0.0;
    double progress_to_ = 100.0;
};

} // namespace binder

#endif // BINDER_DOCUMENT_COLLECTOR_HPP
