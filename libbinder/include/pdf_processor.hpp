/**
 * @file pdf_processor.hpp
 * @brief PDF manipulation primitives of the merge pipeline, built on qpdf.
 */

#ifndef BINDER_PDF_PROCESSOR_HPP
#define BINDER_PDF_PROCESSOR_HPP

#include "compressor.hpp"
#include "config.hpp"
#include "job.hpp"
#include "toc.hpp"
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace binder {

/**
 * @brief Merge, generate, stamp and outline PDFs.
 *
 * @details Every operation that writes a file goes through atomic_replace(),
 * so an existing target is either left alone or fully replaced. Errors are
 * reported as binder::Error with ErrorKind::Processing (unreadable input,
 * write failure) or ErrorKind::Structure (invalid TOC input), with the qpdf
 * exception nested as cause.
 */
class PdfProcessor {
public:
    explicit PdfProcessor(const Config& config,
                          std::unique_ptr<ICompressor> compressor = nullptr);
    ~PdfProcessor();

    PdfProcessor(const PdfProcessor&) = delete;
    PdfProcessor& operator=(const PdfProcessor&) = delete;

    /**
     * @brief Concatenate PDFs in list order.
     *
     * No page is dropped or reordered. Fails on the first unreadable
     * fragment, naming it.
     *
     * @param fragments Input PDFs, at least one.
     * @param output Destination file.
     * @return Page count of each fragment, in input order.
     */
    std::vector<int> merge(const std::vector<std::filesystem::path>& fragments,
                           const std::filesystem::path& output) const;

    /// @return Number of pages in @p pdf.
    [[nodiscard]] int page_count(const std::filesystem::path& pdf) const;

    /**
     * @brief Render the table of contents.
     *
     * Titles are indented by level, page numbers right-aligned, with a thin
     * grey rule under every row. Long lists continue on further pages; an
     * empty list renders a single page with the configured placeholder text.
     * Output is deterministic for identical input.
     *
     * @return Number of pages written.
     */
    int create_toc_pdf(const std::vector<TocEntry>& entries,
                       const std::filesystem::path& output) const;

    /**
     * @brief Number of pages create_toc_pdf() produces for @p entry_count rows.
     */
    [[nodiscard]] int toc_page_count(std::size_t entry_count) const;

    /// Write a single page showing @p title centered.
    void create_separator_pdf(std::string_view title,
                              const std::filesystem::path& output) const;

    /// Write a single cover page with title and optional subtitle.
    void create_cover_pdf(const CoverInfo& cover,
                          const std::filesystem::path& output) const;

    /**
     * @brief Stamp page numbers, in place.
     *
     * Pages from @p start_page (1-based) onward get their physical page
     * number centered at a fixed distance from the bottom edge. Earlier pages
     * are left untouched.
     */
    void add_page_numbers(const std::filesystem::path& pdf, int start_page) const;

    /**
     * @brief Replace the outline tree of @p pdf, in place.
     *
     * An entry of level N becomes a child of the nearest preceding entry of
     * level N-1. Entries must satisfy validate_toc() and point to existing
     * pages.
     *
     * @throws Error(ErrorKind::Structure) for illegal level jumps or page numbers.
     */
    void set_bookmarks(const std::filesystem::path& pdf,
                       const std::vector<TocEntry>& entries) const;

    /**
     * @brief Compress @p pdf in place with the configured compressor.
     *
     * The original is kept when compression fails, produces an invalid
     * document or does not shrink the file.
     *
     * @return True if the compressor ran successfully, false if it is absent
     * or failed. Never throws for a compressor failure.
     */
    bool compress(const std::filesystem::path& pdf) const;

    [[nodiscard]] bool has_compressor() const noexcept { return compressor_ != nullptr; }

private:
    Config config_;
    std::unique_ptr<ICompressor> compressor_;

    [[nodiscard]] int toc_rows_first_page() const;
    [[nodiscard]] int toc_rows_per_page() const;
};

} // namespace binder

#endif // BINDER_PDF_PROCESSOR_HPP
