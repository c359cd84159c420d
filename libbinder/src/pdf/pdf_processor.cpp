#include "../../include/pdf_processor.hpp"
#include "../../include/atomic_file.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/pdf_builder.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace binder {

namespace {

constexpr std::string_view kTag = "PdfProcessor";

constexpr double kMargin = 72.0;
constexpr double kLevelIndent = 20.0;
constexpr double kNumberGap = 12.0;
constexpr double kMinTitleSize = 10.0;
// page number font is registered under its own name so it cannot clash with fonts of converted pages
constexpr const char* kPageNumberFont = "/BnPageNo";

std::vector<QPDFPageObjectHelper> pages_of(QPDF& pdf, const std::filesystem::path& path) {
    try {
        return QPDFPageDocumentHelper(pdf).getAllPages();
    } catch (const std::exception&) {
        throw_nested(ErrorKind::Processing, "cannot read page tree of " + path.string(), path);
    }
}

// largest size <= preferred at which the text fits max_width, never below kMinTitleSize
double shrink_to_fit(const std::string& win_ansi, const double preferred, const double max_width) {
    double size = preferred;
    while (size > kMinTitleSize && pdf::text_width(win_ansi, size) > max_width) {
        size -= 1.0;
    }
    return size;
}

std::string centered_line(const std::string& utf8, const double preferred_size, const double y) {
    const double max_width = pdf::kA4.width - 2 * kMargin;
    const std::string win = pdf::to_win_ansi(utf8);
    const double size = shrink_to_fit(win, preferred_size, max_width);
    const std::string text = pdf::fit_width(win, size, max_width);
    const double x = (pdf::kA4.width - pdf::text_width(text, size)) / 2.0;
    return pdf::text_op(text, size, x, y);
}

} // namespace

PdfProcessor::PdfProcessor(const Config& config, std::unique_ptr<ICompressor> compressor)
    : config_(config), compressor_(std::move(compressor)) {}

PdfProcessor::~PdfProcessor() = default;

std::vector<int> PdfProcessor::merge(const std::vector<std::filesystem::path>& fragments,
                                     const std::filesystem::path& output) const {
    if (fragments.empty()) {
        throw Error(ErrorKind::Processing, "nothing to merge into " + output.string(), output);
    }
    Logger::log(LogLevel::Info, "Merging " + std::to_string(fragments.size()) + " fragments into " +
                output.filename().string(), kTag);

    std::vector<int> counts;
    atomic_replace(output, [&](const std::filesystem::path& scratch) {
        counts.clear();
        // source documents must outlive the writer: pages are copied lazily
        std::vector<std::unique_ptr<QPDF>> sources;
        QPDF merged;
        merged.emptyPDF();
        QPDFPageDocumentHelper merged_pages(merged);

        for (const auto& fragment : fragments) {
            auto src = std::make_unique<QPDF>();
            pdf::open(*src, fragment);
            const auto pages = pages_of(*src, fragment);
            if (pages.empty()) {
                throw Error(ErrorKind::Processing, "fragment has no pages: " + fragment.string(), fragment);
            }
            try {
                for (const auto& page : pages) {
                    merged_pages.addPage(page, false);
                }
            } catch (const std::exception&) {
                throw_nested(ErrorKind::Processing, "cannot copy pages of " + fragment.string(), fragment);
            }
            counts.push_back(static_cast<int>(pages.size()));
            sources.push_back(std::move(src));
        }
        pdf::write(merged, scratch);
    }, ".merge.tmp");

    Logger::log(LogLevel::Debug, output.filename().string() + ": merged, " +
                std::to_string(std::accumulate(counts.begin(), counts.end(), 0)) + " pages", kTag);
    return counts;
}

int PdfProcessor::page_count(const std::filesystem::path& pdf) const {
    QPDF doc;
    pdf::open(doc, pdf);
    return static_cast<int>(pages_of(doc, pdf).size());
}

int PdfProcessor::toc_rows_first_page() const {
    const double row = config_.toc_font_size * 2.0;
    const double start = pdf::kA4.height - kMargin - config_.title_font_size * 2.5;
    return std::max(1, static_cast<int>(std::floor((start - kMargin) / row)) + 1);
}

int PdfProcessor::toc_rows_per_page() const {
    const double row = config_.toc_font_size * 2.0;
    const double start = pdf::kA4.height - kMargin - config_.toc_font_size;
    return std::max(1, static_cast<int>(std::floor((start - kMargin) / row)) + 1);
}

int PdfProcessor::toc_page_count(const std::size_t entry_count) const {
    const auto first = static_cast<std::size_t>(toc_rows_first_page());
    if (entry_count <= first) {
        return 1;
    }
    const auto per = static_cast<std::size_t>(toc_rows_per_page());
    return 1 + static_cast<int>((entry_count - first + per - 1) / per);
}

int PdfProcessor::create_toc_pdf(const std::vector<TocEntry>& entries,
                                 const std::filesystem::path& output) const {
    const double size = config_.toc_font_size;
    const double row = size * 2.0;
    const double right = pdf::kA4.width - kMargin;
    int pages_written = 0;

    atomic_replace(output, [&](const std::filesystem::path& scratch) {
        QPDF doc;
        doc.emptyPDF();
        const auto font = pdf::make_font(doc);
        pages_written = 0;

        const double title_y = pdf::kA4.height - kMargin - config_.title_font_size;
        std::string content = centered_line(config_.toc_title, config_.title_font_size, title_y);
        double y = pdf::kA4.height - kMargin - config_.title_font_size * 2.5;

        if (entries.empty()) {
            content += centered_line(config_.empty_toc_text, size, y);
        }

        int rows_left = toc_rows_first_page();
        for (const auto& e : entries) {
            if (rows_left == 0) {
                pdf::append_page(doc, content, pdf::font_resources(font));
                ++pages_written;
                content.clear();
                y = pdf::kA4.height - kMargin - size;
                rows_left = toc_rows_per_page();
            }
            const double x = kMargin + (e.level - 1) * kLevelIndent;
            const std::string number = e.page_number > 0 ? std::to_string(e.page_number) : "";
            const double number_x = right - pdf::text_width(number, size);
            const std::string title = pdf::fit_width(pdf::to_win_ansi(e.title), size,
                                                     std::max(0.0, number_x - kNumberGap - x));
            content += pdf::text_op(title, size, x, y);
            if (!number.empty()) {
                content += pdf::text_op(number, size, number_x, y);
            }
            content += "q 0.75 G 0.5 w " + pdf::num(x) + " " + pdf::num(y - 5) + " m " +
                       pdf::num(right) + " " + pdf::num(y - 5) + " l S Q\n";
            y -= row;
            --rows_left;
        }
        pdf::append_page(doc, content, pdf::font_resources(font));
        ++pages_written;
        pdf::write(doc, scratch);
    });

    Logger::log(LogLevel::Debug, "TOC with " + std::to_string(entries.size()) + " entries on " +
                std::to_string(pages_written) + " page(s)", kTag);
    return pages_written;
}

void PdfProcessor::create_separator_pdf(const std::string_view title,
                                        const std::filesystem::path& output) const {
    atomic_replace(output, [&](const std::filesystem::path& scratch) {
        QPDF doc;
        doc.emptyPDF();
        const auto font = pdf::make_font(doc);
        const std::string content = centered_line(std::string(title), config_.title_font_size,
                                                  pdf::kA4.height / 2.0);
        pdf::append_page(doc, content, pdf::font_resources(font));
        pdf::write(doc, scratch);
    });
}

void PdfProcessor::create_cover_pdf(const CoverInfo& cover,
                                    const std::filesystem::path& output) const {
    atomic_replace(output, [&](const std::filesystem::path& scratch) {
        QPDF doc;
        doc.emptyPDF();
        const auto font = pdf::make_font(doc);
        const double title_y = pdf::kA4.height * 0.6;
        std::string content = centered_line(cover.title, config_.title_font_size * 1.25, title_y);
        if (!cover.subtitle.empty()) {
            content += centered_line(cover.subtitle, std::max(config_.toc_font_size, config_.title_font_size * 0.6),
                                     title_y - config_.title_font_size * 2.5);
        }
        pdf::append_page(doc, content, pdf::font_resources(font));
        pdf::write(doc, scratch);
    });
}

void PdfProcessor::add_page_numbers(const std::filesystem::path& pdf, const int start_page) const {
    if (start_page < 1) {
        throw Error(ErrorKind::Processing, "page numbering must start at page 1 or later", pdf);
    }
    const double size = config_.page_number_font_size;
    int stamped = 0;

    atomic_replace(pdf, [&](const std::filesystem::path& scratch) {
        QPDF doc;
        pdf::open(doc, pdf);
        const auto font = pdf::make_font(doc);
        auto pages = pages_of(doc, pdf);
        stamped = 0;
        try {
            for (std::size_t i = static_cast<std::size_t>(start_page) - 1; i < pages.size(); ++i) {
                auto& page = pages[i];

                auto resources = page.getAttribute("/Resources", true);
                if (!resources.isDictionary()) {
                    resources = QPDFObjectHandle::newDictionary();
                    page.getObjectHandle().replaceKey("/Resources", resources);
                }
                auto fonts = resources.getKey("/Font");
                if (!fonts.isDictionary()) {
                    fonts = QPDFObjectHandle::newDictionary();
                    resources.replaceKey("/Font", fonts);
                } else if (fonts.isIndirect()) {
                    fonts = fonts.shallowCopy();
                    resources.replaceKey("/Font", fonts);
                }
                fonts.replaceKey(kPageNumberFont, font);

                auto box = page.getCropBox();
                QPDFObjectHandle::Rectangle rect(0, 0, pdf::kA4.width, pdf::kA4.height);
                if (box.isRectangle()) {
                    rect = box.getArrayAsRectangle();
                }
                const std::string label = std::to_string(i + 1);
                const double x = rect.llx + (rect.urx - rect.llx - pdf::text_width(label, size)) / 2.0;
                const double y = rect.lly + config_.page_number_bottom_margin;

                // isolate the original content's graphics state from the stamp
                page.addPageContents(QPDFObjectHandle::newStream(&doc, "q\n"), true);
                page.addPageContents(QPDFObjectHandle::newStream(
                    &doc, "\nQ\nq 0 g " + pdf::text_op(label, size, x, y, kPageNumberFont) + "Q\n"), false);
                ++stamped;
            }
        } catch (const Error&) {
            throw;
        } catch (const std::exception&) {
            throw_nested(ErrorKind::Processing, "cannot stamp page numbers on " + pdf.string(), pdf);
        }
        pdf::write(doc, scratch);
    }, ".pn.tmp");

    Logger::log(LogLevel::Info, "Numbered " + std::to_string(stamped) + " page(s) starting at page " +
                std::to_string(start_page), kTag);
}

void PdfProcessor::set_bookmarks(const std::filesystem::path& pdf,
                                 const std::vector<TocEntry>& entries) const {
    validate_toc(entries);

    atomic_replace(pdf, [&](const std::filesystem::path& scratch) {
        QPDF doc;
        pdf::open(doc, pdf);
        auto pages = pages_of(doc, pdf);
        for (const auto& e : entries) {
            if (e.page_number < 1 || e.page_number > static_cast<int>(pages.size())) {
                throw Error(ErrorKind::Structure,
                            "bookmark '" + e.title + "' points to page " + std::to_string(e.page_number) +
                            " of a " + std::to_string(pages.size()) + "-page document", pdf);
            }
        }

        auto root = doc.getRoot();
        if (entries.empty()) {
            root.removeKey("/Outlines");
            root.removeKey("/PageMode");
            pdf::write(doc, scratch);
            return;
        }

        struct Node {
            QPDFObjectHandle obj;
            std::vector<std::size_t> kids;
            int descendants = 0;
        };
        std::vector<Node> nodes;
        nodes.push_back({doc.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Outlines >>")), {}, 0});

        // (level, node index) chain from the outline root to the last item
        std::vector<std::pair<int, std::size_t>> chain{{0, 0}};
        for (const auto& e : entries) {
            while (chain.back().first >= e.level) {
                chain.pop_back();
            }
            const std::size_t parent = chain.back().second;

            auto dest = QPDFObjectHandle::newArray();
            dest.appendItem(pages[static_cast<std::size_t>(e.page_number) - 1].getObjectHandle());
            dest.appendItem(QPDFObjectHandle::newName("/Fit"));

            auto item = QPDFObjectHandle::newDictionary();
            item.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(e.title));
            item.replaceKey("/Parent", nodes[parent].obj);
            item.replaceKey("/Dest", dest);

            const std::size_t index = nodes.size();
            nodes.push_back({doc.makeIndirectObject(item), {}, 0});
            nodes[parent].kids.push_back(index);
            chain.emplace_back(e.level, index);
        }

        // children always have larger indices than their parent
        for (std::size_t i = nodes.size(); i-- > 0;) {
            auto& node = nodes[i];
            if (node.kids.empty()) continue;
            int count = 0;
            for (std::size_t k = 0; k < node.kids.size(); ++k) {
                auto& kid = nodes[node.kids[k]];
                if (k > 0) kid.obj.replaceKey("/Prev", nodes[node.kids[k - 1]].obj);
                if (k + 1 < node.kids.size()) kid.obj.replaceKey("/Next", nodes[node.kids[k + 1]].obj);
                count += 1 + kid.descendants;
            }
            node.descendants = count;
            node.obj.replaceKey("/First", nodes[node.kids.front()].obj);
            node.obj.replaceKey("/Last", nodes[node.kids.back()].obj);
            node.obj.replaceKey("/Count", QPDFObjectHandle::newInteger(count));
        }

        root.replaceKey("/Outlines", nodes.front().obj);
        root.replaceKey("/PageMode", QPDFObjectHandle::newName("/UseOutlines"));
        pdf::write(doc, scratch);
    }, ".bm.tmp");

    Logger::log(LogLevel::Info, "Wrote " + std::to_string(entries.size()) + " bookmark(s)", kTag);
}

bool PdfProcessor::compress(const std::filesystem::path& pdf) const {
    if (!compressor_) {
        Logger::log(LogLevel::Info, "No compressor configured, skipping compression", kTag);
        return false;
    }
    const auto compressed = scratch_path_for(pdf, ".gs.tmp");
    struct Cleanup {
        std::filesystem::path path;
        ~Cleanup() {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    } cleanup{compressed};

    try {
        if (!compressor_->compress(pdf, compressed)) {
            Logger::log(LogLevel::Warning, std::string(compressor_->get_name()) + " failed on " +
                        pdf.filename().string() + ", keeping uncompressed output", kTag);
            return false;
        }
        if (!MimeDetector::is_pdf(compressed) || page_count(compressed) != page_count(pdf)) {
            Logger::log(LogLevel::Warning, "Compressor produced an invalid document, keeping uncompressed output", kTag);
            return false;
        }
        const auto before = std::filesystem::file_size(pdf);
        const auto after = std::filesystem::file_size(compressed);
        if (after >= before) {
            Logger::log(LogLevel::Info, "Compression did not reduce size (" + std::to_string(before) + " -> " +
                        std::to_string(after) + " bytes), keeping original", kTag);
            return true;
        }
        atomic_copy(compressed, pdf);
        Logger::log(LogLevel::Info, "Compressed " + pdf.filename().string() + ": " + std::to_string(before) +
                    " -> " + std::to_string(after) + " bytes", kTag);
        return true;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("Compression failed: ") + e.what(), kTag);
        return false;
    }
}

} // namespace binder
