/**
 * @file pdf_builder.hpp
 * @brief Low-level helpers for generating simple PDF pages with qpdf.
 *
 * Generated pages (cover, separators, TOC, image pages) use the standard
 * Helvetica font with WinAnsi encoding, so no font file is embedded.
 */

#ifndef BINDER_PDF_BUILDER_HPP
#define BINDER_PDF_BUILDER_HPP

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <filesystem>
#include <string>
#include <string_view>

namespace binder::pdf {

struct PageSize {
    double width;
    double height;
};

inline constexpr PageSize kA4{595.0, 842.0};
inline constexpr PageSize kA4Landscape{842.0, 595.0};

/// Resource name under which make_font() is registered on generated pages.
inline constexpr const char* kFontResource = "/F1";

/**
 * @brief Convert UTF-8 text to WinAnsi bytes.
 *
 * Characters without a WinAnsi code become '?'; the ideographic space
 * becomes a plain space.
 */
std::string to_win_ansi(std::string_view utf8);

/// @return A PDF literal string "(...)" with (, ) and \ escaped.
std::string literal(std::string_view win_ansi);

/// @return Width in points of WinAnsi text set in Helvetica at @p font_size.
double text_width(std::string_view win_ansi, double font_size);

/**
 * @brief Shorten WinAnsi text with a trailing "..." so it fits @p max_width.
 */
std::string fit_width(std::string_view win_ansi, double font_size, double max_width);

/// @return Compact decimal form used in content streams ("12.5", "300").
std::string num(double v);

/// @return Content-stream operators drawing one line of text at (x, y) with font @p font.
std::string text_op(std::string_view win_ansi, double font_size, double x, double y,
                    std::string_view font = kFontResource);

/// @return An indirect Helvetica font dictionary owned by @p pdf.
QPDFObjectHandle make_font(QPDF& pdf);

/// @return A /Resources dictionary exposing @p font as kFontResource.
QPDFObjectHandle font_resources(const QPDFObjectHandle& font);

/**
 * @brief Append a page with the given content stream and resources.
 */
void append_page(QPDF& pdf, const std::string& content,
                 const QPDFObjectHandle& resources, PageSize size = kA4);

/**
 * @brief Write @p pdf to @p path with compressed streams and a deterministic ID.
 * @throws Error(ErrorKind::Processing) if qpdf fails.
 */
void write(QPDF& pdf, const std::filesystem::path& path);

/**
 * @brief Open an existing PDF with warnings captured instead of printed.
 * @throws Error(ErrorKind::Processing) naming @p path if it cannot be parsed.
 */
void open(QPDF& pdf, const std::filesystem::path& path);

} // namespace binder::pdf

#endif // BINDER_PDF_BUILDER_HPP
