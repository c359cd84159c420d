#include "../../include/pdf_builder.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <array>
#include <cstdint>
#include <cstdio>
#include <unordered_map>

namespace binder::pdf {

namespace {

// Helvetica advance widths (1/1000 em) for codes 32..126
constexpr std::array<std::uint16_t, 95> kHelveticaWidths = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,  // ' '../
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,                                // 0..9
    278, 278, 584, 584, 584, 556, 1015,                                              // :..@
    667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833,                 // A..M
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,                 // N..Z
    278, 278, 278, 469, 556, 333,                                                    // [..`
    556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833,                 // a..m
    556, 556, 556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500,                 // n..z
    334, 260, 334, 584                                                               // {..~
};
constexpr std::uint16_t kDefaultWidth = 556;

// code points outside Latin-1 that WinAnsi still covers
const std::unordered_map<char32_t, unsigned char>& win_ansi_extras() {
    static const std::unordered_map<char32_t, unsigned char> table = {
        {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84}, {0x2026, 0x85},
        {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88}, {0x2030, 0x89}, {0x0160, 0x8A},
        {0x2039, 0x8B}, {0x0152, 0x8C}, {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92},
        {0x201C, 0x93}, {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
        {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B}, {0x0153, 0x9C},
        {0x017E, 0x9E}, {0x0178, 0x9F}, {0x3000, 0x20},
    };
    return table;
}

// decodes one UTF-8 sequence starting at i; returns U+FFFD and advances one byte when malformed
char32_t next_code_point(const std::string_view s, std::size_t& i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    int len = 0;
    char32_t cp = 0;
    if (b0 < 0x80) { ++i; return b0; }
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
    else { ++i; return 0xFFFD; }
    if (i + len > s.size()) { ++i; return 0xFFFD; }
    for (int k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) { ++i; return 0xFFFD; }
        cp = (cp << 6) | (b & 0x3F);
    }
    i += len;
    return cp;
}

} // namespace

std::string to_win_ansi(const std::string_view utf8) {
    std::string out;
    out.reserve(utf8.size());
    for (std::size_t i = 0; i < utf8.size();) {
        const char32_t cp = next_code_point(utf8, i);
        if (cp == '\t' || cp == '\n' || cp == '\r') {
            out += ' ';
        } else if ((cp >= 0x20 && cp <= 0x7E) || (cp >= 0xA0 && cp <= 0xFF)) {
            out += static_cast<char>(cp);
        } else if (const auto it = win_ansi_extras().find(cp); it != win_ansi_extras().end()) {
            out += static_cast<char>(it->second);
        } else {
            out += '?';
        }
    }
    return out;
}

std::string literal(const std::string_view win_ansi) {
    std::string out = "(";
    for (const char c : win_ansi) {
        if (c == '(' || c == ')' || c == '\\') out += '\\';
        out += c;
    }
    out += ')';
    return out;
}

double text_width(const std::string_view win_ansi, const double font_size) {
    double units = 0;
    for (const char c : win_ansi) {
        const auto code = static_cast<unsigned char>(c);
        units += (code >= 32 && code <= 126) ? kHelveticaWidths[code - 32] : kDefaultWidth;
    }
    return units * font_size / 1000.0;
}

std::string fit_width(const std::string_view win_ansi, const double font_size, const double max_width) {
    if (text_width(win_ansi, font_size) <= max_width) {
        return std::string(win_ansi);
    }
    std::string s(win_ansi);
    while (!s.empty() && text_width(s + "...", font_size) > max_width) {
        s.pop_back();
    }
    return s + "...";
}

std::string num(const double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    std::string s(buf);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

std::string text_op(const std::string_view win_ansi, const double font_size, const double x, const double y,
                    const std::string_view font) {
    return "BT " + std::string(font) + " " + num(font_size) + " Tf " +
           num(x) + " " + num(y) + " Td " + literal(win_ansi) + " Tj ET\n";
}

QPDFObjectHandle make_font(QPDF& pdf) {
    return pdf.makeIndirectObject(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"));
}

QPDFObjectHandle font_resources(const QPDFObjectHandle& font) {
    auto fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey(kFontResource, font);
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
    return resources;
}

void append_page(QPDF& pdf, const std::string& content,
                 const QPDFObjectHandle& resources, const PageSize size) {
    auto page = QPDFObjectHandle::newDictionary();
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", QPDFObjectHandle::parse(
        "[0 0 " + num(size.width) + " " + num(size.height) + "]"));
    page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content));
    page.replaceKey("/Resources", resources);
    QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
}

void write(QPDF& pdf, const std::filesystem::path& path) {
    try {
        QPDFWriter w(pdf, path.c_str());
        w.setDeterministicID(true);
        w.setStreamDataMode(qpdf_s_compress);
        w.write();
    } catch (const std::exception&) {
        throw_nested(ErrorKind::Processing, "cannot write PDF " + path.string(), path);
    }
}

void open(QPDF& pdf, const std::filesystem::path& path) {
    pdf.setSuppressWarnings(true);
    try {
        pdf.processFile(path.c_str());
    } catch (const std::exception&) {
        throw_nested(ErrorKind::Processing, "cannot read PDF " + path.string(), path);
    }
    for (const auto& w : pdf.getWarnings()) {
        Logger::log(LogLevel::Debug, path.filename().string() + ": " + w.what(), "qpdf");
    }
}

} // namespace binder::pdf
