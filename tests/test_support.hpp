#ifndef BINDER_TEST_SUPPORT_HPP
#define BINDER_TEST_SUPPORT_HPP

#include "../libbinder/include/config.hpp"
#include "../libbinder/include/converter.hpp"
#include "../libbinder/include/errors.hpp"
#include "../libbinder/include/file_utils.hpp"
#include "../libbinder/include/pdf_processor.hpp"
#include "../libbinder/include/random_utils.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <png.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace test {

namespace fs = std::filesystem;

// unique scratch directory, removed with everything below it
class TempTree {
public:
    explicit TempTree(const std::string& name)
        : root_(fs::temp_directory_path() / ("binder-test-" + name + "-" + RandomUtils::random_suffix())) {
        fs::create_directories(root_);
    }
    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const fs::path& path() const { return root_; }

    fs::path dir(const fs::path& rel) const {
        fs::create_directories(root_ / rel);
        return root_ / rel;
    }

    fs::path file(const fs::path& rel, const std::string& content = "content") const {
        const auto p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

private:
    fs::path root_;
};

inline std::string read_text(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline bool dir_is_empty_or_missing(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p, ec)) return true;
    return fs::is_empty(p, ec);
}

// Config with short timings, all temp data under temp_root
inline binder::Config fast_config(const fs::path& temp_root) {
    binder::Config c;
    c.retry.base_backoff = std::chrono::milliseconds(10);
    c.temp_root = temp_root;
    return c;
}

// decoded content streams of one page, concatenated
inline std::string page_text(QPDFPageObjectHelper& page) {
    std::string out;
    auto contents = page.getObjectHandle().getKey("/Contents");
    std::vector<QPDFObjectHandle> streams;
    if (contents.isArray()) {
        for (int i = 0; i < contents.getArrayNItems(); ++i) streams.push_back(contents.getArrayItem(i));
    } else {
        streams.push_back(contents);
    }
    for (auto& s : streams) {
        if (!s.isStream()) continue;
        const auto buf = s.getStreamData(qpdf_dl_generalized);
        out.append(reinterpret_cast<const char*>(buf->getBuffer()), buf->getSize());
        out += "\n";
    }
    return out;
}

// text of every page of a PDF, in order
inline std::vector<std::string> pages_text(const fs::path& pdf) {
    QPDF doc;
    doc.setSuppressWarnings(true);
    doc.processFile(pdf.c_str());
    std::vector<std::string> out;
    for (auto& page : QPDFPageDocumentHelper(doc).getAllPages()) {
        out.push_back(page_text(page));
    }
    return out;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// single page PDF showing `title`
inline void make_pdf(const fs::path& out, const std::string& title) {
    const binder::PdfProcessor pdf{binder::Config{}};
    pdf.create_separator_pdf(title, out);
}

// small RGBA PNG, left half red and right half transparent
inline void make_png(const fs::path& out, const int width = 8, const int height = 4) {
    FILE* f = std::fopen(out.c_str(), "wb");
    if (!f) throw std::runtime_error("cannot create " + out.string());
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(f);
        throw std::runtime_error("libpng write failed");
    }
    png_init_io(png, f);
    png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB_ALPHA, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    std::vector<unsigned char> row(static_cast<std::size_t>(width) * 4);
    for (int x = 0; x < width; ++x) {
        const bool left = x < width / 2;
        row[x * 4 + 0] = 255;
        row[x * 4 + 1] = 0;
        row[x * 4 + 2] = 0;
        row[x * 4 + 3] = left ? 255 : 0;
    }
    for (int y = 0; y < height; ++y) png_write_row(png, row.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    std::fclose(f);
}

// Fake converter writing a one-page PDF that shows "doc:<stem>"
class FakeConverter : public binder::IConverter {
public:
    explicit FakeConverter(const binder::ConverterKind kind, const bool retryable = true)
        : kind_(kind), retryable_(retryable) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "FakeConverter"; }
    [[nodiscard]] binder::ConverterKind kind() const noexcept override { return kind_; }
    [[nodiscard]] bool is_retryable() const noexcept override { return retryable_; }

    void convert(const fs::path& source, const fs::path& output) override {
        ++calls;
        if (before_convert) before_convert(source);
        if (fail_names_containing.size() && contains(source.filename().string(), fail_names_containing)) {
            throw binder::Error(binder::ErrorKind::Conversion, "simulated failure", source);
        }
        make_pdf(output, "doc:" + source.stem().string());
    }

    void cleanup() noexcept override { ++cleanups; }

    std::atomic<int> calls{0};
    std::atomic<int> cleanups{0};
    std::string fail_names_containing;       ///< files whose name contains this always fail
    std::function<void(const fs::path&)> before_convert;

private:
    binder::ConverterKind kind_;
    bool retryable_;
};

// Fake converter failing every attempt
class FailingConverter : public binder::IConverter {
public:
    explicit FailingConverter(const bool retryable) : retryable_(retryable) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "FailingConverter"; }
    [[nodiscard]] binder::ConverterKind kind() const noexcept override { return binder::ConverterKind::OfficeDocument; }
    [[nodiscard]] bool is_retryable() const noexcept override { return retryable_; }

    void convert(const fs::path& source, const fs::path&) override {
        ++calls;
        throw binder::Error(binder::ErrorKind::Automation, "session stuck", source);
    }

    void cleanup() noexcept override { ++cleanups; }

    int calls = 0;
    int cleanups = 0;

private:
    bool retryable_;
};

} // namespace test

#endif // BINDER_TEST_SUPPORT_HPP
