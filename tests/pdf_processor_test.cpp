#include <iostream>
#include <cassert>
#include "test_support.hpp"
#include "../libbinder/include/mime_detector.hpp"
#include "../libbinder/include/toc.hpp"

using namespace binder;

// compressor double with a fixed behaviour
class ScriptedCompressor : public ICompressor {
public:
    enum class Mode { Fail, Garbage, Copy };
    explicit ScriptedCompressor(const Mode mode) : mode_(mode) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "ScriptedCompressor"; }

    bool compress(const std::filesystem::path& input, const std::filesystem::path& output) override {
        ++calls;
        switch (mode_) {
            case Mode::Fail: return false;
            case Mode::Garbage: std::ofstream(output) << "garbage"; return true;
            case Mode::Copy: std::filesystem::copy_file(input, output); return true;
        }
        return false;
    }

    int calls = 0;

private:
    Mode mode_;
};

bool throws_structure(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind() == ErrorKind::Structure;
    }
    return false;
}

std::string outline_title(QPDFObjectHandle item) {
    return item.getKey("/Title").getUTF8Value();
}

int main() {
    test::TempTree tree("pdf");
    const Config config;
    const PdfProcessor pdf(config);
    const auto& root = tree.path();

    std::cout << "[Test] Merge keeps every page in order..." << std::endl;
    test::make_pdf(root / "a.pdf", "Alpha");
    test::make_pdf(root / "b.pdf", "Bravo");
    pdf.merge({root / "a.pdf", root / "b.pdf"}, root / "ab.pdf");
    const auto counts = pdf.merge({root / "ab.pdf", root / "a.pdf", root / "ab.pdf"}, root / "merged.pdf");
    assert((counts == std::vector<int>{2, 1, 2}));
    assert(pdf.page_count(root / "merged.pdf") == 5);
    const auto merged = test::pages_text(root / "merged.pdf");
    assert(test::contains(merged[0], "(Alpha)"));
    assert(test::contains(merged[1], "(Bravo)"));
    assert(test::contains(merged[2], "(Alpha)"));
    assert(test::contains(merged[4], "(Bravo)"));

    std::cout << "[Test] Merge names the broken fragment and leaves the target alone..." << std::endl;
    tree.file("broken.pdf", "%PDF-1.4 truncated");
    try {
        pdf.merge({root / "a.pdf", root / "broken.pdf"}, root / "merged.pdf");
        assert(false);
    } catch (const Error& e) {
        assert(e.kind() == ErrorKind::Processing);
        assert(e.path() == root / "broken.pdf");
    }
    assert(pdf.page_count(root / "merged.pdf") == 5);

    std::cout << "[Test] Table of contents rendering..." << std::endl;
    const std::vector<TocEntry> toc{{"Plan", 1, 3}, {"Goals (2026)", 2, 4}, {"Budget", 1, 9}};
    assert(pdf.create_toc_pdf(toc, root / "toc.pdf") == 1);
    const auto toc_text = test::pages_text(root / "toc.pdf");
    assert(toc_text.size() == 1);
    assert(test::contains(toc_text[0], "(Table of Contents)"));
    assert(test::contains(toc_text[0], "(Plan)"));
    assert(test::contains(toc_text[0], "(Goals \\(2026\\))"));
    assert(test::contains(toc_text[0], "(9)"));
    pdf.create_toc_pdf(toc, root / "toc2.pdf");
    assert(test::read_text(root / "toc.pdf") == test::read_text(root / "toc2.pdf"));

    std::vector<TocEntry> many;
    for (int i = 0; i < 120; ++i) many.push_back({"Entry " + std::to_string(i), 1, i + 2});
    const int toc_pages = pdf.create_toc_pdf(many, root / "long_toc.pdf");
    assert(toc_pages > 1);
    assert(toc_pages == pdf.toc_page_count(many.size()));
    assert(pdf.page_count(root / "long_toc.pdf") == toc_pages);
    assert(pdf.toc_page_count(0) == 1);

    assert(pdf.create_toc_pdf({}, root / "empty_toc.pdf") == 1);
    assert(test::contains(test::pages_text(root / "empty_toc.pdf")[0], "(No entries)"));

    std::cout << "[Test] Cover page..." << std::endl;
    pdf.create_cover_pdf({"Annual Plan", "Grade 3"}, root / "cover.pdf");
    const auto cover = test::pages_text(root / "cover.pdf");
    assert(cover.size() == 1);
    assert(test::contains(cover[0], "(Annual Plan)") && test::contains(cover[0], "(Grade 3)"));

    std::cout << "[Test] Page numbers start at the requested page..." << std::endl;
    std::filesystem::copy_file(root / "merged.pdf", root / "numbered.pdf");
    pdf.add_page_numbers(root / "numbered.pdf", 3);
    const auto numbered = test::pages_text(root / "numbered.pdf");
    assert(numbered.size() == 5);
    assert(!test::contains(numbered[0], "/BnPageNo"));
    assert(!test::contains(numbered[1], "/BnPageNo"));
    assert(test::contains(numbered[2], "/BnPageNo") && test::contains(numbered[2], "(3) Tj"));
    assert(test::contains(numbered[4], "(5) Tj"));
    assert(test::contains(numbered[2], "(Alpha)"));
    bool threw = false;
    try {
        pdf.add_page_numbers(root / "numbered.pdf", 0);
    } catch (const Error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[Test] Bookmarks follow the TOC nesting..." << std::endl;
    const std::vector<TocEntry> outline{{"One", 1, 1}, {"One.A", 2, 2}, {"One.B", 2, 3}, {"Two", 1, 5}};
    pdf.set_bookmarks(root / "numbered.pdf", outline);
    {
        QPDF doc;
        doc.processFile((root / "numbered.pdf").c_str());
        auto outlines = doc.getRoot().getKey("/Outlines");
        assert(outlines.isDictionary());
        assert(outlines.getKey("/Count").getIntValue() == 4);
        auto first = outlines.getKey("/First");
        assert(outline_title(first) == "One");
        assert(first.getKey("/Count").getIntValue() == 2);
        assert(outline_title(first.getKey("/First")) == "One.A");
        assert(outline_title(first.getKey("/Last")) == "One.B");
        auto second = first.getKey("/Next");
        assert(outline_title(second) == "Two");
        assert(outline_title(outlines.getKey("/Last")) == "Two");
        assert(!second.hasKey("/First"));
        const auto pages = QPDFPageDocumentHelper(doc).getAllPages();
        auto dest = second.getKey("/Dest").getArrayItem(0);
        assert(dest.getObjGen() == pages[4].getObjectHandle().getObjGen());
    }

    std::cout << "[Test] Illegal outlines are rejected without touching the file..." << std::endl;
    const auto before = test::read_text(root / "numbered.pdf");
    assert(throws_structure([&] { pdf.set_bookmarks(root / "numbered.pdf", {{"Deep", 2, 1}}); }));
    assert(throws_structure([&] {
        pdf.set_bookmarks(root / "numbered.pdf", {{"One", 1, 1}, {"Jump", 3, 2}});
    }));
    assert(throws_structure([&] { pdf.set_bookmarks(root / "numbered.pdf", {{"Zero", 0, 1}}); }));
    assert(throws_structure([&] { pdf.set_bookmarks(root / "numbered.pdf", {{"Far", 1, 6}}); }));
    assert(throws_structure([&] {
        pdf.set_bookmarks(root / "numbered.pdf", {{"Late", 1, 4}, {"Early", 1, 2}});
    }));
    assert(test::read_text(root / "numbered.pdf") == before);

    std::cout << "[Test] Compression never damages the document..." << std::endl;
    assert(!pdf.has_compressor());
    assert(!pdf.compress(root / "numbered.pdf"));

    for (const auto mode : {ScriptedCompressor::Mode::Fail, ScriptedCompressor::Mode::Garbage}) {
        auto compressor = std::make_unique<ScriptedCompressor>(mode);
        auto* c = compressor.get();
        const PdfProcessor with(config, std::move(compressor));
        assert(with.has_compressor());
        assert(!with.compress(root / "numbered.pdf"));
        assert(c->calls == 1);
        assert(test::read_text(root / "numbered.pdf") == before);
    }
    const PdfProcessor copying(config, std::make_unique<ScriptedCompressor>(ScriptedCompressor::Mode::Copy));
    assert(copying.compress(root / "numbered.pdf"));
    assert(test::read_text(root / "numbered.pdf") == before);

    for (const auto& entry : std::filesystem::directory_iterator(root)) {
        assert(!test::contains(entry.path().filename().string(), ".tmp"));
    }
    assert(MimeDetector::is_pdf(root / "numbered.pdf"));

    std::cout << "[PASS] PDF processing behaves as expected." << std::endl;
    return 0;
}
