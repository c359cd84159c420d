#include "../../include/pdf_passthrough_converter.hpp"
#include "../../include/atomic_file.hpp"
#include "../../include/errors.hpp"
#include "../../include/pdf_builder.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

namespace binder {

void PdfPassthroughConverter::preflight(const std::filesystem::path& source) {
    QPDF pdf;
    try {
        pdf::open(pdf, source);
    } catch (const Error&) {
        throw_nested(ErrorKind::Conversion, "unreadable PDF", source);
    }
    std::size_t pages = 0;
    try {
        pages = QPDFPageDocumentHelper(pdf).getAllPages().size();
    } catch (const std::exception&) {
        throw_nested(ErrorKind::Conversion, "broken page tree", source);
    }
    if (pages == 0) {
        throw Error(ErrorKind::Conversion, "PDF has no pages", source);
    }
}

void PdfPassthroughConverter::convert(const std::filesystem::path& source,
                                      const std::filesystem::path& output) {
    atomic_copy(source, output);
}

} // namespace binder
