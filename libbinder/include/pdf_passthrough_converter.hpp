#ifndef BINDER_PDF_PASSTHROUGH_CONVERTER_HPP
#define BINDER_PDF_PASSTHROUGH_CONVERTER_HPP

#include "converter.hpp"

namespace binder {

/**
 * @brief Accepts existing PDFs after checking that qpdf can open them
 * and that they have at least one page. The source is copied unchanged.
 */
class PdfPassthroughConverter final : public IConverter {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "PdfPassthrough"; }
    [[nodiscard]] ConverterKind kind() const noexcept override { return ConverterKind::PdfPassthrough; }

    void preflight(const std::filesystem::path& source) override;

    void convert(const std::filesystem::path& source,
                 const std::filesystem::path& output) override;
};

} // namespace binder

#endif // BINDER_PDF_PASSTHROUGH_CONVERTER_HPP
