/**
 * @file converter.hpp
 * @brief Contract shared by all per-format converters.
 */

#ifndef BINDER_CONVERTER_HPP
#define BINDER_CONVERTER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace binder {

/**
 * @brief The closed set of conversion capabilities.
 */
enum class ConverterKind {
    OfficeDocument,      ///< Word, Excel, PowerPoint, RTF, OpenDocument
    Image,               ///< Raster images
    LegacyWordProcessor, ///< Ichitaro and similar, through an external tool
    PdfPassthrough       ///< Already a PDF
};

inline constexpr std::size_t kConverterKindCount = 4;

const char* to_string(ConverterKind kind) noexcept;

enum class ConversionFailure {
    Unsupported,      ///< Extension not in the dispatch table
    Ignored,          ///< Hidden, lock or temporary file
    InvalidInput,     ///< Source rejected before conversion; not retried
    ConversionFailed, ///< Every attempt failed
    InvalidOutput     ///< Last attempt produced something that is not a PDF
};

const char* to_string(ConversionFailure failure) noexcept;

/**
 * @brief Outcome of converting one source file.
 *
 * If pdf_path is set the file exists, is non-empty and carries the PDF
 * signature.
 */
struct ConversionResult {
    std::filesystem::path source_path;
    std::optional<std::filesystem::path> pdf_path;
    std::optional<ConversionFailure> failure_reason;
    int attempts_used = 0;
    std::string message; ///< Last error text when failed

    [[nodiscard]] bool ok() const noexcept { return pdf_path.has_value(); }
};

/**
 * @brief One conversion capability.
 *
 * Implementations throw binder::Error on failure and must not leave a
 * partially written output file behind. ConverterRegistry owns the
 * instances and drives retries.
 */
class IConverter {
public:
    virtual ~IConverter() = default;

    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    [[nodiscard]] virtual ConverterKind kind() const noexcept = 0;

    /// @return True if failures may be transient and worth another attempt.
    [[nodiscard]] virtual bool is_retryable() const noexcept { return false; }

    /**
     * @brief Permanent checks on the source before any attempt.
     * @throws Error if the source can never be converted.
     */
    virtual void preflight(const std::filesystem::path& /*source*/) {}

    /**
     * @brief Convert @p source into the PDF file @p output.
     * @throws Error on failure, with ErrorKind::Automation when the external
     * session is stuck.
     */
    virtual void convert(const std::filesystem::path& source,
                         const std::filesystem::path& output) = 0;

    /**
     * @brief Forced cleanup of external state (processes, scratch files).
     * Idempotent; safe to call when nothing was started.
     */
    virtual void cleanup() noexcept {}

    /// Directory for scratch data of later conversions.
    virtual void set_scratch_root(const std::filesystem::path& /*dir*/) {}
};

} // namespace binder

#endif // BINDER_CONVERTER_HPP
