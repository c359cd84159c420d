/**
 * @file converter_registry.hpp
 * @brief Extension-based dispatch over the converters, with retry policy.
 */

#ifndef BINDER_CONVERTER_REGISTRY_HPP
#define BINDER_CONVERTER_REGISTRY_HPP

#include "config.hpp"
#include "converter.hpp"
#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string_view>
#include <utility>

namespace binder {

/**
 * @brief Maps a file to its converter and runs the conversion.
 *
 * @details Dispatch is a static, case-insensitive extension table. The
 * registry owns one converter per ConverterKind; all of them are built from
 * the job configuration, and tests may swap any of them with replace().
 *
 * Retryable converters get up to RetryPolicy::max_attempts attempts. Between
 * attempts the converter's cleanup() runs and the registry waits
 * n * base_backoff. Cancellation is checked before every attempt and during
 * every wait, and aborts with Error(ErrorKind::Cancelled) instead of
 * retrying. An attempt already running is allowed to finish.
 */
class ConverterRegistry {
public:
    /**
     * @param config Job configuration (retry policy, commands).
     * @param scratch_root Directory for converter scratch data and for
     * outputs when convert() is called without an explicit output path.
     */
    ConverterRegistry(const Config& config, std::filesystem::path scratch_root);
    ~ConverterRegistry();

    ConverterRegistry(const ConverterRegistry&) = delete;
    ConverterRegistry& operator=(const ConverterRegistry&) = delete;

    /// @return The static extension table, lowercase with leading dot.
    static std::span<const std::pair<std::string_view, ConverterKind>> extension_table() noexcept;

    /// @return The converter kind for @p path, by extension, ignoring case.
    static std::optional<ConverterKind> kind_for(const std::filesystem::path& path);

    /**
     * @brief Files skipped silently: hidden files, office lock files ("~$"),
     * temporary files (extension starting with ".$") and desktop metadata.
     */
    static bool is_ignorable(const std::filesystem::path& path);

    /// @return "<stem>_<8 hex digits>.pdf", stable for a given source path.
    static std::string unique_output_name(const std::filesystem::path& source);

    /// Swap the converter used for @p kind.
    void replace(ConverterKind kind, std::unique_ptr<IConverter> converter);

    [[nodiscard]] IConverter& converter(ConverterKind kind) const;

    /**
     * @brief Convert one file.
     *
     * @param source Input document, never modified.
     * @param output Destination PDF; a unique name under the scratch root if empty.
     * @param stop Cancellation token.
     * @return The per-file outcome. Ordinary conversion failures are
     * reported in the result, not thrown.
     * @throws Error(ErrorKind::Cancelled) if cancellation was observed.
     */
    ConversionResult convert(const std::filesystem::path& source,
                             const std::filesystem::path& output = {},
                             std::stop_token stop = {});

    /**
     * @brief Move scratch data of later conversions under @p dir.
     *
     * Each converter is cleaned up first, so nothing from an earlier
     * session stays behind in the old root.
     */
    void set_scratch_root(const std::filesystem::path& dir);

    [[nodiscard]] const std::filesystem::path& scratch_root() const noexcept { return scratch_root_; }

    /// Run cleanup() on every converter.
    void cleanup_all() noexcept;

private:
    Config config_;
    std::filesystem::path scratch_root_;
    std::array<std::unique_ptr<IConverter>, kConverterKindCount> converters_;
};

} // namespace binder

#endif // BINDER_CONVERTER_REGISTRY_HPP
