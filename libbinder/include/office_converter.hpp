/**
 * @file office_converter.hpp
 * @brief Office documents to PDF through a headless office suite.
 */

#ifndef BINDER_OFFICE_CONVERTER_HPP
#define BINDER_OFFICE_CONVERTER_HPP

#include "converter.hpp"
#include "external_process.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace binder {

struct Config;

/**
 * @brief Drives an office suite (LibreOffice by default) per document.
 *
 * @details Each attempt runs the configured command with a private user
 * profile inside a session directory, so a crashed instance cannot block
 * the next one. The session directory is kept between files and removed
 * by cleanup(). OOXML packages are checked with libarchive before any
 * process is started.
 */
class OfficeConverter final : public IConverter {
public:
    OfficeConverter(const Config& config, std::filesystem::path scratch_root);
    ~OfficeConverter() override;

    [[nodiscard]] std::string_view get_name() const noexcept override { return "OfficeConverter"; }
    [[nodiscard]] ConverterKind kind() const noexcept override { return ConverterKind::OfficeDocument; }
    [[nodiscard]] bool is_retryable() const noexcept override { return true; }

    /// Rejects empty files and OOXML files that are not valid packages.
    void preflight(const std::filesystem::path& source) override;

    void convert(const std::filesystem::path& source,
                 const std::filesystem::path& output) override;

    /// Kills a running office process and removes the session directory.
    void cleanup() noexcept override;

    /// Ends the current session; the next one starts below @p dir.
    void set_scratch_root(const std::filesystem::path& dir) override;

    /// @return True if @p path is a zip package containing "[Content_Types].xml".
    static bool is_ooxml_package(const std::filesystem::path& path);

private:
    std::string command_;
    std::chrono::seconds timeout_;
    std::filesystem::path scratch_root_;
    std::filesystem::path session_dir_;
    ExternalProcess process_;
};

} // namespace binder

#endif // BINDER_OFFICE_CONVERTER_HPP
