/**
 * @file compressor.hpp
 * @brief Optional external PDF compressor.
 */

#ifndef BINDER_COMPRESSOR_HPP
#define BINDER_COMPRESSOR_HPP

#include "external_process.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace binder {

struct Config;

/**
 * @brief Rewrites a PDF into a smaller one.
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Compress @p input into @p output.
     * @return True if @p output was written. Never throws for an ordinary
     * compressor failure.
     */
    virtual bool compress(const std::filesystem::path& input,
                          const std::filesystem::path& output) = 0;
};

/**
 * @brief Runs a command such as Ghostscript's pdfwrite device.
 *
 * Example template:
 * `gs -sDEVICE=pdfwrite -dCompatibilityLevel=1.5 -dPDFSETTINGS=/ebook -dNOPAUSE -dQUIET -dBATCH -sOutputFile={output} {input}`
 */
class CommandCompressor final : public ICompressor {
public:
    CommandCompressor(std::string command_template, std::chrono::seconds timeout)
        : command_(std::move(command_template)), timeout_(timeout) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "CommandCompressor"; }

    bool compress(const std::filesystem::path& input,
                  const std::filesystem::path& output) override;

private:
    std::string command_;
    std::chrono::seconds timeout_;
    ExternalProcess process_;
};

/// @return A CommandCompressor, or null when config.compressor_command is empty.
std::unique_ptr<ICompressor> make_compressor(const Config& config);

} // namespace binder

#endif // BINDER_COMPRESSOR_HPP
