/**
 * @file legacy_converter.hpp
 * @brief Legacy word-processor files (Ichitaro .jtd) through an external tool.
 */

#ifndef BINDER_LEGACY_CONVERTER_HPP
#define BINDER_LEGACY_CONVERTER_HPP

#include "converter.hpp"
#include "external_process.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace binder {

struct Config;

/**
 * @brief Runs the configured legacy converter command.
 *
 * The tool writes asynchronously in some setups, so after it exits the
 * output must appear and keep a stable size for a few polls before it is
 * accepted. Without a configured command every file is rejected in
 * preflight.
 */
class LegacyConverter final : public IConverter {
public:
    explicit LegacyConverter(const Config& config);
    ~LegacyConverter() override;

    [[nodiscard]] std::string_view get_name() const noexcept override { return "LegacyConverter"; }
    [[nodiscard]] ConverterKind kind() const noexcept override { return ConverterKind::LegacyWordProcessor; }
    [[nodiscard]] bool is_retryable() const noexcept override { return true; }

    void preflight(const std::filesystem::path& source) override;

    void convert(const std::filesystem::path& source,
                 const std::filesystem::path& output) override;

    void cleanup() noexcept override;

private:
    std::string command_;
    std::chrono::seconds timeout_;
    std::chrono::seconds ready_timeout_;
    int stable_polls_;
    std::filesystem::path partial_;
    ExternalProcess process_;
};

} // namespace binder

#endif // BINDER_LEGACY_CONVERTER_HPP
