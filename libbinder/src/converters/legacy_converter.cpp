#include "../../include/legacy_converter.hpp"
#include "../../include/config.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <map>

namespace binder {

namespace {
constexpr std::string_view kTag = "LegacyConverter";
}

LegacyConverter::LegacyConverter(const Config& config)
    : command_(config.legacy_command),
      timeout_(config.retry.legacy_timeout),
      ready_timeout_(config.retry.legacy_ready_timeout),
      stable_polls_(config.retry.output_stable_polls) {}

LegacyConverter::~LegacyConverter() {
    cleanup();
}

void LegacyConverter::preflight(const std::filesystem::path& source) {
    if (command_.empty()) {
        throw Error(ErrorKind::Conversion, "no legacy word-processor converter configured", source);
    }
    std::error_code ec;
    if (std::filesystem::file_size(source, ec) == 0 || ec) {
        throw Error(ErrorKind::Conversion, "empty or unreadable document", source);
    }
}

void LegacyConverter::convert(const std::filesystem::path& source,
                              const std::filesystem::path& output) {
    partial_ = output;
    partial_.replace_extension(".partial.pdf");
    std::error_code ec;
    std::filesystem::remove(partial_, ec);

    const auto argv = expand_command(command_, {
        {"input", std::filesystem::absolute(source).string()},
        {"output", std::filesystem::absolute(partial_).string()},
    });

    const auto result = process_.run(argv, timeout_);
    if (result.timed_out) {
        throw Error(ErrorKind::Automation,
            "legacy conversion timed out after " + std::to_string(timeout_.count()) + "s", source);
    }
    if (result.exit_code != 0) {
        throw Error(ErrorKind::Conversion,
            "legacy converter exited with code " + std::to_string(result.exit_code), source);
    }
    if (!wait_for_stable_file(partial_, ready_timeout_, stable_polls_)) {
        throw Error(ErrorKind::Automation, "legacy converter output did not become ready", source);
    }
    move_file(partial_, output);
    partial_.clear();
    Logger::log(LogLevel::Debug, "Converted " + source.string(), kTag);
}

void LegacyConverter::cleanup() noexcept {
    process_.terminate();
    if (!partial_.empty()) {
        std::error_code ec;
        std::filesystem::remove(partial_, ec);
        partial_.clear();
    }
}

} // namespace binder
