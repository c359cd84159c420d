#include "../../include/compressor.hpp"
#include "../../include/config.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace binder {

bool CommandCompressor::compress(const std::filesystem::path& input,
                                 const std::filesystem::path& output) {
    try {
        const auto argv = expand_command(command_, {{"input", input.string()}, {"output", output.string()}});
        const auto result = process_.run(argv, timeout_);
        if (result.timed_out) {
            Logger::log(LogLevel::Warning, "Compressor timed out on " + input.filename().string(), "Compressor");
            return false;
        }
        if (result.exit_code != 0) {
            Logger::log(LogLevel::Warning, "Compressor exited with code " + std::to_string(result.exit_code),
                        "Compressor");
            return false;
        }
    } catch (const Error& e) {
        Logger::log(LogLevel::Warning, std::string("Compressor unavailable: ") + e.what(), "Compressor");
        return false;
    }
    std::error_code ec;
    return std::filesystem::file_size(output, ec) > 0 && !ec;
}

std::unique_ptr<ICompressor> make_compressor(const Config& config) {
    if (config.compressor_command.empty()) {
        return nullptr;
    }
    return std::make_unique<CommandCompressor>(config.compressor_command, config.compressor_timeout);
}

} // namespace binder
