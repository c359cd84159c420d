#ifndef BINDER_CONSOLE_LOG_SINK_HPP
#define BINDER_CONSOLE_LOG_SINK_HPP

#include "../../../libbinder/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints log lines at or above a threshold.
 * Debug and info go to stdout, warnings and errors to stderr.
 */
class ConsoleLogSink final : public binder::ILogSink {
public:
    binder::LogLevel log_level = binder::LogLevel::Error;
    bool silent = false; ///< "NONE" log level

    void log(const binder::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (silent || static_cast<int>(level) < static_cast<int>(log_level)) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case binder::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case binder::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case binder::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case binder::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // BINDER_CONSOLE_LOG_SINK_HPP
