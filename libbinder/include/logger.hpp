/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 */

#ifndef BINDER_LOGGER_HPP
#define BINDER_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace binder {

/**
 * @brief Global entry point for logging inside libbinder.
 *
 * Messages are delivered to every registered ILogSink. With no sink
 * installed, logging is a no-op, so the library stays silent unless the
 * embedding application decides otherwise.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation, ignored if null.
     * @return Non-owning handle usable with remove_sink().
     */
    static ILogSink* add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Unregister and destroy a sink previously returned by add_sink().
     * Unknown handles are ignored.
     */
    static void remove_sink(const ILogSink* sink);

    /// Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "binder").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "binder");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name ("DEBUG", "INFO", "WARNING", "ERROR").
     * Case-sensitive. Unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_; ///< Registered sinks
    static std::mutex mtx_;                               ///< Guards sinks_
};

} // namespace binder

#endif // BINDER_LOGGER_HPP
