/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef BINDER_LOG_SINK_HPP
#define BINDER_LOG_SINK_HPP

#include <string_view>

namespace binder {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Diagnostic detail (per-attempt commands, temp paths)
    Info,    ///< Normal progress of a job
    Warning, ///< Recoverable problems (skipped files, failed compression)
    Error    ///< Failures that abort a stage or a job
};

/**
 * @brief Abstract destination for log lines.
 *
 * Implementations decide how a line is delivered (console, file, GUI
 * callback). The Logger facade fans every message out to all sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one log line.
     * @param level Severity of the message.
     * @param message The message text.
     * @param tag Component that produced the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace binder

#endif // BINDER_LOG_SINK_HPP
