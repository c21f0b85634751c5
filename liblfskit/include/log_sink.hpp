//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef LFSKIT_LOG_SINK_HPP
#define LFSKIT_LOG_SINK_HPP

#include <string_view>

namespace lfskit {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use these to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (pattern rejections, skipped files)
    Info,    ///< Normal operation (copies started/finished, scan totals)
    Warning, ///< Unexpected but recoverable states
    Error    ///< Failures that abort an operation
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message ends up (console, file, ...).
 * The Logger facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace lfskit

#endif // LFSKIT_LOG_SINK_HPP
