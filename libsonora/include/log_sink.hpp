/**
 * @file log_sink.hpp
 * @brief Log severity levels and the sink interface used by Logger.
 */

#ifndef SONORA_LOG_SINK_HPP
#define SONORA_LOG_SINK_HPP

#include <string_view>

namespace sonora {

/**
 * @brief Severity of a log message, ordered from least to most severe.
 */
enum class LogLevel {
    Debug,   ///< Registry queries, search path scans, spawned command lines
    Info,    ///< Seeded codecs, commands about to run, transcodes
    Warning, ///< Non-zero exit codes, ignored input
    Error    ///< Failures reported to the caller
};

/**
 * @brief Destination for log messages.
 *
 * Logger owns the sinks and calls them under its own lock, so an
 * implementation only needs its own locking when it is shared elsewhere.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @param level Severity of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "codec_registry").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace sonora

#endif // SONORA_LOG_SINK_HPP
