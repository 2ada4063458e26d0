/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * The Logger class is the single entry point for all logging within the
 * library. It delegates log messages to one or more registered ILogSink
 * implementations. The library never installs a sink by itself: without
 * sinks, messages are dropped.
 */

#ifndef SONORA_LOGGER_HPP
#define SONORA_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sonora {

/**
 * @brief Static logging facade for sonora.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Set the lowest level that reaches the sinks (default: Debug).
     */
    static void set_level(LogLevel level) noexcept;

    [[nodiscard]] static LogLevel level() noexcept;

    /**
     * @brief Log a message to all registered sinks.
     * Messages below the current level are dropped without locking.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "sonora").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "sonora");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
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
     * @brief Converts a string to its LogLevel.
     * Case-sensitive, accepts "WARN" and "WARNING".
     * @return The matching level, or std::nullopt for "NONE" and unknown values.
     */
    static std::optional<LogLevel> string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        if (level == "ERROR")
            return LogLevel::Error;
        return std::nullopt;
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
    static std::atomic<LogLevel> level_;
};

} // namespace sonora

#endif // SONORA_LOGGER_HPP
