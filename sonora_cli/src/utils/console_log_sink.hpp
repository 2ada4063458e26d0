#ifndef SONORA_CONSOLE_LOG_SINK_HPP
#define SONORA_CONSOLE_LOG_SINK_HPP

#include "../../../libsonora/include/log_sink.hpp"
#include <iostream>

/**
 * @brief Writes log messages at or above a threshold to the terminal.
 *
 * Debug and info go to stdout, warnings and errors to stderr.
 */
class ConsoleLogSink final : public sonora::ILogSink {
public:
    sonora::LogLevel log_level = sonora::LogLevel::Error;

    void log(const sonora::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;
        switch (level) {
            case sonora::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case sonora::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case sonora::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case sonora::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // SONORA_CONSOLE_LOG_SINK_HPP
