#ifndef SONORA_FILE_LOG_SINK_HPP
#define SONORA_FILE_LOG_SINK_HPP

#include "../../../libsonora/include/log_sink.hpp"
#include "../../../libsonora/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>

/**
 * @brief Appends every message it receives to a log file.
 */
class FileLogSink final : public sonora::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename) : out_(filename, std::ios::app) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const sonora::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << "[" << sonora::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // SONORA_FILE_LOG_SINK_HPP
