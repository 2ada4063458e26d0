#include "../../include/logger.hpp"
#include <vector>

namespace sonora {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;
std::atomic<LogLevel> Logger::level_{LogLevel::Debug};

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::set_level(const LogLevel level) noexcept {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept {
    return level_.load(std::memory_order_relaxed);
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (level < Logger::level()) {
        return;
    }
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

} // namespace sonora
