#ifndef SONORA_TEST_HELPERS_HPP
#define SONORA_TEST_HELPERS_HPP

#include "log_sink.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace sonora::test {

// unique directory under the system temp path, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("sonora-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// writes an executable /bin/sh script and returns its path
inline std::filesystem::path write_script(const std::filesystem::path& dir,
                                          const std::string& name,
                                          const std::string& body) {
    const auto path = dir / name;
    write_file(path, "#!/bin/sh\n" + body + "\n");
    using std::filesystem::perms;
    std::filesystem::permissions(path, perms::owner_all | perms::group_read | perms::group_exec |
                                       perms::others_read | perms::others_exec);
    return path;
}

// prepends a directory to PATH for the lifetime of the object
class ScopedSearchPath {
public:
    explicit ScopedSearchPath(const std::filesystem::path& dir) {
        if (const char* old = std::getenv("PATH")) {
            saved_ = old;
        }
        const std::string value = dir.string() + (saved_ ? ":" + *saved_ : std::string());
        ::setenv("PATH", value.c_str(), 1);
    }

    ~ScopedSearchPath() {
        if (saved_) {
            ::setenv("PATH", saved_->c_str(), 1);
        } else {
            ::unsetenv("PATH");
        }
    }

    ScopedSearchPath(const ScopedSearchPath&) = delete;
    ScopedSearchPath& operator=(const ScopedSearchPath&) = delete;

private:
    std::optional<std::string> saved_;
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string tag;
};

// records every message; shared state outlives the sink owned by Logger
class CapturingLogSink final : public ILogSink {
public:
    struct Records {
        std::mutex mtx;
        std::vector<LogEntry> entries;

        [[nodiscard]] bool contains(const LogLevel level, const std::string& needle) {
            std::lock_guard lock(mtx);
            for (const auto& e : entries) {
                if (e.level == level && e.message.find(needle) != std::string::npos) return true;
            }
            return false;
        }
    };

    explicit CapturingLogSink(std::shared_ptr<Records> records) : records_(std::move(records)) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        std::lock_guard lock(records_->mtx);
        records_->entries.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::shared_ptr<Records> records_;
};

// installs a CapturingLogSink for the lifetime of the object
class ScopedLogCapture {
public:
    ScopedLogCapture() : records_(std::make_shared<CapturingLogSink::Records>()) {
        Logger::clear_sinks();
        Logger::set_level(LogLevel::Debug);
        Logger::add_sink(std::make_unique<CapturingLogSink>(records_));
    }

    ~ScopedLogCapture() { Logger::clear_sinks(); }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    [[nodiscard]] bool contains(const LogLevel level, const std::string& needle) const {
        return records_->contains(level, needle);
    }

private:
    std::shared_ptr<CapturingLogSink::Records> records_;
};

} // namespace sonora::test

#endif // SONORA_TEST_HELPERS_HPP
