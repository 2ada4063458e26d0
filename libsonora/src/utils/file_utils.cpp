#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <random>
#include <system_error>

namespace sonora {

    namespace {
        thread_local std::mt19937_64 rng{std::random_device{}()};

        std::string random_suffix() {
            std::uniform_int_distribution<unsigned long long> dist;
            return std::to_string(dist(rng));
        }
    }

    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path, const std::string& prefix) {
        // use a common base dir inside temp
        const auto base_tmp = std::filesystem::temp_directory_path() / ("sonora-" + prefix);

        const std::string stem = input_path.stem().string();
        auto dir = base_tmp / (prefix + "_" + stem + "_" + random_suffix());

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::filesystem::filesystem_error("Cannot create temporary directory", dir, ec);
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

} // namespace sonora
