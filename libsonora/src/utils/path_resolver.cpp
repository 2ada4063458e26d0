#include "../../include/path_resolver.hpp"
#include "../../include/logger.hpp"
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace sonora {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto st = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::is_regular_file(st)) {
        return false;
    }
    using std::filesystem::perms;
    return (st.permissions() & (perms::owner_exec | perms::group_exec | perms::others_exec)) != perms::none;
}

PathResolver::PathResolver() {
    refresh();
}

PathResolver::PathResolver(std::string search_path) : fixed_search_path_(std::move(search_path)) {
    refresh();
}

std::string PathResolver::current_search_path() const {
    if (fixed_search_path_) {
        return *fixed_search_path_;
    }
    const char* env = std::getenv("PATH");
    return env ? env : "";
}

void PathResolver::refresh() {
    auto map = std::make_shared<PathMap>();

    std::stringstream dirs(current_search_path());
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }

        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Debug, "Skipping search path entry " + dir + ": " + ec.message(), "path_resolver");
            continue;
        }

        std::filesystem::directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                Logger::log(LogLevel::Debug, "Error reading " + dir + ": " + ec.message(), "path_resolver");
                break;
            }
            const auto& path = it->path();
            auto name = path.filename().string();
            if (map->contains(name) || !is_executable_file(path)) {
                continue;
            }
            map->emplace(std::move(name), std::filesystem::absolute(path, ec));
        }
    }

    Logger::log(LogLevel::Debug, "Found " + std::to_string(map->size()) + " executables on search path",
                "path_resolver");

    std::lock_guard lock(mtx_);
    map_ = std::move(map);
}

std::optional<std::filesystem::path> PathResolver::resolve(const std::string_view name) const {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        const std::filesystem::path path(name);
        if (!is_executable_file(path)) {
            return std::nullopt;
        }
        std::error_code ec;
        auto abs = std::filesystem::absolute(path, ec);
        return ec ? path : abs;
    }

    std::shared_ptr<const PathMap> map;
    {
        std::lock_guard lock(mtx_);
        map = map_;
    }
    if (!map) {
        return std::nullopt;
    }
    const auto it = map->find(std::string(name));
    if (it == map->end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PathResolver::size() const {
    std::lock_guard lock(mtx_);
    return map_ ? map_->size() : 0;
}

} // namespace sonora
