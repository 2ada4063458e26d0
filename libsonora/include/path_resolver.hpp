/**
 * @file path_resolver.hpp
 * @brief Cached lookup of executables on the runtime search path.
 */

#ifndef SONORA_PATH_RESOLVER_HPP
#define SONORA_PATH_RESOLVER_HPP

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sonora {

/**
 * @brief Maps executable names to their location on the search path.
 *
 * @details The directories of the search path are scanned once on
 * construction and again on every refresh(). Each scan builds a complete
 * new map which then replaces the previous one in a single swap, so
 * concurrent resolve() calls see either the old or the new map, never a
 * partial one. Unreadable directories are skipped.
 *
 * When a name appears in several directories, the first directory in
 * search order wins, as with a shell lookup.
 */
class PathResolver {
public:
    /// Resolve against the PATH environment variable, re-read on each refresh().
    PathResolver();

    /// Resolve against a fixed, colon-separated list of directories.
    explicit PathResolver(std::string search_path);

    /// Rescan the search path and atomically replace the cached map.
    void refresh();

    /**
     * @brief Find an executable by name.
     *
     * A name containing a directory separator is checked directly on the
     * filesystem instead of the cache.
     * @return Absolute path of the executable, or std::nullopt if not found.
     */
    [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view name) const;

    /// @return Number of executables currently mapped.
    [[nodiscard]] size_t size() const;

private:
    using PathMap = std::unordered_map<std::string, std::filesystem::path>;

    [[nodiscard]] std::string current_search_path() const;

    std::optional<std::string> fixed_search_path_;
    std::shared_ptr<const PathMap> map_;
    mutable std::mutex mtx_;
};

/**
 * @brief Check whether @p path is a regular file with an execute bit set.
 */
bool is_executable_file(const std::filesystem::path& path);

} // namespace sonora

#endif // SONORA_PATH_RESOLVER_HPP
