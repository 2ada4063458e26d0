/**
 * @file file_utils.hpp
 * @brief Temporary work directories for multi-step transcodes.
 */

#ifndef SONORA_FILE_UTILS_HPP
#define SONORA_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace sonora {

    /**
     * @brief Creates a unique temporary directory for one transcode.
     *
     * Creates a directory inside the system temp path using a
     * "sonora-{prefix}/{prefix}_{filename_stem}_{random_suffix}" pattern.
     *
     * @param input_path The input file path (used for its stem).
     * @param prefix A short prefix (e.g., "transcode").
     * @return Filesystem path to the newly created temporary directory.
     * @throws std::filesystem::filesystem_error if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

} // namespace sonora

#endif // SONORA_FILE_UTILS_HPP
