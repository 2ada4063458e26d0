/**
 * @file default_codecs.hpp
 * @brief The built-in codec set seeded into a new registry.
 */

#ifndef SONORA_DEFAULT_CODECS_HPP
#define SONORA_DEFAULT_CODECS_HPP

#include <span>
#include <string_view>
#include <vector>

namespace sonora {

/**
 * @brief Compiled-in description of one codec.
 *
 * Command lists are in preference order: the first entry is registered with
 * the highest priority.
 */
struct DefaultCodec {
    std::string_view name;
    std::string_view description;
    std::vector<std::string_view> extensions;
    std::vector<std::string_view> encoders;
    std::vector<std::string_view> decoders;
};

/**
 * @brief The default codec table.
 *
 * @note Entries are only inserted for codec names missing from storage.
 * Changing an entry here does not update a codec that was already seeded.
 */
std::span<const DefaultCodec> default_codecs();

} // namespace sonora

#endif // SONORA_DEFAULT_CODECS_HPP
