/**
 * @file codec_registry.hpp
 * @brief Persistent registry of codecs, extensions and command templates.
 */

#ifndef SONORA_CODEC_REGISTRY_HPP
#define SONORA_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sonora {

class Database;
class PathResolver;

/**
 * @brief The codec database.
 *
 * @details A CodecRegistry owns one SQLite connection to the persisted
 * location it was opened with. On construction it creates the schema when
 * needed and inserts every codec of the default table whose name is not yet
 * stored, along with its extensions and commands. Codecs already present
 * are never touched by seeding.
 *
 * The registry is not internally synchronized: callers sharing an instance
 * across threads must serialize access. Codec handles returned by the
 * registry must not outlive it.
 *
 * Uniqueness conflicts (codec name, extension) are logged and ignored,
 * never thrown. Invalid command patterns are rejected with InvalidTemplate.
 */
class CodecRegistry {
public:
    /**
     * @brief Open or create the registry at @p location and seed defaults.
     * @param location Database file, or ":memory:" for a private in-memory store.
     * @param resolver Search path cache used to decide command availability.
     * @throws StorageError if the location cannot be opened or initialized.
     */
    CodecRegistry(const std::filesystem::path& location, const PathResolver& resolver);
    ~CodecRegistry();

    CodecRegistry(const CodecRegistry&) = delete;
    CodecRegistry& operator=(const CodecRegistry&) = delete;
    CodecRegistry(CodecRegistry&&) noexcept;
    CodecRegistry& operator=(CodecRegistry&&) noexcept;

    /**
     * @throws CodecNotFound if no codec with that name is registered.
     */
    [[nodiscard]] Codec get_codec(const std::string& name) const;

    [[nodiscard]] bool has_codec(const std::string& name) const;

    /**
     * @brief Register a codec.
     *
     * If a codec with this name already exists, the conflict is logged and
     * the stored codec is returned unchanged.
     * @throws std::invalid_argument if @p name is empty.
     */
    Codec register_codec(const std::string& name, const std::string& description = "");

    /**
     * @brief Remove a codec with all its extensions and commands.
     * Unknown names are ignored.
     */
    void unregister_codec(const std::string& name);

    /// @return All registered codecs, in no particular order.
    [[nodiscard]] std::vector<Codec> list_codecs() const;

    /**
     * @brief Find the codec handling a file by its extension.
     *
     * The comparison is case-insensitive. Directories never match.
     * @return The owning codec, or std::nullopt for a directory, a path
     * without extension, or an unknown extension.
     */
    [[nodiscard]] std::optional<Codec> match_extension(const std::filesystem::path& path) const;

    [[nodiscard]] const PathResolver& resolver() const noexcept { return *resolver_; }
    [[nodiscard]] const std::filesystem::path& location() const noexcept;

private:
    void create_schema();
    void seed_defaults();

    std::unique_ptr<Database> db_;
    const PathResolver* resolver_;
};

/**
 * @brief Default storage location of the registry.
 *
 * SONORA_CODEC_DB if set, else $HOME/.sonora/codecs.sqlite, else a
 * "sonora" directory in the system temp path.
 */
std::filesystem::path default_database_path();

} // namespace sonora

#endif // SONORA_CODEC_REGISTRY_HPP
