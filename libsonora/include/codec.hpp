/**
 * @file codec.hpp
 * @brief A codec entry of the registry and its command templates.
 */

#ifndef SONORA_CODEC_HPP
#define SONORA_CODEC_HPP

#include "command_template.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

/**
 * @namespace sonora
 * @brief Codec registry and external command engine.
 *
 * @details Contains the persistent CodecRegistry, the Codec handles it
 * returns, CommandTemplate and the process runner used to execute them,
 * the PathResolver used to probe availability, and the Logger facade.
 */
namespace sonora {

class Database;
class PathResolver;

/**
 * @brief Handle to one codec stored in a CodecRegistry.
 *
 * @details A Codec is a lightweight view: it stores the codec name and
 * description and queries the registry storage on every accessor, so it
 * always reflects the current extensions and templates. Handles are
 * obtained from CodecRegistry and are valid as long as the registry lives.
 * Once the codec is unregistered, accessors throw CodecNotFound.
 */
class Codec {
public:
    Codec(Database& db, const PathResolver& resolver, std::string name, std::string description);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }

    /**
     * @return Storage id of the codec row.
     * @throws CodecNotFound if the codec has been unregistered.
     */
    [[nodiscard]] std::int64_t id() const;

    /// @return All extensions owned by this codec (lower-case, without dot).
    [[nodiscard]] std::set<std::string> extensions() const;

    /// @return Encoders by descending priority, ties in registration order.
    [[nodiscard]] std::vector<CommandTemplate> encoders() const;

    /// @return Decoders by descending priority, ties in registration order.
    [[nodiscard]] std::vector<CommandTemplate> decoders() const;

    /// @return Encoders found by the resolver, resolved to their executable, in encoders() order.
    [[nodiscard]] std::vector<CommandTemplate> available_encoders() const;
    [[nodiscard]] std::vector<CommandTemplate> available_decoders() const;

    /**
     * @brief Highest-priority encoder whose executable is on the search path.
     * The returned template runs the file the resolver found.
     * @throws NoCommandAvailable if none is.
     */
    [[nodiscard]] CommandTemplate best_encoder() const;

    /**
     * @brief Highest-priority decoder whose executable is on the search path.
     * The returned template runs the file the resolver found.
     * @throws NoCommandAvailable if none is.
     */
    [[nodiscard]] CommandTemplate best_decoder() const;

    /**
     * @brief Attach a file extension to this codec.
     *
     * Leading dots are stripped and the extension is lower-cased. Extensions
     * are unique across all codecs: registering one that is already taken,
     * by this codec or another, is logged and ignored.
     */
    void register_extension(std::string_view extension);

    /// Remove an extension owned by this codec; no-op if it is not.
    void unregister_extension(std::string_view extension);

    /**
     * @brief Store an encoder command for this codec.
     * @throws InvalidTemplate if the pattern fails validation; nothing is stored.
     */
    void register_encoder(std::string_view pattern, int priority = 0);

    /**
     * @brief Store a decoder command for this codec.
     * @throws InvalidTemplate if the pattern fails validation; nothing is stored.
     */
    void register_decoder(std::string_view pattern, int priority = 0);

private:
    [[nodiscard]] std::vector<CommandTemplate> commands(CommandKind kind) const;
    [[nodiscard]] std::vector<CommandTemplate> available(CommandKind kind) const;
    void register_command(CommandKind kind, std::string_view pattern, int priority);

    Database* db_;
    const PathResolver* resolver_;
    std::string name_;
    std::string description_;
};

/**
 * @brief Normalize an extension: strip leading dots, lower-case.
 */
std::string normalize_extension(std::string_view extension);

} // namespace sonora

#endif // SONORA_CODEC_HPP
