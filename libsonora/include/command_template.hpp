/**
 * @file command_template.hpp
 * @brief An external encoder or decoder command pattern.
 */

#ifndef SONORA_COMMAND_TEMPLATE_HPP
#define SONORA_COMMAND_TEMPLATE_HPP

#include "process.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sonora {

class PathResolver;

/**
 * @brief Role of a command template within its codec.
 */
enum class CommandKind {
    Encoder, ///< Converts a WAV file into the codec's format
    Decoder  ///< Converts a file of the codec's format into WAV
};

const char* command_kind_to_string(CommandKind kind);

/**
 * @brief One whitespace-delimited token of a command pattern.
 *
 * The literals "FILE" and "OUTFILE" are parsed as placeholders; any other
 * token is passed to the external process verbatim.
 */
struct CommandToken {
    enum class Kind {
        Literal,    ///< Passed as-is
        InputFile,  ///< The "FILE" placeholder
        OutputFile  ///< The "OUTFILE" placeholder
    };

    Kind kind = Kind::Literal;
    std::string text; ///< Original token text

    bool operator==(const CommandToken&) const = default;
};

/**
 * @brief A command pattern with FILE/OUTFILE placeholders.
 *
 * @details A template is a value: parsing never fails, and the placeholder
 * contract is checked by validate(), which registration, instantiate() and
 * run() all go through. Patterns read back from storage are not validated
 * until they are instantiated.
 */
class CommandTemplate {
public:
    explicit CommandTemplate(std::string_view pattern,
                             CommandKind kind = CommandKind::Encoder,
                             int priority = 0);

    /**
     * @brief Check the placeholder contract.
     * @throws InvalidTemplate unless the pattern contains exactly one FILE
     * and exactly one OUTFILE token.
     */
    void validate() const;

    /**
     * @brief Whether the command's executable resolves on the search path.
     */
    [[nodiscard]] bool is_available(const PathResolver& resolver) const;

    /**
     * @brief Look the program up with @p resolver and keep its location.
     * @details A resolved template runs exactly that file. An unresolved one
     * leaves the lookup to run_process.
     * @return false, leaving the template unresolved, if the program was not found.
     */
    bool resolve(const PathResolver& resolver);

    [[nodiscard]] const std::optional<std::filesystem::path>& resolved_executable() const noexcept {
        return resolved_;
    }

    /**
     * @brief Build the argument list for a concrete file pair.
     * @return Tokens with FILE replaced by @p input and OUTFILE by @p output.
     * @throws InvalidTemplate if validation fails.
     */
    [[nodiscard]] std::vector<std::string> instantiate(const std::filesystem::path& input,
                                                       const std::filesystem::path& output) const;

    /**
     * @brief Run the command on a file pair and wait for it to exit.
     *
     * Without sinks, all output is drained and discarded. With either sink,
     * complete lines are forwarded as they become available; the stream of an
     * absent sink is discarded. Standard input is the null device.
     *
     * A non-zero exit code is logged and returned, not thrown.
     * @return The exit code, or the negated signal number if the child was killed.
     * @throws InvalidTemplate if validation fails.
     * @throws std::system_error if the process cannot be started.
     */
    int run(const std::filesystem::path& input,
            const std::filesystem::path& output,
            const LineSink& stdout_sink = {},
            const LineSink& stderr_sink = {}) const;

    [[nodiscard]] CommandKind kind() const noexcept { return kind_; }
    [[nodiscard]] int priority() const noexcept { return priority_; }
    [[nodiscard]] const std::vector<CommandToken>& tokens() const noexcept { return tokens_; }

    /// @return The first token (program name), or an empty string for an empty pattern.
    [[nodiscard]] std::string executable() const;

    /// @return The pattern with tokens joined by single spaces.
    [[nodiscard]] std::string to_string() const;

private:
    std::vector<CommandToken> tokens_;
    std::optional<std::filesystem::path> resolved_;
    CommandKind kind_;
    int priority_;
};

} // namespace sonora

#endif // SONORA_COMMAND_TEMPLATE_HPP
