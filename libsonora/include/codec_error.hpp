/**
 * @file codec_error.hpp
 * @brief Exceptions raised by the codec registry and command engine.
 */

#ifndef SONORA_CODEC_ERROR_HPP
#define SONORA_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sonora {

/**
 * @brief Base class of every error reported by sonora.
 */
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A codec was looked up by a name that is not registered.
 */
class CodecNotFound final : public CodecError {
public:
    explicit CodecNotFound(const std::string& name)
        : CodecError("Codec not configured: " + name), name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/**
 * @brief A command pattern does not contain exactly one FILE and one OUTFILE token.
 */
class InvalidTemplate final : public CodecError {
public:
    InvalidTemplate(const std::string& pattern, const std::string& reason)
        : CodecError("Invalid command template '" + pattern + "': " + reason), pattern_(pattern) {}

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

private:
    std::string pattern_;
};

/**
 * @brief No encoder (or decoder) of a codec can be run on this host.
 */
class NoCommandAvailable final : public CodecError {
public:
    NoCommandAvailable(const std::string& codec, const std::string& kind)
        : CodecError("No " + kind + "s available for codec: " + codec), codec_(codec) {}

    [[nodiscard]] const std::string& codec() const noexcept { return codec_; }

private:
    std::string codec_;
};

/**
 * @brief The persisted storage could not be opened, created or queried.
 */
class StorageError : public CodecError {
public:
    using CodecError::CodecError;
};

/**
 * @brief An insert or update violated a UNIQUE or FOREIGN KEY constraint.
 */
class ConstraintViolation final : public StorageError {
public:
    using StorageError::StorageError;
};

} // namespace sonora

#endif // SONORA_CODEC_ERROR_HPP
