/**
 * @file transcoder.hpp
 * @brief Decode-then-encode chain between two registered codecs.
 */

#ifndef SONORA_TRANSCODER_HPP
#define SONORA_TRANSCODER_HPP

#include "process.hpp"
#include <filesystem>

namespace sonora {

class CodecRegistry;

/**
 * @brief Converts one file into another codec's format.
 *
 * @details Codecs are chosen from the extensions of the input and output
 * paths. The input is decoded to a WAV file in a temporary work directory
 * with the input codec's best decoder, which the output codec's best
 * encoder then converts to the output path. A "wav" input skips decoding
 * and a "wav" output skips encoding.
 *
 * The Transcoder runs exactly the conversion it is asked for; it never
 * checks whether the output already exists or is up to date.
 */
class Transcoder {
public:
    explicit Transcoder(const CodecRegistry& registry) : registry_(registry) {}

    /**
     * @brief Convert @p input to @p output.
     * @return 0 on success, else the exit code of the first failing command.
     * @throws CodecNotFound if either path has no registered extension.
     * @throws NoCommandAvailable if a required decoder or encoder is not installed.
     */
    int transcode(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  const LineSink& stdout_sink = {},
                  const LineSink& stderr_sink = {}) const;

private:
    const CodecRegistry& registry_;
};

} // namespace sonora

#endif // SONORA_TRANSCODER_HPP
