#include "../../include/transcoder.hpp"
#include "../../include/codec_error.hpp"
#include "../../include/codec_registry.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <optional>
#include <system_error>

namespace sonora {

namespace {

constexpr std::string_view kIntermediateCodec = "wav";

Codec match_or_throw(const CodecRegistry& registry, const std::filesystem::path& path) {
    auto codec = registry.match_extension(path);
    if (!codec) {
        const auto ext = path.extension().string();
        throw CodecNotFound(ext.empty() ? path.filename().string() : ext);
    }
    return *codec;
}

} // namespace

int Transcoder::transcode(const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          const LineSink& stdout_sink,
                          const LineSink& stderr_sink) const {
    const auto src = match_or_throw(registry_, input);
    const auto dst = match_or_throw(registry_, output);

    const bool decode = src.name() != kIntermediateCodec;
    const bool encode = dst.name() != kIntermediateCodec;

    // pick both commands before running anything
    std::optional<CommandTemplate> decoder;
    std::optional<CommandTemplate> encoder;
    if (decode) decoder = src.best_decoder();
    if (encode) encoder = dst.best_encoder();

    Logger::log(LogLevel::Info,
                "Transcoding " + input.string() + " (" + src.name() + ") -> " +
                output.string() + " (" + dst.name() + ")",
                "transcoder");

    if (!decode && !encode) {
        // wav to wav still goes through a command-free copy
        std::error_code ec;
        if (std::filesystem::equivalent(input, output, ec)) {
            Logger::log(LogLevel::Debug, "Input and output are the same file: " + input.string(), "transcoder");
            return 0;
        }
        std::filesystem::copy_file(input, output, std::filesystem::copy_options::overwrite_existing);
        return 0;
    }
    if (!decode) {
        return encoder->run(input, output, stdout_sink, stderr_sink);
    }
    if (!encode) {
        return decoder->run(input, output, stdout_sink, stderr_sink);
    }

    const auto work_dir = make_temp_dir_for(input, "transcode");
    int rc = 0;
    try {
        const auto wav = work_dir / (input.stem().string() + ".wav");
        rc = decoder->run(input, wav, stdout_sink, stderr_sink);
        if (rc == 0) {
            rc = encoder->run(wav, output, stdout_sink, stderr_sink);
        } else {
            Logger::log(LogLevel::Error, "Decoding failed, skipping encoder: " + input.string(), "transcoder");
        }
    } catch (const std::exception&) {
        cleanup_temp_dir(work_dir, "transcoder");
        throw;
    }
    cleanup_temp_dir(work_dir, "transcoder");
    return rc;
}

} // namespace sonora
