#include <algorithm>
#include <iostream>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include "cli/cli_parser.hpp"
#include <CLI/CLI.hpp>
#include "../../libsonora/include/codec_error.hpp"
#include "../../libsonora/include/codec_registry.hpp"
#include "../../libsonora/include/logger.hpp"
#include "../../libsonora/include/path_resolver.hpp"
#include "../../libsonora/include/transcoder.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"

using namespace sonora;

namespace {

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    bool file_logging = false;
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file);
        if (!fileSink->is_open()) {
            std::cerr << "Cannot open log file: " << settings.log_file.string() << std::endl;
        } else {
            Logger::add_sink(std::move(fileSink));
            file_logging = true;
        }
    }

    const auto level = Logger::string_to_level(settings.log_level);
    if (!settings.quiet && level) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = *level;
        Logger::add_sink(std::move(consoleSink));
    }

    // the log file records everything, the console only what was asked for
    if (file_logging) {
        Logger::set_level(LogLevel::Debug);
    } else if (level && !settings.quiet) {
        Logger::set_level(*level);
    } else {
        Logger::set_level(LogLevel::Error);
    }
}

void print_commands(const char* title, const std::vector<CommandTemplate>& commands, const PathResolver& resolver) {
    std::cout << "  " << title << ":\n";
    if (commands.empty()) {
        std::cout << "    (none)\n";
    }
    for (const auto& cmd : commands) {
        std::cout << "    [" << cmd.priority() << "] " << cmd.to_string()
                  << (cmd.is_available(resolver) ? "" : "  (not installed)") << "\n";
    }
}

void print_extensions(const Codec& codec) {
    std::cout << "  extensions:";
    for (const auto& ext : codec.extensions()) {
        std::cout << " " << ext;
    }
    std::cout << "\n";
}

int list_codecs(const CodecRegistry& registry) {
    auto codecs = registry.list_codecs();
    std::ranges::sort(codecs, {}, &Codec::name);
    for (const auto& codec : codecs) {
        std::cout << codec.name() << ": " << codec.description() << "\n";
        print_extensions(codec);
    }
    return 0;
}

int show_codec(const CodecRegistry& registry, const std::string& name) {
    const auto codec = registry.get_codec(name);
    std::cout << codec.name() << ": " << codec.description() << "\n";
    print_extensions(codec);
    print_commands("encoders", codec.encoders(), registry.resolver());
    print_commands("decoders", codec.decoders(), registry.resolver());
    return 0;
}

int match_paths(const CodecRegistry& registry, const std::vector<std::filesystem::path>& paths) {
    int rc = 0;
    for (const auto& path : paths) {
        if (const auto codec = registry.match_extension(path)) {
            std::cout << path.string() << ": " << codec->name() << "\n";
        } else {
            std::cout << path.string() << ": no matching codec\n";
            rc = 1;
        }
    }
    return rc;
}

int transcode(const CodecRegistry& registry, const Settings& settings) {
    LineSink out_sink;
    LineSink err_sink;
    if (settings.verbose) {
        out_sink = [](const std::string_view line) { std::cout << line << "\n"; };
        err_sink = [](const std::string_view line) { std::cerr << line << "\n"; };
    }
    const Transcoder transcoder(registry);
    const int rc = transcoder.transcode(settings.input, settings.output, out_sink, err_sink);
    if (rc != 0) {
        std::cerr << "Transcoding failed with exit code " << rc << ": " << settings.input.string() << std::endl;
    }
    return rc;
}

int dispatch(CodecRegistry& registry, const Settings& settings) {
    switch (settings.command) {
        case Command::List:
            return list_codecs(registry);
        case Command::Show:
            return show_codec(registry, settings.codec);
        case Command::Match:
            return match_paths(registry, settings.paths);
        case Command::Register:
            registry.register_codec(settings.codec, settings.description);
            return 0;
        case Command::Unregister:
            if (!registry.has_codec(settings.codec)) {
                throw CodecNotFound(settings.codec);
            }
            registry.unregister_codec(settings.codec);
            return 0;
        case Command::AddExtension:
            registry.get_codec(settings.codec).register_extension(settings.extension);
            return 0;
        case Command::AddEncoder:
            registry.get_codec(settings.codec).register_encoder(settings.pattern, settings.priority);
            return 0;
        case Command::AddDecoder:
            registry.get_codec(settings.codec).register_decoder(settings.pattern, settings.priority);
            return 0;
        case Command::Transcode:
            return transcode(registry, settings);
        case Command::None:
            break;
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"sonora: audio codec registry and transcoding command runner."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    setup_logging(settings);

    const auto db_path = settings.db_path.empty() ? default_database_path() : settings.db_path;

    try {
        const PathResolver resolver;
        CodecRegistry registry(db_path, resolver);
        return dispatch(registry, settings);
    } catch (const CodecError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::system_error& e) {
        // includes std::filesystem::filesystem_error
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
