#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <tuple>

namespace {

CLI::App* add_command(CLI::App& app, Settings& settings, const std::string& name,
                      const std::string& help, const Command command) {
    auto* sub = app.add_subcommand(name, help);
    sub->callback([&settings, command]() { settings.command = command; });
    return sub;
}

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- Global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress log output on the console.");

    app.add_option("--db", settings.db_path,
                   "Codec database file (default: $SONORA_CODEC_DB or ~/.sonora/codecs.sqlite).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Queries ---
    add_command(app, settings, "list", "List registered codecs.", Command::List);

    auto* show = add_command(app, settings, "show", "Show extensions and commands of a codec.", Command::Show);
    show->add_option("codec", settings.codec, "Codec name.")->required();

    auto* match = add_command(app, settings, "match", "Print the codec matching each file.", Command::Match);
    match->add_option("paths", settings.paths, "Files to match.")->required();

    // --- Registration ---
    auto* reg = add_command(app, settings, "register", "Register a new codec.", Command::Register);
    reg->add_option("codec", settings.codec, "Codec name.")
        ->required()
        ->check([](const std::string& str) {
            return str.empty() ? std::string("Codec name must not be empty.") : std::string();
        });
    reg->add_option("-d,--description", settings.description, "Codec description.");

    auto* unreg = add_command(app, settings, "unregister",
                              "Remove a codec with its extensions and commands.", Command::Unregister);
    unreg->add_option("codec", settings.codec, "Codec name.")->required();

    auto* ext = add_command(app, settings, "add-extension", "Attach a file extension to a codec.",
                            Command::AddExtension);
    ext->add_option("codec", settings.codec, "Codec name.")->required();
    ext->add_option("extension", settings.extension, "Extension, with or without leading dot.")->required();

    for (const auto& [name, help, command] : {
             std::tuple{"add-encoder", "Register an encoder command for a codec.", Command::AddEncoder},
             std::tuple{"add-decoder", "Register a decoder command for a codec.", Command::AddDecoder}}) {
        auto* sub = add_command(app, settings, name, help, command);
        sub->add_option("codec", settings.codec, "Codec name.")->required();
        sub->add_option("pattern", settings.pattern,
                        "Command line containing exactly one FILE and one OUTFILE token (quote it).")
            ->required();
        sub->add_option("-p,--priority", settings.priority,
                        "Higher priority commands are preferred.")
            ->default_val(0);
    }

    // --- Execution ---
    auto* transcode = add_command(app, settings, "transcode",
                                  "Convert a file to the format of the output file's extension.",
                                  Command::Transcode);
    transcode->add_option("input", settings.input, "Input file.")
        ->required()
        ->check(CLI::ExistingFile);
    transcode->add_option("output", settings.output, "Output file.")->required();
    transcode->add_flag("-v,--verbose", settings.verbose, "Show the output of the external commands.");
}
