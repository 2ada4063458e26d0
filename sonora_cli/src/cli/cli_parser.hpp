#ifndef SONORA_CLI_PARSER_HPP
#define SONORA_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    List,
    Show,
    Match,
    Register,
    Unregister,
    AddExtension,
    AddEncoder,
    AddDecoder,
    Transcode
};

struct Settings {
    Command command = Command::None;

    bool quiet = false;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path db_path;

    // subcommand arguments
    std::string codec;
    std::string description;
    std::string extension;
    std::string pattern;
    int priority = 0;
    bool verbose = false;
    std::vector<std::filesystem::path> paths;
    std::filesystem::path input;
    std::filesystem::path output;
};

/**
 * @brief Configures the CLI11 parser with all subcommands, options and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // SONORA_CLI_PARSER_HPP
