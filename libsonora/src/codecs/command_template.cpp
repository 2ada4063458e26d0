#include "../../include/command_template.hpp"
#include "../../include/codec_error.hpp"
#include "../../include/logger.hpp"
#include "../../include/path_resolver.hpp"
#include <algorithm>
#include <sstream>

namespace sonora {

namespace {

constexpr std::string_view kInputPlaceholder = "FILE";
constexpr std::string_view kOutputPlaceholder = "OUTFILE";

CommandToken parse_token(std::string text) {
    CommandToken token;
    if (text == kInputPlaceholder) {
        token.kind = CommandToken::Kind::InputFile;
    } else if (text == kOutputPlaceholder) {
        token.kind = CommandToken::Kind::OutputFile;
    }
    token.text = std::move(text);
    return token;
}

} // namespace

const char* command_kind_to_string(const CommandKind kind) {
    switch (kind) {
        case CommandKind::Encoder: return "encoder";
        case CommandKind::Decoder: return "decoder";
    }
    return "";
}

CommandTemplate::CommandTemplate(const std::string_view pattern, const CommandKind kind, const int priority)
    : kind_(kind), priority_(priority) {
    std::istringstream in{std::string(pattern)};
    std::string word;
    while (in >> word) {
        tokens_.push_back(parse_token(std::move(word)));
    }
}

void CommandTemplate::validate() const {
    const auto count = [this](const CommandToken::Kind kind) {
        return std::count_if(tokens_.begin(), tokens_.end(),
                             [kind](const CommandToken& t) { return t.kind == kind; });
    };
    if (count(CommandToken::Kind::InputFile) != 1) {
        throw InvalidTemplate(to_string(), "command requires exactly one FILE");
    }
    if (count(CommandToken::Kind::OutputFile) != 1) {
        throw InvalidTemplate(to_string(), "command requires exactly one OUTFILE");
    }
}

bool CommandTemplate::is_available(const PathResolver& resolver) const {
    if (tokens_.empty()) {
        return false;
    }
    return resolver.resolve(tokens_.front().text).has_value();
}

bool CommandTemplate::resolve(const PathResolver& resolver) {
    resolved_.reset();
    if (tokens_.empty()) {
        return false;
    }
    resolved_ = resolver.resolve(tokens_.front().text);
    return resolved_.has_value();
}

std::vector<std::string> CommandTemplate::instantiate(const std::filesystem::path& input,
                                                      const std::filesystem::path& output) const {
    validate();

    std::vector<std::string> args;
    args.reserve(tokens_.size());
    for (const auto& token : tokens_) {
        switch (token.kind) {
            case CommandToken::Kind::Literal:    args.push_back(token.text); break;
            case CommandToken::Kind::InputFile:  args.push_back(input.string()); break;
            case CommandToken::Kind::OutputFile: args.push_back(output.string()); break;
        }
    }
    return args;
}

int CommandTemplate::run(const std::filesystem::path& input,
                         const std::filesystem::path& output,
                         const LineSink& stdout_sink,
                         const LineSink& stderr_sink) const {
    auto args = instantiate(input, output);
    if (resolved_) {
        args.front() = resolved_->string();
    }
    Logger::log(LogLevel::Info,
                std::string("Running ") + command_kind_to_string(kind_) + " " + args.front() +
                ": " + input.string() + " -> " + output.string(),
                "command_template");
    return run_process(args, stdout_sink, stderr_sink);
}

std::string CommandTemplate::executable() const {
    return tokens_.empty() ? std::string() : tokens_.front().text;
}

std::string CommandTemplate::to_string() const {
    std::string out;
    for (const auto& token : tokens_) {
        if (!out.empty()) out += ' ';
        out += token.text;
    }
    return out;
}

} // namespace sonora
