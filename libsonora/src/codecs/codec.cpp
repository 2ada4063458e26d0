#include "../../include/codec.hpp"
#include "../../include/codec_error.hpp"
#include "../../include/database.hpp"
#include "../../include/logger.hpp"
#include "../../include/path_resolver.hpp"
#include <algorithm>
#include <cctype>

namespace sonora {

namespace {

// encoder and decoder rows live in tables named after their kind
std::string select_commands_sql(const CommandKind kind) {
    return std::string("SELECT command, priority FROM ") + command_kind_to_string(kind) +
           " WHERE codec = ? ORDER BY priority DESC, id ASC";
}

std::string insert_command_sql(const CommandKind kind) {
    return std::string("INSERT INTO ") + command_kind_to_string(kind) +
           " (codec, command, priority) VALUES (?, ?, ?)";
}

} // namespace

std::string normalize_extension(const std::string_view extension) {
    const auto first = extension.find_first_not_of('.');
    if (first == std::string_view::npos) {
        return {};
    }
    std::string ext(extension.substr(first));
    std::ranges::transform(ext, ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Codec::Codec(Database& db, const PathResolver& resolver, std::string name, std::string description)
    : db_(&db), resolver_(&resolver), name_(std::move(name)), description_(std::move(description)) {}

std::int64_t Codec::id() const {
    auto stmt = db_->prepare("SELECT id FROM codec WHERE name = ?");
    stmt.bind(1, name_);
    if (!stmt.step()) {
        throw CodecNotFound(name_);
    }
    return stmt.column_int(0);
}

std::set<std::string> Codec::extensions() const {
    auto stmt = db_->prepare("SELECT extension FROM extensions WHERE codec = ?");
    stmt.bind(1, id());
    std::set<std::string> result;
    while (stmt.step()) {
        result.insert(stmt.column_text(0));
    }
    return result;
}

std::vector<CommandTemplate> Codec::commands(const CommandKind kind) const {
    auto stmt = db_->prepare(select_commands_sql(kind));
    stmt.bind(1, id());
    std::vector<CommandTemplate> result;
    while (stmt.step()) {
        result.emplace_back(stmt.column_text(0), kind, static_cast<int>(stmt.column_int(1)));
    }
    return result;
}

std::vector<CommandTemplate> Codec::encoders() const {
    return commands(CommandKind::Encoder);
}

std::vector<CommandTemplate> Codec::decoders() const {
    return commands(CommandKind::Decoder);
}

std::vector<CommandTemplate> Codec::available(const CommandKind kind) const {
    std::vector<CommandTemplate> result;
    for (auto& cmd : commands(kind)) {
        if (cmd.resolve(*resolver_)) {
            result.push_back(std::move(cmd));
        }
    }
    return result;
}

std::vector<CommandTemplate> Codec::available_encoders() const {
    return available(CommandKind::Encoder);
}

std::vector<CommandTemplate> Codec::available_decoders() const {
    return available(CommandKind::Decoder);
}

CommandTemplate Codec::best_encoder() const {
    for (auto& cmd : encoders()) {
        if (cmd.resolve(*resolver_)) {
            return cmd;
        }
    }
    throw NoCommandAvailable(name_, "encoder");
}

CommandTemplate Codec::best_decoder() const {
    for (auto& cmd : decoders()) {
        if (cmd.resolve(*resolver_)) {
            return cmd;
        }
    }
    throw NoCommandAvailable(name_, "decoder");
}

void Codec::register_extension(const std::string_view extension) {
    const auto ext = normalize_extension(extension);
    if (ext.empty()) {
        Logger::log(LogLevel::Warning, "Ignoring empty extension for codec " + name_, "codec");
        return;
    }

    try {
        auto stmt = db_->prepare("INSERT INTO extensions (codec, extension) VALUES (?, ?)");
        stmt.bind(1, id()).bind(2, ext);
        stmt.run();
        Logger::log(LogLevel::Debug, "Registered extension " + ext + " for codec " + name_, "codec");
    } catch (const ConstraintViolation& e) {
        Logger::log(LogLevel::Debug, "Error adding extension " + ext + ": " + e.what(), "codec");
    }
}

void Codec::unregister_extension(const std::string_view extension) {
    auto stmt = db_->prepare("DELETE FROM extensions WHERE codec = ? AND extension = ?");
    stmt.bind(1, id()).bind(2, normalize_extension(extension));
    stmt.run();
}

void Codec::register_command(const CommandKind kind, const std::string_view pattern, const int priority) {
    const CommandTemplate cmd(pattern, kind, priority);
    try {
        cmd.validate();
    } catch (const InvalidTemplate& e) {
        Logger::log(LogLevel::Error,
                    std::string("Error registering ") + command_kind_to_string(kind) + ": " + e.what(),
                    "codec");
        throw;
    }

    auto stmt = db_->prepare(insert_command_sql(kind));
    stmt.bind(1, id()).bind(2, cmd.to_string()).bind(3, priority);
    stmt.run();
    Logger::log(LogLevel::Debug,
                std::string("Registered ") + command_kind_to_string(kind) + " for codec " + name_ + ": " +
                cmd.to_string(),
                "codec");
}

void Codec::register_encoder(const std::string_view pattern, const int priority) {
    register_command(CommandKind::Encoder, pattern, priority);
}

void Codec::register_decoder(const std::string_view pattern, const int priority) {
    register_command(CommandKind::Decoder, pattern, priority);
}

} // namespace sonora
