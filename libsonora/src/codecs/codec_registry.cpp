#include "../../include/codec_registry.hpp"
#include "../../include/codec_error.hpp"
#include "../../include/database.hpp"
#include "../../include/default_codecs.hpp"
#include "../../include/logger.hpp"
#include "../../include/path_resolver.hpp"
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace sonora {

namespace {

constexpr std::string_view kSchema = R"sql(
CREATE TABLE IF NOT EXISTS codec (
    id          INTEGER PRIMARY KEY,
    name        TEXT UNIQUE,
    description TEXT
);
CREATE TABLE IF NOT EXISTS extensions (
    id          INTEGER PRIMARY KEY,
    codec       INTEGER,
    extension   TEXT UNIQUE,
    FOREIGN KEY(codec) REFERENCES codec(id) ON DELETE CASCADE
);
CREATE TABLE IF NOT EXISTS decoder (
    id          INTEGER PRIMARY KEY,
    priority    INTEGER,
    codec       INTEGER,
    command     TEXT,
    FOREIGN KEY(codec) REFERENCES codec(id) ON DELETE CASCADE
);
CREATE TABLE IF NOT EXISTS encoder (
    id          INTEGER PRIMARY KEY,
    priority    INTEGER,
    codec       INTEGER,
    command     TEXT,
    FOREIGN KEY(codec) REFERENCES codec(id) ON DELETE CASCADE
);
)sql";

} // namespace

std::filesystem::path default_database_path() {
    if (const char* env = std::getenv("SONORA_CODEC_DB"); env && *env) {
        return env;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".sonora" / "codecs.sqlite";
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "sonora" / "codecs.sqlite";
}

CodecRegistry::CodecRegistry(const std::filesystem::path& location, const PathResolver& resolver)
    : db_(std::make_unique<Database>(location)), resolver_(&resolver) {
    create_schema();
    seed_defaults();
    Logger::log(LogLevel::Debug, "Codec registry opened: " + location.string(), "codec_registry");
}

CodecRegistry::~CodecRegistry() = default;
CodecRegistry::CodecRegistry(CodecRegistry&&) noexcept = default;
CodecRegistry& CodecRegistry::operator=(CodecRegistry&&) noexcept = default;

const std::filesystem::path& CodecRegistry::location() const noexcept {
    return db_->location();
}

void CodecRegistry::create_schema() {
    try {
        db_->exec(kSchema);
    } catch (const StorageError& e) {
        throw StorageError("Error initializing database " + location().string() + ": " + e.what());
    }
}

void CodecRegistry::seed_defaults() {
    for (const auto& def : default_codecs()) {
        const std::string name(def.name);
        if (has_codec(name)) {
            continue;
        }

        Transaction tx(*db_);
        auto codec = register_codec(name, std::string(def.description));
        for (const auto ext : def.extensions) {
            codec.register_extension(ext);
        }

        // first listed command gets the highest priority
        int priority = static_cast<int>(def.encoders.size());
        for (const auto pattern : def.encoders) {
            codec.register_encoder(pattern, --priority);
        }
        priority = static_cast<int>(def.decoders.size());
        for (const auto pattern : def.decoders) {
            codec.register_decoder(pattern, --priority);
        }
        tx.commit();

        Logger::log(LogLevel::Info, "Registered default codec " + name, "codec_registry");
    }
}

Codec CodecRegistry::get_codec(const std::string& name) const {
    auto stmt = db_->prepare("SELECT description FROM codec WHERE name = ?");
    stmt.bind(1, name);
    if (!stmt.step()) {
        throw CodecNotFound(name);
    }
    return Codec(*db_, *resolver_, name, stmt.column_text(0));
}

bool CodecRegistry::has_codec(const std::string& name) const {
    auto stmt = db_->prepare("SELECT 1 FROM codec WHERE name = ?");
    stmt.bind(1, name);
    return stmt.step();
}

Codec CodecRegistry::register_codec(const std::string& name, const std::string& description) {
    if (name.empty()) {
        throw std::invalid_argument("Codec name must not be empty");
    }

    try {
        auto stmt = db_->prepare("INSERT INTO codec (name, description) VALUES (?, ?)");
        stmt.bind(1, name).bind(2, description);
        stmt.run();
        Logger::log(LogLevel::Debug, "Registered codec " + name, "codec_registry");
    } catch (const ConstraintViolation&) {
        Logger::log(LogLevel::Debug, "Codec already registered: " + name, "codec_registry");
    }
    return get_codec(name);
}

void CodecRegistry::unregister_codec(const std::string& name) {
    auto stmt = db_->prepare("DELETE FROM codec WHERE name = ?");
    stmt.bind(1, name);
    stmt.run();
    Logger::log(LogLevel::Debug, "Unregistered codec " + name, "codec_registry");
}

std::vector<Codec> CodecRegistry::list_codecs() const {
    auto stmt = db_->prepare("SELECT name, description FROM codec");
    std::vector<Codec> result;
    while (stmt.step()) {
        result.emplace_back(*db_, *resolver_, stmt.column_text(0), stmt.column_text(1));
    }
    return result;
}

std::optional<Codec> CodecRegistry::match_extension(const std::filesystem::path& path) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        Logger::log(LogLevel::Warning, "Attempt to match codec extension to directory: " + path.string(),
                    "codec_registry");
        return std::nullopt;
    }

    const auto ext = normalize_extension(path.extension().string());
    if (ext.empty()) {
        return std::nullopt;
    }

    auto stmt = db_->prepare(
        "SELECT codec.name, codec.description FROM codec "
        "JOIN extensions ON extensions.codec = codec.id "
        "WHERE extensions.extension = ?");
    stmt.bind(1, ext);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return Codec(*db_, *resolver_, stmt.column_text(0), stmt.column_text(1));
}

} // namespace sonora
