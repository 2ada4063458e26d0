#include "codec_error.hpp"
#include "codec_registry.hpp"
#include "database.hpp"
#include "default_codecs.hpp"
#include "path_resolver.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace sonora;
using namespace sonora::test;

namespace {

std::int64_t count_rows(const std::filesystem::path& db_path, const std::string& sql) {
    Database db(db_path);
    auto stmt = db.prepare(sql);
    return stmt.step() ? stmt.column_int(0) : 0;
}

} // namespace

class CodecRegistryTest : public ::testing::Test {
protected:
    CodecRegistryTest() : resolver_(bin_.path().string()) {}

    [[nodiscard]] std::filesystem::path db_path() const { return data_ / "codecs.sqlite"; }

    TempDir bin_;
    TempDir data_;
    PathResolver resolver_;
};

TEST_F(CodecRegistryTest, SeedsDefaultCodecsOnFirstOpen) {
    const CodecRegistry registry(db_path(), resolver_);

    const auto codecs = registry.list_codecs();
    EXPECT_EQ(codecs.size(), default_codecs().size());
    for (const auto& def : default_codecs()) {
        EXPECT_TRUE(registry.has_codec(std::string(def.name))) << def.name;
    }

    const auto aac = registry.get_codec("aac");
    EXPECT_EQ(aac.description(), "Advanced Audio Coding");
    EXPECT_EQ(aac.extensions(), (std::set<std::string>{"aac", "m4a", "mp4"}));

    const auto encoders = aac.encoders();
    ASSERT_EQ(encoders.size(), 2u);
    EXPECT_EQ(encoders[0].executable(), "neroAacEnc");
    EXPECT_EQ(encoders[1].executable(), "afconvert");
    EXPECT_GT(encoders[0].priority(), encoders[1].priority());

    const auto wav = registry.get_codec("wav");
    EXPECT_TRUE(wav.encoders().empty());
    EXPECT_TRUE(wav.decoders().empty());
}

TEST_F(CodecRegistryTest, CreatesParentDirectoryOfLocation) {
    const auto nested = data_ / "a" / "b" / "codecs.sqlite";
    const CodecRegistry registry(nested, resolver_);
    EXPECT_TRUE(std::filesystem::exists(nested));
    EXPECT_EQ(registry.location(), nested);
}

TEST_F(CodecRegistryTest, UnopenableLocationThrowsStorageError) {
    write_file(data_ / "not_a_dir", "file");
    EXPECT_THROW(CodecRegistry(data_ / "not_a_dir" / "codecs.sqlite", resolver_), StorageError);
}

TEST_F(CodecRegistryTest, SeedingDoesNotTouchExistingCodecs) {
    {
        CodecRegistry registry(db_path(), resolver_);
        auto vorbis = registry.get_codec("vorbis");
        vorbis.unregister_extension("ogg");
        vorbis.register_encoder("custom_oggenc FILE OUTFILE", 50);
        registry.unregister_codec("mp3");
    }

    const CodecRegistry reopened(db_path(), resolver_);

    const auto vorbis = reopened.get_codec("vorbis");
    EXPECT_EQ(vorbis.extensions(), (std::set<std::string>{"vorbis"}));
    ASSERT_EQ(vorbis.encoders().size(), 2u);
    EXPECT_EQ(vorbis.encoders().front().executable(), "custom_oggenc");

    // a missing default codec is seeded again
    const auto mp3 = reopened.get_codec("mp3");
    EXPECT_EQ(mp3.extensions(), (std::set<std::string>{"mp3"}));
    EXPECT_EQ(mp3.encoders().size(), 1u);
}

TEST_F(CodecRegistryTest, GetUnknownCodecThrows) {
    const CodecRegistry registry(":memory:", resolver_);
    try {
        (void)registry.get_codec("nosuchcodec");
        FAIL() << "expected CodecNotFound";
    } catch (const CodecNotFound& e) {
        EXPECT_EQ(e.name(), "nosuchcodec");
    }
}

TEST_F(CodecRegistryTest, RegisterCodecIsIdempotent) {
    const ScopedLogCapture capture;
    CodecRegistry registry(":memory:", resolver_);

    const auto first = registry.register_codec("opus", "Opus Interactive Audio Codec");
    const auto second = registry.register_codec("opus", "another description");

    EXPECT_EQ(first.name(), "opus");
    EXPECT_EQ(second.name(), "opus");
    EXPECT_EQ(second.description(), "Opus Interactive Audio Codec");
    EXPECT_EQ(first.id(), second.id());
    EXPECT_TRUE(capture.contains(LogLevel::Debug, "already registered"));

    const auto codecs = registry.list_codecs();
    EXPECT_EQ(std::ranges::count(codecs, std::string("opus"), &Codec::name), 1);
}

TEST_F(CodecRegistryTest, RegisterCodecRejectsEmptyName) {
    CodecRegistry registry(":memory:", resolver_);
    EXPECT_THROW(registry.register_codec(""), std::invalid_argument);
}

TEST_F(CodecRegistryTest, UnregisterCascadesToExtensionsAndCommands) {
    {
        CodecRegistry registry(db_path(), resolver_);
        registry.get_codec("flac").register_decoder("other_flac_dec FILE OUTFILE", 9);
        registry.unregister_codec("flac");

        EXPECT_THROW((void)registry.get_codec("flac"), CodecNotFound);
        EXPECT_FALSE(registry.match_extension("/music/x.flac").has_value());
    }

    const std::string orphans = " WHERE codec NOT IN (SELECT id FROM codec)";
    EXPECT_EQ(count_rows(db_path(), "SELECT COUNT(*) FROM extensions" + orphans), 0);
    EXPECT_EQ(count_rows(db_path(), "SELECT COUNT(*) FROM encoder" + orphans), 0);
    EXPECT_EQ(count_rows(db_path(), "SELECT COUNT(*) FROM decoder" + orphans), 0);
    EXPECT_EQ(count_rows(db_path(), "SELECT COUNT(*) FROM extensions WHERE extension = 'flac'"), 0);
}

TEST_F(CodecRegistryTest, ReregisteredCodecStartsEmpty) {
    CodecRegistry registry(":memory:", resolver_);
    registry.unregister_codec("mp3");

    const auto mp3 = registry.register_codec("mp3", "again");
    EXPECT_TRUE(mp3.extensions().empty());
    EXPECT_TRUE(mp3.encoders().empty());
    EXPECT_TRUE(mp3.decoders().empty());
}

TEST_F(CodecRegistryTest, UnregisterUnknownCodecIsNoOp) {
    CodecRegistry registry(":memory:", resolver_);
    const auto before = registry.list_codecs().size();
    EXPECT_NO_THROW(registry.unregister_codec("nosuchcodec"));
    EXPECT_EQ(registry.list_codecs().size(), before);
}

TEST_F(CodecRegistryTest, MatchExtensionIsCaseInsensitive) {
    CodecRegistry registry(":memory:", resolver_);
    auto flac = registry.register_codec("flac", "Free Lossless Audio Codec");
    flac.register_extension("flac");

    const auto match = registry.match_extension("/music/x.FLAC");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->name(), "flac");

    const auto aac = registry.match_extension("/music/Album/01 Track.M4a");
    ASSERT_TRUE(aac.has_value());
    EXPECT_EQ(aac->name(), "aac");
}

TEST_F(CodecRegistryTest, MatchExtensionWithoutOrUnknownExtension) {
    const CodecRegistry registry(":memory:", resolver_);
    EXPECT_FALSE(registry.match_extension("/music/README").has_value());
    EXPECT_FALSE(registry.match_extension("/music/.flac").has_value());
    EXPECT_FALSE(registry.match_extension("/music/notes.txt").has_value());
}

TEST_F(CodecRegistryTest, MatchExtensionNeverMatchesDirectories) {
    const ScopedLogCapture capture;
    const CodecRegistry registry(":memory:", resolver_);
    std::filesystem::create_directory(data_ / "album.flac");
    std::filesystem::create_directory(data_ / "plain");

    EXPECT_FALSE(registry.match_extension(data_ / "album.flac").has_value());
    EXPECT_FALSE(registry.match_extension(data_ / "plain").has_value());
    EXPECT_TRUE(capture.contains(LogLevel::Warning, "directory"));
}

TEST_F(CodecRegistryTest, InMemoryRegistriesAreIndependent) {
    CodecRegistry a(":memory:", resolver_);
    const CodecRegistry b(":memory:", resolver_);

    a.register_codec("opus");
    EXPECT_TRUE(a.has_codec("opus"));
    EXPECT_FALSE(b.has_codec("opus"));
}

TEST_F(CodecRegistryTest, RegistryCanBeMoved) {
    CodecRegistry original(":memory:", resolver_);
    original.register_codec("opus").register_extension("opus");

    const CodecRegistry moved(std::move(original));

    const auto match = moved.match_extension("song.opus");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->name(), "opus");
}

TEST(DefaultDatabasePathTest, EnvironmentOverridesHome) {
    const char* saved = std::getenv("SONORA_CODEC_DB");
    const std::string saved_value = saved ? saved : "";

    ::setenv("SONORA_CODEC_DB", "/srv/sonora/test.sqlite", 1);
    EXPECT_EQ(default_database_path(), std::filesystem::path("/srv/sonora/test.sqlite"));

    ::unsetenv("SONORA_CODEC_DB");
    if (const char* home = std::getenv("HOME"); home && *home) {
        EXPECT_EQ(default_database_path(), std::filesystem::path(home) / ".sonora" / "codecs.sqlite");
    }

    if (saved) {
        ::setenv("SONORA_CODEC_DB", saved_value.c_str(), 1);
    }
}
