#include "TranscriptStore.hpp"
#include "db/SQLiteBackend.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace SQLChat;
using sqlchat_test::TempDir;

namespace {

Transcript sampleTranscript()
{
    return {
        {Role::System, "schema: CREATE TABLE users (id INTEGER)"},
        {Role::User, "How many users are there?"},
        {Role::Assistant, "{\"SQL\": \"SELECT COUNT(*) FROM users;\"}"},
        {Role::User, "SQL Query:\nSELECT COUNT(*) FROM users;\n\nOutput:\n(5,)"},
        {Role::Assistant, "{\"Answer\": \"There are 5 users.\"}"},
    };
}

} // namespace

TEST_CASE("ensureSchema is idempotent", "[store]")
{
    TempDir dir;
    TranscriptStore store(dir.file("logs.db"));
    REQUIRE(store.isOpen());
    std::string error;
    REQUIRE(store.ensureSchema(&error));
    REQUIRE(store.ensureSchema(&error));
    REQUIRE(store.createSession("session_a", &error));
    REQUIRE(store.ensureSchema(&error));
    CHECK(store.listSessions().size() == 1U);
}

TEST_CASE("ensureSchema upgrades logs without updated_at", "[store]")
{
    TempDir dir;
    const std::string path = dir.file("old.db");
    {
        SQLiteBackend db;
        REQUIRE(db.open(DBConnectionInfo::fromPath(path, true)));
        REQUIRE(db.execute("CREATE TABLE sessions (ID INTEGER PRIMARY KEY AUTOINCREMENT, session_id TEXT UNIQUE NOT NULL, "
                           "message_log TEXT, started_at DATETIME DEFAULT CURRENT_TIMESTAMP);"
                           "INSERT INTO sessions (session_id, message_log) VALUES ('session_old', '[]');"));
    }

    TranscriptStore store(path);
    REQUIRE(store.ensureSchema());
    REQUIRE(store.updateSession("session_old", sampleTranscript()));
    const auto record = store.loadSession("session_old");
    REQUIRE(record.has_value());
    CHECK_FALSE(record->updatedAt.empty());
}

TEST_CASE("stored transcripts round-trip in order", "[store]")
{
    TempDir dir;
    TranscriptStore store(dir.file("logs.db"));
    REQUIRE(store.ensureSchema());
    REQUIRE(store.createSession("session_rt"));

    auto fresh = store.loadSession("session_rt");
    REQUIRE(fresh.has_value());
    CHECK(fresh->transcript.empty());
    CHECK(fresh->updatedAt.empty());
    CHECK_FALSE(fresh->startedAt.empty());

    const Transcript transcript = sampleTranscript();
    REQUIRE(store.updateSession("session_rt", transcript));
    const auto record = store.loadSession("session_rt");
    REQUIRE(record.has_value());
    CHECK(record->sessionId == "session_rt");
    CHECK(record->transcript == transcript);
    CHECK_FALSE(record->updatedAt.empty());
    CHECK(record->startedAt == fresh->startedAt);
}

TEST_CASE("transcripts are stored as indented JSON", "[store]")
{
    const std::string text = TranscriptStore::serialize({{Role::User, "hi"}});
    CHECK(text == "[\n    {\n        \"content\": \"hi\",\n        \"role\": \"user\"\n    }\n]");
}

TEST_CASE("text that is not UTF-8 is stored with replacement characters", "[store]")
{
    const Transcript transcript{{Role::User, "caf\xe9 sales?"}, {Role::Assistant, "('caf\xe9',)"}};
    std::string text;
    REQUIRE_NOTHROW(text = TranscriptStore::serialize(transcript));
    CHECK(text.find("caf\xef\xbf\xbd sales?") != std::string::npos);

    TempDir dir;
    TranscriptStore store(dir.file("logs.db"));
    REQUIRE(store.ensureSchema());
    REQUIRE(store.createSession("session_latin1"));
    std::string error;
    CHECK(store.updateSession("session_latin1", transcript, &error));
    const auto record = store.loadSession("session_latin1");
    REQUIRE(record.has_value());
    REQUIRE(record->transcript.size() == 2U);
    CHECK(record->transcript[0].content == "caf\xef\xbf\xbd sales?");
}

TEST_CASE("session ids are unique and unknown ids are reported", "[store]")
{
    TempDir dir;
    TranscriptStore store(dir.file("logs.db"));
    REQUIRE(store.ensureSchema());
    REQUIRE(store.createSession("session_x"));

    std::string error;
    CHECK_FALSE(store.createSession("session_x", &error));
    CHECK_FALSE(error.empty());

    error.clear();
    CHECK_FALSE(store.updateSession("session_missing", sampleTranscript(), &error));
    CHECK(error.find("unknown session") != std::string::npos);
    CHECK_FALSE(store.loadSession("session_missing").has_value());
}

TEST_CASE("listSessions returns newest first", "[store]")
{
    TempDir dir;
    TranscriptStore store(dir.file("logs.db"));
    REQUIRE(store.ensureSchema());
    REQUIRE(store.createSession("session_1"));
    REQUIRE(store.createSession("session_2"));
    REQUIRE(store.createSession("session_3"));

    const auto sessions = store.listSessions();
    REQUIRE(sessions.size() == 3U);
    CHECK(sessions[0].sessionId == "session_3");
    CHECK(sessions[2].sessionId == "session_1");
    CHECK(sessions[0].id > sessions[2].id);
}

TEST_CASE("an unusable log location fails without throwing", "[store]")
{
    TempDir dir;
    TranscriptStore store((dir.path() / "no" / "such" / "dir" / "logs.db").string());
    CHECK_FALSE(store.isOpen());
    std::string error;
    CHECK_FALSE(store.ensureSchema(&error));
    CHECK_FALSE(store.createSession("session_a", &error));
    CHECK_FALSE(store.updateSession("session_a", sampleTranscript(), &error));
    CHECK(store.listSessions(&error).empty());
}
