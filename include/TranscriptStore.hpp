#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ChatTypes.hpp"
#include "db/SQLiteBackend.hpp"

namespace SQLChat {

struct SessionRecord {
    int64_t id = 0;
    std::string sessionId;
    Transcript transcript;
    std::string startedAt;
    std::string updatedAt; // empty until the first update
};

// Session log kept in a SQLite file: one row per session, transcript stored as JSON text.
// Every call reports failure through its return value and never throws.
class TranscriptStore {
public:
    explicit TranscriptStore(const std::string& dbPath);

    bool isOpen() const { return db.isOpen(); }
    const std::string& path() const { return path_; }

    // Safe to call on every start; also upgrades logs that predate the updated_at column
    bool ensureSchema(std::string* outError = nullptr);
    bool createSession(const std::string& sessionId, std::string* outError = nullptr);
    // Replaces the stored transcript and refreshes updated_at
    bool updateSession(const std::string& sessionId, const std::string& transcriptJson, std::string* outError = nullptr);
    bool updateSession(const std::string& sessionId, const Transcript& transcript, std::string* outError = nullptr);

    std::optional<SessionRecord> loadSession(const std::string& sessionId, std::string* outError = nullptr);
    // Newest first
    std::vector<SessionRecord> listSessions(std::string* outError = nullptr);

    static std::string serialize(const Transcript& transcript);

private:
    std::string path_;
    SQLiteBackend db;
};

} // namespace SQLChat
