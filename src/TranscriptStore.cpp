#include "TranscriptStore.hpp"
#include <plog/Log.h>
#include <nlohmann/json.hpp>

namespace SQLChat {

TranscriptStore::TranscriptStore(const std::string& dbPath) : path_(dbPath) {
    std::string err;
    if(!db.open(DBConnectionInfo::fromPath(dbPath, true), &err)){
        PLOGW << "TranscriptStore: cannot open " << dbPath << ": " << err;
    }
}

std::string TranscriptStore::serialize(const Transcript& transcript){
    // invalid UTF-8 (e.g. Latin-1 input or database text) is stored as U+FFFD
    return transcriptToJSON(transcript).dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool TranscriptStore::ensureSchema(std::string* outError){
    if(!db.isOpen()){ if(outError) *outError = "DB not open"; return false; }

    const char* createSessions = R"SQL(CREATE TABLE IF NOT EXISTS sessions (
        ID INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id TEXT UNIQUE NOT NULL,
        message_log TEXT,
        started_at DATETIME DEFAULT CURRENT_TIMESTAMP,
        updated_at DATETIME
    );)SQL";
    if(!db.execute(createSessions, outError)) return false;

    // logs written before the column existed only carry started_at
    if(!db.hasColumn("sessions", "updated_at")){
        if(!db.execute("ALTER TABLE sessions ADD COLUMN updated_at DATETIME;", outError)) return false;
        PLOGI << "TranscriptStore: added updated_at column to " << path_;
    }
    return true;
}

bool TranscriptStore::createSession(const std::string& sessionId, std::string* outError){
    if(!db.isOpen()){ if(outError) *outError = "DB not open"; return false; }
    auto stmt = db.prepare("INSERT INTO sessions (session_id) VALUES (?);", outError);
    if(!stmt) return false;
    stmt->bindString(1, sessionId);
    return stmt->execute(outError);
}

bool TranscriptStore::updateSession(const std::string& sessionId, const std::string& transcriptJson, std::string* outError){
    if(!db.isOpen()){ if(outError) *outError = "DB not open"; return false; }
    auto stmt = db.prepare("UPDATE sessions SET message_log = ?, updated_at = CURRENT_TIMESTAMP WHERE session_id = ?;", outError);
    if(!stmt) return false;
    stmt->bindString(1, transcriptJson);
    stmt->bindString(2, sessionId);
    if(!stmt->execute(outError)) return false;
    if(db.changes() == 0){
        if(outError) *outError = "unknown session: " + sessionId;
        return false;
    }
    return true;
}

bool TranscriptStore::updateSession(const std::string& sessionId, const Transcript& transcript, std::string* outError){
    return updateSession(sessionId, serialize(transcript), outError);
}

static bool readRecord(IResultSet& rs, SessionRecord& rec, std::string* outError){
    rec.id = rs.getInt64(0);
    rec.sessionId = rs.getString(1);
    rec.startedAt = rs.isNull(3) ? std::string() : rs.getString(3);
    rec.updatedAt = rs.isNull(4) ? std::string() : rs.getString(4);
    if(rs.isNull(2)) return true; // created but never updated
    nlohmann::json doc = nlohmann::json::parse(rs.getString(2), nullptr, false);
    if(doc.is_discarded()){
        if(outError) *outError = "stored transcript for " + rec.sessionId + " is not valid JSON";
        return false;
    }
    try{
        rec.transcript = transcriptFromJSON(doc);
    } catch(const std::exception& ex){
        if(outError) *outError = "stored transcript for " + rec.sessionId + " is malformed: " + ex.what();
        return false;
    }
    return true;
}

std::optional<SessionRecord> TranscriptStore::loadSession(const std::string& sessionId, std::string* outError){
    if(!db.isOpen()){ if(outError) *outError = "DB not open"; return std::nullopt; }
    auto stmt = db.prepare("SELECT ID, session_id, message_log, started_at, updated_at FROM sessions WHERE session_id = ?;", outError);
    if(!stmt) return std::nullopt;
    stmt->bindString(1, sessionId);
    auto rs = stmt->executeQuery();
    if(!rs->next()){
        if(outError) *outError = rs->failed() ? rs->errorMessage() : "unknown session: " + sessionId;
        return std::nullopt;
    }
    SessionRecord rec;
    if(!readRecord(*rs, rec, outError)) return std::nullopt;
    return rec;
}

std::vector<SessionRecord> TranscriptStore::listSessions(std::string* outError){
    std::vector<SessionRecord> out;
    if(!db.isOpen()){ if(outError) *outError = "DB not open"; return out; }
    auto stmt = db.prepare("SELECT ID, session_id, message_log, started_at, updated_at FROM sessions ORDER BY ID DESC;", outError);
    if(!stmt) return out;
    auto rs = stmt->executeQuery();
    while(rs->next()){
        SessionRecord rec;
        std::string err;
        if(!readRecord(*rs, rec, &err)){
            PLOGW << "TranscriptStore: " << err;
            continue;
        }
        out.push_back(std::move(rec));
    }
    if(rs->failed() && outError) *outError = rs->errorMessage();
    return out;
}

} // namespace SQLChat
