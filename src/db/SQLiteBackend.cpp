#include "db/SQLiteBackend.hpp"
#include <plog/Log.h>
#include <cctype>
#include <cstring>

namespace SQLChat {

// Skips whitespace, stray semicolons and SQL comments; returns true if anything else remains
static bool hasTrailingStatement(const char* tail){
    if(!tail) return false;
    const char* p = tail;
    while(*p){
        if(std::isspace(static_cast<unsigned char>(*p)) || *p == ';'){ ++p; continue; }
        if(p[0] == '-' && p[1] == '-'){
            while(*p && *p != '\n') ++p;
            continue;
        }
        if(p[0] == '/' && p[1] == '*'){
            const char* end = std::strstr(p + 2, "*/");
            if(!end) return false; // unterminated comment runs to the end of the text
            p = end + 2;
            continue;
        }
        return true;
    }
    return false;
}

SQLiteBackend::SQLiteBackend() = default;
SQLiteBackend::~SQLiteBackend(){ close(); }

bool SQLiteBackend::open(const DBConnectionInfo &info, std::string *outError){
    if(db) close();
    path_ = info.path();
    int flags = SQLITE_OPEN_READWRITE;
    if(info.createIfMissing) flags |= SQLITE_OPEN_CREATE;
    if(sqlite3_open_v2(path_.c_str(), &db, flags, nullptr) != SQLITE_OK){
        if(outError) *outError = db ? sqlite3_errmsg(db) : "sqlite3_open_v2 failed";
        if(db){ sqlite3_close(db); db = nullptr; }
        return false;
    }
    sqlite3_busy_timeout(db, 5000);
    PLOGD << "SQLiteBackend: opened " << path_;
    return true;
}

void SQLiteBackend::close(){ if(db) { sqlite3_close(db); db = nullptr; } }

bool SQLiteBackend::isOpen() const{ return db != nullptr; }

bool SQLiteBackend::execute(const std::string &sql, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return false; }
    char* err = nullptr;
    if(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK){
        if(outError) *outError = err ? err : sqlite3_errmsg(db);
        if(err) sqlite3_free(err);
        return false;
    }
    return true;
}

class SQLiteResultSetImpl : public IResultSet {
public:
    explicit SQLiteResultSetImpl(sqlite3_stmt* s) : stmt(s) {}
    ~SQLiteResultSetImpl() override { if(stmt) sqlite3_reset(stmt); /* statement owns it */ }
    bool next() override {
        if(done) return false;
        int r = sqlite3_step(stmt);
        if(r == SQLITE_ROW) return true;
        done = true;
        if(r != SQLITE_DONE){
            error = sqlite3_errmsg(sqlite3_db_handle(stmt));
            hasError = true;
        }
        return false;
    }
    bool failed() const override { return hasError; }
    std::string errorMessage() const override { return error; }
    int columnCount() const override { return sqlite3_column_count(stmt); }
    std::string columnName(int idx) const override { const char* n = sqlite3_column_name(stmt, idx); return n ? n : std::string(); }
    ColumnType columnType(int idx) override {
        switch(sqlite3_column_type(stmt, idx)){
            case SQLITE_INTEGER: return ColumnType::Integer;
            case SQLITE_FLOAT: return ColumnType::Real;
            case SQLITE_TEXT: return ColumnType::Text;
            case SQLITE_BLOB: return ColumnType::Blob;
            default: return ColumnType::Null;
        }
    }
    int64_t getInt64(int idx) override { return sqlite3_column_int64(stmt, idx); }
    double getDouble(int idx) override { return sqlite3_column_double(stmt, idx); }
    std::string getString(int idx) override {
        const unsigned char* t = sqlite3_column_text(stmt, idx);
        if(!t) return std::string();
        return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(stmt, idx)));
    }
    std::vector<uint8_t> getBlob(int idx) override {
        const auto* b = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, idx));
        int sz = sqlite3_column_bytes(stmt, idx);
        if(!b || sz <= 0) return {};
        return std::vector<uint8_t>(b, b + sz);
    }
    bool isNull(int idx) override { return sqlite3_column_type(stmt, idx) == SQLITE_NULL; }
private:
    sqlite3_stmt* stmt;
    bool done = false;
    bool hasError = false;
    std::string error;
};

class SQLiteStmtWrapper : public IStatement {
public:
    SQLiteStmtWrapper(sqlite3* db_, sqlite3_stmt* s_) : db(db_), stmt(s_) {}
    ~SQLiteStmtWrapper() override { if(stmt) sqlite3_finalize(stmt); }
    void bindInt(int idx, int64_t v) override { sqlite3_bind_int64(stmt, idx, v); }
    void bindInt32(int idx, int32_t v) override { sqlite3_bind_int(stmt, idx, v); }
    void bindDouble(int idx, double v) override { sqlite3_bind_double(stmt, idx, v); }
    void bindString(int idx, const std::string &s) override { sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT); }
    void bindNull(int idx) override { sqlite3_bind_null(stmt, idx); }
    int parameterCount() const override { return sqlite3_bind_parameter_count(stmt); }
    bool execute(std::string *outError) override {
        int r = sqlite3_step(stmt);
        // a write that happens to return rows (e.g. RETURNING) is drained so it completes
        while(r == SQLITE_ROW) r = sqlite3_step(stmt);
        if(r == SQLITE_DONE){ sqlite3_reset(stmt); return true; }
        if(outError) *outError = sqlite3_errmsg(db);
        sqlite3_reset(stmt);
        return false;
    }
    std::unique_ptr<IResultSet> executeQuery() override { return std::make_unique<SQLiteResultSetImpl>(stmt); }
private:
    sqlite3* db;
    sqlite3_stmt* stmt;
};

std::unique_ptr<IStatement> SQLiteBackend::prepare(const std::string &sql, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return nullptr; }
    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    if(sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt, &tail) != SQLITE_OK){
        if(outError) *outError = sqlite3_errmsg(db);
        if(stmt) sqlite3_finalize(stmt);
        return nullptr;
    }
    if(!stmt){
        if(outError) *outError = "empty statement";
        return nullptr;
    }
    if(hasTrailingStatement(tail)){
        if(outError) *outError = "only one statement can be executed at a time";
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return std::make_unique<SQLiteStmtWrapper>(db, stmt);
}

bool SQLiteBackend::beginTransaction(std::string *outError){ return execute("BEGIN TRANSACTION;", outError); }
bool SQLiteBackend::commit(std::string *outError){ return execute("COMMIT;", outError); }
void SQLiteBackend::rollback(){
    if(!inTransaction()) return;
    std::string err;
    if(!execute("ROLLBACK;", &err)) PLOGW << "SQLiteBackend: rollback failed on " << path_ << ": " << err;
}

bool SQLiteBackend::inTransaction() const { return db && sqlite3_get_autocommit(db) == 0; }

int64_t SQLiteBackend::changes(){ if(!db) return 0; return sqlite3_changes(db); }

bool SQLiteBackend::hasColumn(const std::string &table, const std::string &column){
    if(!db) return false;
    std::string q = "PRAGMA table_info('" + table + "');";
    sqlite3_stmt* stmt = nullptr;
    bool found = false;
    if(sqlite3_prepare_v2(db, q.c_str(), -1, &stmt, nullptr) == SQLITE_OK){
        while(sqlite3_step(stmt) == SQLITE_ROW){
            const unsigned char* name = sqlite3_column_text(stmt,1);
            if(name){ std::string cname = reinterpret_cast<const char*>(name); if(cname == column){ found = true; break; } }
        }
    }
    if(stmt) sqlite3_finalize(stmt);
    return found;
}

} // namespace SQLChat
