#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

// Minimal DB backend abstraction used by the query executor and the transcript store
namespace SQLChat {

struct DBConnectionInfo {
    std::string sqlite_dir;
    std::string sqlite_filename;
    // when false, opening a file that does not exist fails instead of creating an empty database
    bool createIfMissing = false;

    std::string path() const {
        if(!sqlite_dir.empty()) return sqlite_dir + "/" + sqlite_filename;
        return sqlite_filename;
    }
    static DBConnectionInfo fromPath(const std::string &path, bool createIfMissing = false){
        DBConnectionInfo ci;
        ci.sqlite_filename = path;
        ci.createIfMissing = createIfMissing;
        return ci;
    }
};

enum class ColumnType { Integer, Real, Text, Blob, Null };

struct IResultSet {
    virtual ~IResultSet() = default;
    virtual bool next() = 0;
    // true when next() stopped because of an engine error rather than the end of the rows
    virtual bool failed() const = 0;
    virtual std::string errorMessage() const = 0;
    virtual int columnCount() const = 0;
    virtual std::string columnName(int idx) const = 0;
    virtual ColumnType columnType(int idx) = 0;
    virtual int64_t getInt64(int idx) = 0;
    virtual double getDouble(int idx) = 0;
    virtual std::string getString(int idx) = 0;
    virtual std::vector<uint8_t> getBlob(int idx) = 0;
    virtual bool isNull(int idx) = 0;
};

struct IStatement {
    virtual ~IStatement() = default;
    virtual void bindInt(int idx, int64_t v) = 0;
    virtual void bindInt32(int idx, int32_t v) = 0;
    virtual void bindDouble(int idx, double v) = 0;
    virtual void bindString(int idx, const std::string &s) = 0;
    virtual void bindNull(int idx) = 0;
    virtual int parameterCount() const = 0;
    virtual bool execute(std::string *outError = nullptr) = 0; // for INSERT/UPDATE/DELETE
    virtual std::unique_ptr<IResultSet> executeQuery() = 0; // for SELECT
};

struct IDBBackend {
    virtual ~IDBBackend() = default;
    virtual bool open(const DBConnectionInfo &info, std::string *outError = nullptr) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual bool execute(const std::string &sql, std::string *outError = nullptr) = 0; // DDL / scripts
    // Prepares exactly one statement; trailing statements in `sql` are reported through outError
    virtual std::unique_ptr<IStatement> prepare(const std::string &sql, std::string *outError = nullptr) = 0;
    virtual bool beginTransaction(std::string *outError = nullptr) = 0;
    virtual bool commit(std::string *outError = nullptr) = 0;
    virtual void rollback() = 0;
    virtual bool inTransaction() const = 0;
    virtual int64_t changes() = 0;

    // Introspection helpers
    virtual bool hasColumn(const std::string &table, const std::string &column) = 0;
};

} // namespace SQLChat
