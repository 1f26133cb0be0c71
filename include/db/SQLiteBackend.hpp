#pragma once
#include "DBBackend.hpp"
#include <sqlite3.h>
#include <string>
#include <memory>

namespace SQLChat {

class SQLiteBackend : public IDBBackend {
public:
    SQLiteBackend();
    ~SQLiteBackend() override;

    SQLiteBackend(const SQLiteBackend&) = delete;
    SQLiteBackend& operator=(const SQLiteBackend&) = delete;

    bool open(const DBConnectionInfo &info, std::string *outError = nullptr) override;
    void close() override;
    bool isOpen() const override;
    bool execute(const std::string &sql, std::string *outError = nullptr) override;
    std::unique_ptr<IStatement> prepare(const std::string &sql, std::string *outError = nullptr) override;
    bool beginTransaction(std::string *outError = nullptr) override;
    bool commit(std::string *outError = nullptr) override;
    void rollback() override;
    bool inTransaction() const override;
    int64_t changes() override;

    bool hasColumn(const std::string &table, const std::string &column) override;

    const std::string& path() const { return path_; }

private:
    sqlite3* db = nullptr;
    std::string path_;
};

} // namespace SQLChat
