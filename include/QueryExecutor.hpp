#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "DBBackend.hpp"

namespace SQLChat {

// Outcome of one statement. Cells are JSON scalars (null, integer, real, string); blobs are
// reported as the string "<blob N bytes>".
struct QueryResult {
    bool ok = false;
    bool isRead = false;
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;
    int64_t rowsAffected = 0;
    std::string error;

    // Rows in tuple form, one per line: "(5,)", "(1, 'Alice', NULL)"
    std::string renderRows() const;
};

// Runs statements against a SQLite file. Every call opens and closes its own connection.
class QueryExecutor {
public:
    // True if the trimmed, lower-cased statement starts with select, with, pragma or explain
    static bool isReadStatement(const std::string& statement);

    // Reads return the full result set; writes are committed and return no rows. Errors roll
    // back the transaction, are logged, and come back as ok == false; nothing is thrown.
    static QueryResult execute(const DBConnectionInfo& target, const std::string& statement,
                               const std::vector<nlohmann::json>& params = {});

    // CREATE TABLE statements from sqlite_master in catalog order, newline-joined.
    // Throws std::runtime_error when the catalog cannot be read.
    static std::string extractSchema(const DBConnectionInfo& target);

    // Runs a multi-statement script (DDL plus seed data) in autocommit mode
    static bool executeScript(const DBConnectionInfo& target, const std::string& script, std::string* outError = nullptr);

    static std::string renderRow(const std::vector<nlohmann::json>& row);
};

} // namespace SQLChat
