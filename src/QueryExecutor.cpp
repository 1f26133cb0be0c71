#include "QueryExecutor.hpp"
#include "db/SQLiteBackend.hpp"
#include "stringUtils.hpp"
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>

namespace SQLChat {

// Statements that get an explicit transaction; everything else runs in autocommit
static bool isDataModification(const std::string& statement){
    const std::string s = toLower(trim(statement));
    return startsWith(s, "insert") || startsWith(s, "update") ||
           startsWith(s, "delete") || startsWith(s, "replace");
}

static std::string quoteText(const std::string& value){
    std::string out = "'";
    for(char c : value){
        if(c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static bool bindParams(IStatement& stmt, const std::vector<nlohmann::json>& params, std::string& error){
    if(stmt.parameterCount() != static_cast<int>(params.size())){
        error = "incorrect number of bindings: statement uses " + std::to_string(stmt.parameterCount()) +
                ", " + std::to_string(params.size()) + " supplied";
        return false;
    }
    for(size_t i = 0; i < params.size(); ++i){
        const int idx = static_cast<int>(i) + 1;
        const auto& p = params[i];
        if(p.is_null()) stmt.bindNull(idx);
        else if(p.is_boolean()) stmt.bindInt32(idx, p.get<bool>() ? 1 : 0);
        else if(p.is_number_integer()) stmt.bindInt(idx, p.get<int64_t>());
        else if(p.is_number_float()) stmt.bindDouble(idx, p.get<double>());
        else if(p.is_string()) stmt.bindString(idx, p.get<std::string>());
        else {
            error = "unsupported parameter type at position " + std::to_string(idx);
            return false;
        }
    }
    return true;
}

bool QueryExecutor::isReadStatement(const std::string& statement){
    const std::string s = toLower(trim(statement));
    return startsWith(s, "select") || startsWith(s, "with") ||
           startsWith(s, "pragma") || startsWith(s, "explain");
}

std::string QueryExecutor::renderRow(const std::vector<nlohmann::json>& row){
    std::ostringstream ss;
    ss << "(";
    for(size_t i = 0; i < row.size(); ++i){
        if(i) ss << ", ";
        const auto& cell = row[i];
        if(cell.is_null()) ss << "NULL";
        else if(cell.is_string()) ss << quoteText(cell.get<std::string>());
        else ss << cell.dump();
    }
    if(row.size() == 1) ss << ",";
    ss << ")";
    return ss.str();
}

std::string QueryResult::renderRows() const {
    std::string out;
    for(size_t i = 0; i < rows.size(); ++i){
        if(i) out += "\n";
        out += QueryExecutor::renderRow(rows[i]);
    }
    return out;
}

QueryResult QueryExecutor::execute(const DBConnectionInfo& target, const std::string& statement,
                                   const std::vector<nlohmann::json>& params){
    QueryResult result;
    result.isRead = isReadStatement(statement);

    SQLiteBackend db;
    if(!db.open(target, &result.error)){
        PLOGE << "Database error: cannot open " << target.path() << ": " << result.error;
        return result;
    }

    auto fail = [&](const std::string& err){
        result.ok = false;
        result.error = err;
        result.rows.clear();
        db.rollback();
        PLOGE << "Database error on " << target.path() << ": " << err << " [statement: " << statement << "]";
        return result;
    };

    std::string err;
    auto stmt = db.prepare(statement, &err);
    if(!stmt) return fail(err);
    if(!bindParams(*stmt, params, err)) return fail(err);

    if(result.isRead){
        auto rs = stmt->executeQuery();
        const int ncols = rs->columnCount();
        for(int c = 0; c < ncols; ++c) result.columns.push_back(rs->columnName(c));
        while(rs->next()){
            std::vector<nlohmann::json> row;
            row.reserve(static_cast<size_t>(ncols));
            for(int c = 0; c < ncols; ++c){
                switch(rs->columnType(c)){
                    case ColumnType::Integer: row.emplace_back(rs->getInt64(c)); break;
                    case ColumnType::Real: row.emplace_back(rs->getDouble(c)); break;
                    case ColumnType::Text: row.emplace_back(rs->getString(c)); break;
                    case ColumnType::Blob: row.emplace_back("<blob " + std::to_string(rs->getBlob(c).size()) + " bytes>"); break;
                    case ColumnType::Null: row.emplace_back(nullptr); break;
                }
            }
            result.rows.push_back(std::move(row));
        }
        if(rs->failed()) return fail(rs->errorMessage());
        result.ok = true;
        PLOGD << "QueryExecutor: read returned " << result.rows.size() << " rows";
        return result;
    }

    const bool explicitTxn = isDataModification(statement);
    if(explicitTxn && !db.beginTransaction(&err)) return fail(err);
    if(!stmt->execute(&err)) return fail(err);
    result.rowsAffected = db.changes();
    stmt.reset();
    if(db.inTransaction() && !db.commit(&err)) return fail(err);
    result.ok = true;
    PLOGD << "QueryExecutor: write committed, " << result.rowsAffected << " rows affected";
    return result;
}

std::string QueryExecutor::extractSchema(const DBConnectionInfo& target){
    SQLiteBackend db;
    std::string err;
    if(!db.open(target, &err)) throw std::runtime_error("cannot open database " + target.path() + ": " + err);

    auto stmt = db.prepare("SELECT sql FROM sqlite_master WHERE type='table';", &err);
    if(!stmt) throw std::runtime_error("cannot read schema of " + target.path() + ": " + err);

    std::string schema;
    auto rs = stmt->executeQuery();
    while(rs->next()){
        if(rs->isNull(0)) continue;
        if(!schema.empty()) schema += "\n";
        schema += rs->getString(0);
    }
    if(rs->failed()) throw std::runtime_error("cannot read schema of " + target.path() + ": " + rs->errorMessage());
    if(schema.empty()) PLOGW << "Database " << target.path() << " has no tables";
    return schema;
}

bool QueryExecutor::executeScript(const DBConnectionInfo& target, const std::string& script, std::string* outError){
    SQLiteBackend db;
    std::string err;
    if(!db.open(target, &err)){
        PLOGE << "Database error: cannot open " << target.path() << ": " << err;
        if(outError) *outError = err;
        return false;
    }
    if(!db.execute(script, &err)){
        PLOGE << "Script failed on " << target.path() << ": " << err;
        db.rollback();
        if(outError) *outError = err;
        return false;
    }
    return true;
}

} // namespace SQLChat
