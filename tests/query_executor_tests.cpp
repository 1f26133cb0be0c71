#include "QueryExecutor.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using SQLChat::DBConnectionInfo;
using SQLChat::QueryExecutor;
using sqlchat_test::TempDir;

namespace {

int64_t countUsers(const DBConnectionInfo& target)
{
    const auto result = QueryExecutor::execute(target, "SELECT COUNT(*) FROM users;");
    REQUIRE(result.ok);
    return result.rows.at(0).at(0).get<int64_t>();
}

} // namespace

TEST_CASE("isReadStatement classifies by leading keyword", "[executor]")
{
    CHECK(QueryExecutor::isReadStatement("SELECT 1"));
    CHECK(QueryExecutor::isReadStatement("  \n select * from users"));
    CHECK(QueryExecutor::isReadStatement("WITH t AS (SELECT 1) SELECT * FROM t"));
    CHECK(QueryExecutor::isReadStatement("PRAGMA table_info(users)"));
    CHECK(QueryExecutor::isReadStatement("explain query plan select 1"));
    CHECK_FALSE(QueryExecutor::isReadStatement("INSERT INTO users VALUES (6, 'Frank', NULL)"));
    CHECK_FALSE(QueryExecutor::isReadStatement("delete from users"));
    CHECK_FALSE(QueryExecutor::isReadStatement("CREATE TABLE x(a)"));
}

TEST_CASE("renderRow uses tuple form", "[executor]")
{
    CHECK(QueryExecutor::renderRow({5}) == "(5,)");
    CHECK(QueryExecutor::renderRow({1, "Alice", nullptr}) == "(1, 'Alice', NULL)");
    CHECK(QueryExecutor::renderRow({"O'Brien"}) == "('O\\'Brien',)");
    CHECK(QueryExecutor::renderRow({}) == "()");
}

TEST_CASE("reads return columns and every row", "[executor]")
{
    TempDir dir;
    const auto target = sqlchat_test::makeUsersDatabase(dir.file("users.sqlite"));

    const auto count = QueryExecutor::execute(target, "SELECT COUNT(*) FROM users;");
    REQUIRE(count.ok);
    CHECK(count.isRead);
    REQUIRE(count.rows.size() == 1U);
    CHECK(count.renderRows() == "(5,)");

    const auto rows = QueryExecutor::execute(target, "SELECT id, name, email FROM users WHERE id <= 2 ORDER BY id");
    REQUIRE(rows.ok);
    REQUIRE(rows.columns == std::vector<std::string>{"id", "name", "email"});
    CHECK(rows.renderRows() == "(1, 'Alice', 'alice@example.com')\n(2, 'Bob', NULL)");

    const auto blobs = QueryExecutor::execute(target, "SELECT X'00FF10', zeroblob(0)");
    REQUIRE(blobs.ok);
    CHECK(blobs.renderRows() == "('<blob 3 bytes>', '<blob 0 bytes>')");
}

TEST_CASE("bound parameters cover every scalar type", "[executor]")
{
    TempDir dir;
    const auto target = sqlchat_test::makeUsersDatabase(dir.file("users.sqlite"));

    const auto byName = QueryExecutor::execute(target, "SELECT id FROM users WHERE name = ?", {"Carol"});
    REQUIRE(byName.ok);
    CHECK(byName.renderRows() == "(3,)");

    const auto typed = QueryExecutor::execute(target, "SELECT ?, ?, ?, ?", {nullptr, 7, 2.5, true});
    REQUIRE(typed.ok);
    CHECK(typed.renderRows() == "(NULL, 7, 2.5, 1)");

    const auto wrongCount = QueryExecutor::execute(target, "SELECT id FROM users WHERE id = ?");
    CHECK_FALSE(wrongCount.ok);
    CHECK_FALSE(wrongCount.error.empty());
}

TEST_CASE("writes are committed and report affected rows", "[executor]")
{
    TempDir dir;
    const auto target = sqlchat_test::makeUsersDatabase(dir.file("users.sqlite"));

    const auto insert = QueryExecutor::execute(target, "INSERT INTO users (id, name) VALUES (?, ?)", {6, "Frank"});
    REQUIRE(insert.ok);
    CHECK_FALSE(insert.isRead);
    CHECK(insert.rows.empty());
    CHECK(insert.rowsAffected == 1);
    CHECK(countUsers(target) == 6);

    const auto update = QueryExecutor::execute(target, "UPDATE users SET email = 'none' WHERE email IS NULL");
    REQUIRE(update.ok);
    CHECK(update.rowsAffected == 2);

    const auto ddl = QueryExecutor::execute(target, "CREATE TABLE notes (id INTEGER PRIMARY KEY, body TEXT)");
    REQUIRE(ddl.ok);
    CHECK(QueryExecutor::extractSchema(target).find("CREATE TABLE notes") != std::string::npos);
}

TEST_CASE("failed statements roll back and report instead of throwing", "[executor]")
{
    TempDir dir;
    const auto target = sqlchat_test::makeUsersDatabase(dir.file("users.sqlite"));

    const auto missing = QueryExecutor::execute(target, "SELECT * FROM no_such_table");
    CHECK_FALSE(missing.ok);
    CHECK(missing.rows.empty());
    CHECK_FALSE(missing.error.empty());

    const auto duplicate = QueryExecutor::execute(target, "INSERT INTO users (id, name) VALUES (1, 'Again')");
    CHECK_FALSE(duplicate.ok);
    CHECK(countUsers(target) == 5);

    const auto twoStatements =
        QueryExecutor::execute(target, "DELETE FROM users; DELETE FROM users WHERE id = 1;");
    CHECK_FALSE(twoStatements.ok);
    CHECK(countUsers(target) == 5);

    const auto trailing = QueryExecutor::execute(target, "SELECT 1; -- done\n");
    CHECK(trailing.ok);

    const auto nowhere = QueryExecutor::execute(DBConnectionInfo::fromPath(dir.file("missing.sqlite")), "SELECT 1");
    CHECK_FALSE(nowhere.ok);
}

TEST_CASE("extractSchema lists tables in catalog order", "[executor][schema]")
{
    TempDir dir;
    const auto target = DBConnectionInfo::fromPath(dir.file("two.sqlite"), true);
    REQUIRE(QueryExecutor::executeScript(target,
                                         "CREATE TABLE a (x INTEGER);\n"
                                         "CREATE INDEX a_x ON a(x);\n"
                                         "CREATE TABLE b (y TEXT);\n"));
    CHECK(QueryExecutor::extractSchema(target) == "CREATE TABLE a (x INTEGER)\nCREATE TABLE b (y TEXT)");

    CHECK_THROWS_AS(QueryExecutor::extractSchema(DBConnectionInfo::fromPath(dir.file("missing.sqlite"))),
                    std::runtime_error);
}

TEST_CASE("executeScript reports script errors", "[executor][script]")
{
    TempDir dir;
    const auto target = DBConnectionInfo::fromPath(dir.file("bad.sqlite"), true);
    std::string error;
    CHECK_FALSE(QueryExecutor::executeScript(target, "CREATE TABLE a (x); INSERT INTO nope VALUES (1);", &error));
    CHECK_FALSE(error.empty());
}
