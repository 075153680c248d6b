// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <LiteBridge/SqlBatch.hpp>
#include <LiteBridge/SqlBatchExecutor.hpp>
#include <LiteBridge/SqlDatabase.hpp>
#include <LiteBridge/SqlResultSetMarshaller.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

// NOLINTBEGIN(readability-container-size-empty)

namespace
{

SqlStatementRequest Request(std::string query,
                            std::string id,
                            std::optional<std::vector<SqlVariant>> parameters = std::nullopt)
{
    return SqlStatementRequest { .query = std::move(query), .parameters = std::move(parameters), .id = std::move(id) };
}

template <typename T>
T const& OutcomeAs(SqlBatchEntry const& entry)
{
    INFO("entry " << entry.id);
    if (auto const* error = std::get_if<SqlStatementError>(&entry.outcome))
        FAIL("statement failed: " << error->message);
    REQUIRE(std::holds_alternative<T>(entry.outcome));
    return std::get<T>(entry.outcome);
}

std::string ErrorMessage(SqlBatchEntry const& entry)
{
    REQUIRE(entry.Failed());
    return std::get<SqlStatementError>(entry.outcome).message;
}

// Records the batch related logger events, while in scope.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedBatchEventRecorder: public SqlLogger::Null
{
  private:
    SqlLogger& m_previousLogger = SqlLogger::GetLogger();

  public:
    std::vector<size_t> batches;
    std::vector<std::pair<std::string, std::string>> failures;

    ScopedBatchEventRecorder()
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedBatchEventRecorder() override
    {
        SqlLogger::SetLogger(m_previousLogger);
    }

    void OnExecuteBatch(std::size_t statementCount) noexcept override
    {
        batches.push_back(statementCount);
    }

    void OnBatchStatementFailed(std::string_view const& id, std::string_view const& message) noexcept override
    {
        failures.emplace_back(id, message);
    }
};

} // namespace

TEST_CASE("SqlBatchExecutor: unopened database fails the batch as a whole", "[SqlBatchExecutor]")
{
    auto database = SqlDatabase {};
    auto const requests = std::vector { Request("SELECT 1", "q1"), Request("SELECT 2", "q2") };

    auto const _ = ScopedSqlNullLogger {};
    auto const result = SqlBatchExecutor { database }.Execute(requests);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == SqlError::DATABASE_CLOSED);
    CHECK(result.error().message == "database has been closed");
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: closed database fails the batch as a whole", "[SqlBatchExecutor]")
{
    database.Close();

    auto const requests = std::vector { Request("CREATE TABLE t (x INTEGER)", "q1") };

    auto const _ = ScopedSqlNullLogger {};
    auto const result = SqlBatchExecutor { database }.Execute(requests);

    REQUIRE(!result.has_value());
    CHECK(result.error().code == SqlError::DATABASE_CLOSED);
    CHECK(result.error().message == "database has been closed");
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: one outcome per statement, in order", "[SqlBatchExecutor]")
{
    CreatePeopleTable(database.Connection());

    auto const requests = std::vector {
        Request("INSERT INTO people (name) VALUES ('Alice')", "a"),
        Request("SELECT name FROM people", "b"),
        Request("UPDATE people SET age = 30", "c"),
        Request("DELETE FROM people", "d"),
        Request("SELECT name FROM people", "e"),
    };

    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    REQUIRE(result->entries.size() == requests.size());
    for (auto const [i, entry]: result->entries | std::views::enumerate)
        CHECK(entry.id == requests[static_cast<size_t>(i)].id);

    CHECK(OutcomeAs<SqlInsertResult>(result->entries[0]).rowsAffected == 1);
    CHECK(OutcomeAs<SqlRowSet>(result->entries[1]).rows.size() == 1);
    CHECK(OutcomeAs<SqlAffectedCount>(result->entries[2]).rowsAffected == 1);
    CHECK(OutcomeAs<SqlAffectedCount>(result->entries[3]).rowsAffected == 1);
    CHECK(OutcomeAs<SqlRowSet>(result->entries[4]).rows.empty());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: empty batch", "[SqlBatchExecutor]")
{
    auto const result = SqlBatchExecutor { database }.Execute({});
    REQUIRE(result.has_value());
    CHECK(result->entries.empty());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: a failing statement does not stop the batch", "[SqlBatchExecutor]")
{
    CreatePeopleTable(database.Connection());

    auto const requests = std::vector {
        Request("INSERT INTO people (name) VALUES ('Alice')", "1"),
        Request("SELECT * FROM no_such_table", "2"),
        Request("INSERT INTO people (name) VALUES (NULL)", "3"),
        Request("INSERT INTO people (name) VALUES ('Bob')", "4"),
    };

    auto recorder = ScopedBatchEventRecorder {};
    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    REQUIRE(result->entries.size() == 4);

    CHECK(!result->entries[0].Failed());
    CHECK(!ErrorMessage(result->entries[1]).empty());
    CHECK(!ErrorMessage(result->entries[2]).empty()); // NOT NULL constraint
    CHECK(!result->entries[3].Failed());
    CHECK(CountRows(database.Connection(), "people") == 2);

    REQUIRE(recorder.batches == std::vector<size_t> { 4 });
    REQUIRE(recorder.failures.size() == 2);
    CHECK(recorder.failures[0].first == "2");
    CHECK(recorder.failures[1].first == "3");
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: insert reports rows affected and insert id", "[SqlBatchExecutor]")
{
    CreatePeopleTable(database.Connection());

    auto const requests = std::vector {
        Request("INSERT INTO people (name, age) VALUES (?, ?)", "1", std::vector<SqlVariant> { "Alice", "31" }),
        Request("INSERT INTO people (name, age) VALUES (?, ?)", "2", std::vector<SqlVariant> { "Bob", "42" }),
        Request("SELECT * FROM people WHERE name = ?", "3", std::vector<SqlVariant> { "Nobody" }),
    };

    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());

    auto const& first = OutcomeAs<SqlInsertResult>(result->entries[0]);
    CHECK(first.rowsAffected == 1);
    CHECK(first.insertId == 1);

    auto const& second = OutcomeAs<SqlInsertResult>(result->entries[1]);
    CHECK(second.rowsAffected == 1);
    CHECK(second.insertId == 2);

    CHECK(OutcomeAs<SqlRowSet>(result->entries[2]).rows.empty());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: update and delete report affected rows", "[SqlBatchExecutor]")
{
    CreatePeopleTable(database.Connection());

    auto const requests = std::vector {
        Request("INSERT INTO people (name, age) VALUES ('Alice', 30)", "1"),
        Request("INSERT INTO people (name, age) VALUES ('Bob', 40)", "2"),
        Request("INSERT INTO people (name, age) VALUES ('Carol', 50)", "3"),
        Request("UPDATE people SET age = age + 1 WHERE age >= ?", "4", std::vector<SqlVariant> { 40 }),
        Request("UPDATE people SET age = 0 WHERE name = 'Nobody'", "5"),
        Request("DELETE FROM people WHERE age > 45", "6"),
    };

    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    CHECK(OutcomeAs<SqlAffectedCount>(result->entries[3]).rowsAffected == 2);
    CHECK(OutcomeAs<SqlAffectedCount>(result->entries[4]).rowsAffected == 0);
    CHECK(OutcomeAs<SqlAffectedCount>(result->entries[5]).rowsAffected == 1);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: rollback discards changes", "[SqlBatchExecutor]")
{
    CreatePeopleTable(database.Connection());

    auto const requests = std::vector {
        Request("BEGIN", "1"),
        Request("INSERT INTO people (name) VALUES ('Alice')", "2"),
        Request("ROLLBACK", "3"),
        Request("SELECT name FROM people", "4"),
    };

    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    CHECK(std::holds_alternative<SqlEmptyResult>(result->entries[0].outcome));
    CHECK(!result->entries[1].Failed());
    CHECK(std::holds_alternative<SqlEmptyResult>(result->entries[2].outcome));
    CHECK(OutcomeAs<SqlRowSet>(result->entries[3]).rows.empty());
    CHECK(!database.TransactionActive());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: commit persists changes", "[SqlBatchExecutor]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE items (name TEXT, qty INTEGER)");

    auto const requests = std::vector {
        Request("BEGIN", "1"),
        Request("INSERT INTO items (name, qty) VALUES (?, ?)", "2", std::vector<SqlVariant> { "a", "1" }),
        Request("COMMIT", "3"),
        Request("SELECT name, qty FROM items", "4"),
    };

    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    CHECK(std::holds_alternative<SqlEmptyResult>(result->entries[2].outcome));

    auto const& rowSet = OutcomeAs<SqlRowSet>(result->entries[3]);
    REQUIRE(rowSet.rows.size() == 1);
    auto const& row = rowSet.rows.front();
    REQUIRE(row.Find("name") != nullptr);
    REQUIRE(row.Find("qty") != nullptr);
    CHECK(*row.Find("name") == SqlVariant { "a" });
    CHECK(*row.Find("qty") == SqlVariant { int64_t { 1 } });
    CHECK(!database.TransactionActive());
    CHECK(CountRows(database.Connection(), "items") == 1);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: transaction control errors", "[SqlBatchExecutor]")
{
    auto const requests = std::vector {
        Request("COMMIT", "1"),
        Request("ROLLBACK", "2"),
        Request("BEGIN", "3"),
        Request("BEGIN", "4"),
        Request("ROLLBACK", "5"),
    };

    auto const _ = ScopedSqlNullLogger {};
    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    CHECK(ErrorMessage(result->entries[0]) == "cannot commit - no transaction is active");
    CHECK(ErrorMessage(result->entries[1]) == "cannot rollback - no transaction is active");
    CHECK(!result->entries[2].Failed());
    CHECK(ErrorMessage(result->entries[3]) == "cannot start a transaction within a transaction");
    CHECK(!result->entries[4].Failed());
    CHECK(!database.TransactionActive());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: parameter count mismatch is a statement error", "[SqlBatchExecutor]")
{
    CreatePeopleTable(database.Connection());

    auto const requests = std::vector {
        Request("INSERT INTO people (name, age) VALUES (?, ?)", "1", std::vector<SqlVariant> { "Alice" }),
        Request("SELECT COUNT(*) AS n FROM people", "2"),
    };

    auto const _ = ScopedSqlNullLogger {};
    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    CHECK(!ErrorMessage(result->entries[0]).empty());
    CHECK(!result->entries[1].Failed());
    CHECK(CountRows(database.Connection(), "people") == 0);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: empty parameter list executes directly", "[SqlBatchExecutor]")
{
    CreatePeopleTable(database.Connection());

    auto const requests = std::vector {
        Request("INSERT INTO people (name) VALUES ('Alice')", "1", std::vector<SqlVariant> {}),
    };

    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    CHECK(OutcomeAs<SqlInsertResult>(result->entries[0]).insertId == 1);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBatchExecutor: statements without result columns yield no rows", "[SqlBatchExecutor]")
{
    auto const requests = std::vector {
        Request("CREATE TABLE t (x INTEGER)", "1"),
        Request("DROP TABLE t", "2"),
    };

    auto const result = SqlBatchExecutor { database }.Execute(requests);
    REQUIRE(result.has_value());
    CHECK(OutcomeAs<SqlRowSet>(result->entries[0]).rows.empty());
    CHECK(OutcomeAs<SqlRowSet>(result->entries[1]).rows.empty());
}

TEST_CASE_METHOD(SqlTestFixture, "ReadRowSet: typed values and explicit NULL", "[SqlResultSetMarshaller]")
{
    CreatePeopleTable(database.Connection());

    auto stmt = SqlStatement { database.Connection() };
    stmt.Prepare("INSERT INTO people (name, age, height, photo) VALUES (?, ?, ?, ?)");
    stmt.ExecuteWithVariants({ SqlVariant { "Alice" },
                               SqlVariant { 31 },
                               SqlVariant { 1.5 },
                               SqlVariant { SqlBlob { .data = { 0xDE, 0xAD } } } });
    stmt.ExecuteWithVariants(
        { SqlVariant { "Bob" }, SqlVariant { SqlNullValue }, SqlVariant { SqlNullValue }, SqlVariant { SqlNullValue } });

    stmt.ExecuteDirect("SELECT name, age, height, photo FROM people ORDER BY id");
    auto const rowSet = ReadRowSet(stmt);
    REQUIRE(rowSet.rows.size() == 2);

    auto const& alice = rowSet.rows[0];
    CHECK(*alice.Find("name") == SqlVariant { "Alice" });
    CHECK(*alice.Find("age") == SqlVariant { int64_t { 31 } });
    CHECK(*alice.Find("height") == SqlVariant { 1.5 });
    CHECK(*alice.Find("photo") == SqlVariant { SqlBlob { .data = { 0xDE, 0xAD } } });

    auto const& bob = rowSet.rows[1];
    REQUIRE(bob.size() == 4);
    CHECK(bob.Find("age")->IsNull());
    CHECK(bob.Find("height")->IsNull());
    CHECK(bob.Find("photo")->IsNull());
    CHECK(bob.Find("missing") == nullptr);
}

TEST_CASE_METHOD(SqlTestFixture, "ReadRowSet: column order and duplicate names", "[SqlResultSetMarshaller]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE pairs (a INTEGER, b INTEGER, c INTEGER)");
    stmt.ExecuteDirect("INSERT INTO pairs (a, b, c) VALUES (1, 2, 3)");

    stmt.ExecuteDirect("SELECT c, a, b FROM pairs");
    auto const ordered = ReadRowSet(stmt);
    REQUIRE(ordered.rows.size() == 1);
    auto names = std::vector<std::string> {};
    for (auto const& [name, value]: ordered.rows[0])
        names.push_back(name);
    CHECK(names == std::vector<std::string> { "c", "a", "b" });

    stmt.ExecuteDirect("SELECT a, b AS a, c FROM pairs");
    auto const duplicated = ReadRowSet(stmt);
    REQUIRE(duplicated.rows.size() == 1);
    auto const& row = duplicated.rows[0];
    CHECK(row.size() == 2);
    CHECK(*row.Find("a") == SqlVariant { int64_t { 2 } });
    CHECK(row.begin()->first == "a");
}

TEST_CASE_METHOD(SqlTestFixture, "ReadRowSet: cursor is closed afterwards", "[SqlResultSetMarshaller]")
{
    CreatePeopleTable(database.Connection());

    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("INSERT INTO people (name) VALUES ('Alice')");
    stmt.ExecuteDirect("INSERT INTO people (name) VALUES ('Bob')");

    stmt.ExecuteDirect("SELECT name FROM people");
    CHECK(ReadRowSet(stmt).rows.size() == 2);

    // the statement handle is immediately reusable
    stmt.ExecuteDirect("SELECT name FROM people WHERE name = 'Bob'");
    CHECK(ReadRowSet(stmt).rows.size() == 1);
}

TEST_CASE_METHOD(SqlTestFixture, "ReadRowSet: geometry columns yield blobs", "[SqlResultSetMarshaller]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE g (geom POINT, area MULTIPOLYGON, shape GEOMETRY)");
    stmt.ExecuteDirect("INSERT INTO g (geom, area, shape) VALUES (X'0001FF', X'00', NULL)");

    stmt.ExecuteDirect("SELECT geom, area, shape FROM g");
    auto const rowSet = ReadRowSet(stmt);
    REQUIRE(rowSet.rows.size() == 1);

    auto const& row = rowSet.rows[0];
    CHECK(*row.Find("geom") == SqlVariant { SqlBlob { .data = { 0x00, 0x01, 0xFF } } });
    CHECK(*row.Find("area") == SqlVariant { SqlBlob { .data = { 0x00 } } });
    CHECK(row.Find("shape")->IsNull());
}

TEST_CASE_METHOD(SqlTestFixture, "ReadRowSet: values are typed by what the column holds", "[SqlResultSetMarshaller]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE mixed (id INTEGER PRIMARY KEY, n NUMERIC, i INTEGER, t TEXT, d DECIMAL(10, 2))");
    stmt.ExecuteDirect("INSERT INTO mixed (id, n, i, t, d) VALUES (1, 7, 'abc', 42, 2.5)");
    stmt.ExecuteDirect("INSERT INTO mixed (id, n, i, t, d) VALUES (2, 2.5, 8, 'x', 3)");
    stmt.ExecuteDirect("INSERT INTO mixed (id, n, i, t, d) VALUES (3, 'n/a', -1, '', NULL)");

    stmt.ExecuteDirect("SELECT n, i, t, d FROM mixed ORDER BY id");
    auto const rowSet = ReadRowSet(stmt);
    REQUIRE(rowSet.rows.size() == 3);

    // integer in a NUMERIC column, text in an INTEGER column, and a number in a TEXT column,
    // which SQLite stores as text
    auto const& first = rowSet.rows[0];
    CHECK(*first.Find("n") == SqlVariant { int64_t { 7 } });
    CHECK(*first.Find("i") == SqlVariant { "abc" });
    CHECK(*first.Find("t") == SqlVariant { "42" });
    CHECK(*first.Find("d") == SqlVariant { 2.5 });

    auto const& second = rowSet.rows[1];
    CHECK(*second.Find("n") == SqlVariant { 2.5 });
    CHECK(*second.Find("i") == SqlVariant { int64_t { 8 } });
    CHECK(*second.Find("t") == SqlVariant { "x" });
    CHECK(*second.Find("d") == SqlVariant { int64_t { 3 } });

    auto const& third = rowSet.rows[2];
    CHECK(*third.Find("n") == SqlVariant { "n/a" });
    CHECK(*third.Find("i") == SqlVariant { int64_t { -1 } });
    CHECK(*third.Find("t") == SqlVariant { "" });
    CHECK(third.Find("d")->IsNull());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlResultCursor: cursor is closed when reading a column throws", "[SqlResultSetMarshaller]")
{
    CreatePeopleTable(database.Connection());

    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("INSERT INTO people (name) VALUES ('Alice')");

    stmt.ExecuteDirect("SELECT name FROM people");
    {
        auto const _ = ScopedSqlNullLogger {};
        auto cursor = stmt.GetResultCursor();
        REQUIRE(cursor.FetchRow());
        CHECK_THROWS(cursor.GetColumn<SqlVariant>(5));
    }

    // no "invalid cursor state" from a dangling result set
    stmt.ExecuteDirect("SELECT name FROM people");
    auto const rowSet = ReadRowSet(stmt);
    REQUIRE(rowSet.rows.size() == 1);
    CHECK(*rowSet.rows[0].Find("name") == SqlVariant { "Alice" });
}

// NOLINTEND(readability-container-size-empty)
