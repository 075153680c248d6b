// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <LiteBridge/SqlConnection.hpp>
#include <LiteBridge/SqlDataBinder.hpp>
#include <LiteBridge/SqlStatement.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <format>
#include <numeric>
#include <string>

// NOLINTBEGIN(readability-container-size-empty)

using namespace std::string_view_literals;

TEST_CASE("SqlVariant: accessors", "[SqlVariant]")
{
    auto const null = SqlVariant { SqlNullValue };
    CHECK(null.IsNull());
    CHECK(!null.TryGetInt64().has_value());
    CHECK(null.ToString() == "NULL");

    auto const integer = SqlVariant { int64_t { 42 } };
    CHECK(integer.Is<int64_t>());
    CHECK(integer.TryGetInt64().value_or(0) == 42);
    CHECK(integer.TryGetDouble().value_or(0.0) == 42.0);
    CHECK(!integer.TryGetStringView().has_value());
    CHECK(integer.ToString() == "42");

    auto const real = SqlVariant { 1.5 };
    CHECK(real.Is<double>());
    CHECK(!real.TryGetInt64().has_value());
    CHECK(real.TryGetDouble().value_or(0.0) == 1.5);

    auto const text = SqlVariant { "hello"sv };
    CHECK(text.Is<std::string>());
    CHECK(text.TryGetStringView().value_or("") == "hello");
    CHECK(text.ToString() == "hello");

    auto const blob = SqlVariant { SqlBlob { .data = { 1, 2, 3 } } };
    CHECK(blob.Is<SqlBlob>());
    CHECK(blob.Get<SqlBlob>().size() == 3);
    CHECK(blob.ToString() == "<BLOB 3 bytes>");
}

TEST_CASE("SqlVariant: from optional", "[SqlVariant]")
{
    CHECK(SqlVariant { std::optional<std::string> {} }.IsNull());
    CHECK(SqlVariant { std::optional<std::string> { "x" } } == SqlVariant { "x" });
    CHECK(SqlVariant { std::optional<int> { 7 } } == SqlVariant { int64_t { 7 } });
}

TEST_CASE("SqlVariant: formatter", "[SqlVariant]")
{
    CHECK(std::format("{}", SqlVariant { SqlNullValue }) == "NULL");
    CHECK(std::format("{}", SqlVariant { 17 }) == "17");
    CHECK(std::format("{}", SqlVariant { "text" }) == "text");
}

TEST_CASE("SqlDataBinder: Inspect", "[SqlDataBinder]")
{
    CHECK(SqlDataBinder<int32_t>::Inspect(42) == "42");
    CHECK(SqlDataBinder<SqlNullType>::Inspect(SqlNullValue) == "NULL");
    auto const text = std::string("abc");
    CHECK(SqlDataBinder<std::string>::Inspect(text) == "abc");
    CHECK(SqlDataBinder<SqlBlob>::Inspect(SqlBlob { .data = { 0xFF } }) == "<BLOB 1 bytes>");
    CHECK(SqlDataBinder<SqlVariant>::Inspect(SqlVariant { 3 }) == "3");
}

TEST_CASE_METHOD(SqlTestFixture, "SqlVariant: bind and read back typed columns", "[SqlVariant]")
{
    auto& conn = database.Connection();
    CreatePeopleTable(conn);

    auto const photo = SqlBlob { .data = { 0x00, 0x01, 0x7F, 0x80, 0xFF } };

    auto stmt = SqlStatement { conn };
    stmt.Prepare("INSERT INTO people (name, age, height, photo) VALUES (?, ?, ?, ?)");
    stmt.ExecuteWithVariants({ SqlVariant { "Alice" }, SqlVariant { 31 }, SqlVariant { 1.68 }, SqlVariant { photo } });
    stmt.ExecuteWithVariants(
        { SqlVariant { "Bob" }, SqlVariant { SqlNullValue }, SqlVariant { SqlNullValue }, SqlVariant { SqlNullValue } });

    stmt.ExecuteDirect("SELECT name, age, height, photo FROM people ORDER BY id");

    REQUIRE(stmt.FetchRow());
    auto const name = stmt.GetColumn<SqlVariant>(1);
    auto const age = stmt.GetColumn<SqlVariant>(2);
    auto const height = stmt.GetColumn<SqlVariant>(3);
    auto const blob = stmt.GetColumn<SqlVariant>(4);
    CHECK(name == SqlVariant { "Alice" });
    CHECK(age == SqlVariant { int64_t { 31 } });
    REQUIRE(height.Is<double>());
    CHECK_THAT(height.Get<double>(), Catch::Matchers::WithinAbs(1.68, 0.000'001));
    REQUIRE(blob.Is<SqlBlob>());
    CHECK(blob.Get<SqlBlob>() == photo);

    REQUIRE(stmt.FetchRow());
    CHECK(stmt.GetColumn<SqlVariant>(1) == SqlVariant { "Bob" });
    CHECK(stmt.GetColumn<SqlVariant>(2).IsNull());
    CHECK(stmt.GetColumn<SqlVariant>(3).IsNull());
    CHECK(stmt.GetColumn<SqlVariant>(4).IsNull());

    REQUIRE(!stmt.FetchRow());
}

TEST_CASE_METHOD(SqlTestFixture, "std::string: values longer than one read chunk", "[SqlDataBinder]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE notes (body TEXT)");

    auto expected = std::string();
    for (int i = 0; i < 500; ++i)
        expected += std::format("{:04} ", i);
    REQUIRE(expected.size() > 2048);

    stmt.Prepare("INSERT INTO notes (body) VALUES (?)");
    stmt.Execute(expected);

    stmt.ExecuteDirect("SELECT body FROM notes");
    REQUIRE(stmt.FetchRow());
    CHECK(stmt.GetColumn<std::string>(1) == expected);
    REQUIRE(!stmt.FetchRow());
}

TEST_CASE_METHOD(SqlTestFixture, "SqlBlob: values longer than one read chunk", "[SqlDataBinder]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE shapes (geometry BLOB)");

    auto expected = SqlBlob {};
    expected.data.resize(3000);
    std::iota(expected.data.begin(), expected.data.end(), uint8_t { 0 });

    stmt.Prepare("INSERT INTO shapes (geometry) VALUES (?)");
    stmt.Execute(expected);

    stmt.ExecuteDirect("SELECT geometry FROM shapes");
    REQUIRE(stmt.FetchRow());
    auto const actual = stmt.GetColumn<SqlBlob>(1);
    CHECK(actual.size() == expected.size());
    CHECK(actual == expected);
    REQUIRE(!stmt.FetchRow());
}

TEST_CASE_METHOD(SqlTestFixture, "std::string_view: bound parameter", "[SqlDataBinder]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE notes (body TEXT)");

    auto const source = std::string("prefix-and-suffix");
    auto const view = std::string_view(source).substr(0, 6);

    stmt.Prepare("INSERT INTO notes (body) VALUES (?)");
    stmt.Execute(view);

    CHECK(stmt.ExecuteDirectScalar<std::string>("SELECT body FROM notes").value_or("") == "prefix");
}

TEST_CASE_METHOD(SqlTestFixture, "primitives: int64 and double", "[SqlDataBinder]")
{
    auto stmt = SqlStatement { database.Connection() };
    stmt.ExecuteDirect("CREATE TABLE numbers (i INTEGER, r REAL)");

    stmt.Prepare("INSERT INTO numbers (i, r) VALUES (?, ?)");
    stmt.Execute(int64_t { 9'007'199'254'740'993 }, 0.25);

    stmt.ExecuteDirect("SELECT i, r FROM numbers");
    REQUIRE(stmt.FetchRow());
    CHECK(stmt.GetColumn<int64_t>(1) == 9'007'199'254'740'993);
    CHECK(stmt.GetColumn<double>(2) == 0.25);
    REQUIRE(!stmt.FetchRow());
}

// NOLINTEND(readability-container-size-empty)
