// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlDataBinder.hpp"
#include "SqlError.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// A single statement of a batch, as submitted by the caller.
struct SqlStatementRequest
{
    std::string query;

    // Positional parameters. std::nullopt means the statement is executed without bound parameters.
    std::optional<std::vector<SqlVariant>> parameters;

    // Caller-assigned identifier, echoed back unchanged in the matching batch entry.
    std::string id;
};

// One result row: column name to value, in the order the columns were reported.
//
// Setting a column that already exists replaces its value in place.
class SqlRow
{
  public:
    using value_type = std::pair<std::string, SqlVariant>;
    using const_iterator = std::vector<value_type>::const_iterator;

    void Set(std::string name, SqlVariant value)
    {
        auto const it = std::ranges::find(m_columns, name, &value_type::first);
        if (it != m_columns.end())
            it->second = std::move(value);
        else
            m_columns.emplace_back(std::move(name), std::move(value));
    }

    [[nodiscard]] SqlVariant const* Find(std::string_view name) const noexcept
    {
        auto const it = std::ranges::find(m_columns, name, &value_type::first);
        return it != m_columns.end() ? &it->second : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return m_columns.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_columns.empty();
    }

    [[nodiscard]] const_iterator begin() const noexcept
    {
        return m_columns.begin();
    }

    [[nodiscard]] const_iterator end() const noexcept
    {
        return m_columns.end();
    }

    bool operator==(SqlRow const&) const = default;

  private:
    std::vector<value_type> m_columns;
};

// Rows of a raw query, in cursor order.
struct SqlRowSet
{
    std::vector<SqlRow> rows;
};

// Outcome of an UPDATE or DELETE statement.
struct SqlAffectedCount
{
    size_t rowsAffected {};
};

// Outcome of an INSERT statement.
struct SqlInsertResult
{
    size_t rowsAffected {};
    int64_t insertId {};
};

// Outcome of a transaction control statement.
struct SqlEmptyResult
{
};

// A statement that failed. The batch continues with the next statement.
struct SqlStatementError
{
    std::string message;
};

using SqlStatementOutcome =
    std::variant<SqlRowSet, SqlAffectedCount, SqlInsertResult, SqlEmptyResult, SqlStatementError>;

struct SqlBatchEntry
{
    std::string id;
    SqlStatementOutcome outcome;

    [[nodiscard]] bool Failed() const noexcept
    {
        return std::holds_alternative<SqlStatementError>(outcome);
    }
};

// Outcomes of a batch, one entry per request and in request order.
struct SqlBatchResult
{
    std::vector<SqlBatchEntry> entries;
};

// A failure that prevented the batch from executing at all.
struct SqlBatchError
{
    SqlError code {};
    std::string message;
};
