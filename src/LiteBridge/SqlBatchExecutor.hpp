// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlBatch.hpp"

#include <expected>
#include <span>

class SqlDatabase;

// Executes ordered batches of statements against a database, producing one outcome per statement.
//
// Statements run strictly in order on the database's single connection. A failing statement is
// reported as an error outcome and does not stop the remaining statements.
class SqlBatchExecutor
{
  public:
    explicit SqlBatchExecutor(SqlDatabase& database) noexcept:
        m_database { &database }
    {
    }

    // Executes all requests in order.
    //
    // Fails as a whole, without executing anything, if the database is not open.
    [[nodiscard]] LITEBRIDGE_API std::expected<SqlBatchResult, SqlBatchError> Execute(
        std::span<SqlStatementRequest const> requests);

    // Executes a single request, converting any failure into an error outcome.
    [[nodiscard]] LITEBRIDGE_API SqlStatementOutcome ExecuteStatement(SqlStatementRequest const& request);

  private:
    SqlStatementOutcome Dispatch(SqlStatementRequest const& request);

    SqlDatabase* m_database;
};
