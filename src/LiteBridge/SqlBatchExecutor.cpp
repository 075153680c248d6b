// SPDX-License-Identifier: Apache-2.0

#include "SqlBatchExecutor.hpp"
#include "SqlDatabase.hpp"
#include "SqlLogger.hpp"
#include "SqlResultSetMarshaller.hpp"
#include "SqlStatement.hpp"
#include "SqlStatementKind.hpp"

#include <stdexcept>

namespace
{

// Runs the request's statement, prepared when it carries parameters and directly otherwise.
void RunStatement(SqlStatement& stmt, SqlStatementRequest const& request)
{
    if (request.parameters.has_value() && !request.parameters->empty())
    {
        stmt.Prepare(request.query);
        stmt.ExecuteWithVariants(*request.parameters);
    }
    else
    {
        stmt.ExecuteDirect(request.query);
    }
}

} // namespace

std::expected<SqlBatchResult, SqlBatchError> SqlBatchExecutor::Execute(std::span<SqlStatementRequest const> requests)
{
    if (!m_database->IsOpen())
    {
        SqlLogger::GetLogger().OnError(SqlError::DATABASE_CLOSED);
        return std::unexpected(SqlBatchError {
            .code = SqlError::DATABASE_CLOSED,
            .message = SqlErrorCategory::get().message(static_cast<int>(SqlError::DATABASE_CLOSED)),
        });
    }

    SqlLogger::GetLogger().OnExecuteBatch(requests.size());

    SqlBatchResult result;
    result.entries.reserve(requests.size());
    for (auto const& request: requests)
        result.entries.emplace_back(SqlBatchEntry { .id = request.id, .outcome = ExecuteStatement(request) });

    return result;
}

SqlStatementOutcome SqlBatchExecutor::ExecuteStatement(SqlStatementRequest const& request)
{
    auto const fail = [&](std::string message) -> SqlStatementOutcome {
        SqlLogger::GetLogger().OnBatchStatementFailed(request.id, message);
        return SqlStatementError { .message = std::move(message) };
    };

    try
    {
        return Dispatch(request);
    }
    catch (SqlException const& e)
    {
        return fail(e.info().message.empty() ? std::string(e.what()) : e.info().message);
    }
    catch (std::exception const& e)
    {
        return fail(e.what());
    }
}

SqlStatementOutcome SqlBatchExecutor::Dispatch(SqlStatementRequest const& request)
{
    switch (ClassifyStatement(request.query))
    {
        case SqlStatementKind::Begin:
            m_database->BeginTransaction();
            return SqlEmptyResult {};
        case SqlStatementKind::Commit:
            m_database->CommitTransaction();
            return SqlEmptyResult {};
        case SqlStatementKind::Rollback:
            m_database->RollbackTransaction();
            return SqlEmptyResult {};
        case SqlStatementKind::Update:
        case SqlStatementKind::Delete: {
            auto stmt = SqlStatement { m_database->Connection() };
            RunStatement(stmt, request);
            return SqlAffectedCount { .rowsAffected = stmt.NumRowsAffected() };
        }
        case SqlStatementKind::Insert: {
            auto stmt = SqlStatement { m_database->Connection() };
            RunStatement(stmt, request);
            auto const rowsAffected = stmt.NumRowsAffected();
            return SqlInsertResult { .rowsAffected = rowsAffected, .insertId = stmt.LastInsertId() };
        }
        case SqlStatementKind::RawQuery:
            break;
    }

    auto stmt = SqlStatement { m_database->Connection() };
    RunStatement(stmt, request);
    return ReadRowSet(stmt);
}
