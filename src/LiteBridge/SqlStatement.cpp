// SPDX-License-Identifier: Apache-2.0

#include "SqlStatement.hpp"

#include <ranges>
#include <utility>

namespace
{

// A searched UPDATE or DELETE that matches no rows reports SQL_NO_DATA rather than SQL_SUCCESS.
constexpr bool ExecutionSucceeded(SQLRETURN sqlResult) noexcept
{
    return SQL_SUCCEEDED(sqlResult) || sqlResult == SQL_NO_DATA;
}

constexpr SQLSMALLINT InitialColumnNameLength = 128;

} // namespace

SqlStatement::SqlStatement(SqlConnection& connection):
    m_connection { &connection }
{
    m_connection->RequireSuccess(SQLAllocHandle(SQL_HANDLE_STMT, m_connection->NativeHandle(), &m_hStmt));
}

SqlStatement::SqlStatement(SqlStatement&& other) noexcept:
    m_connection { std::exchange(other.m_connection, nullptr) },
    m_hStmt { std::exchange(other.m_hStmt, SQL_NULL_HSTMT) },
    m_preparedQuery { std::move(other.m_preparedQuery) },
    m_expectedParameterCount { other.m_expectedParameterCount },
    m_postExecuteCallbacks { std::move(other.m_postExecuteCallbacks) }
{
}

SqlStatement& SqlStatement::operator=(SqlStatement&& other) noexcept
{
    if (this == &other)
        return *this;

    if (m_hStmt != SQL_NULL_HSTMT)
        SQLFreeHandle(SQL_HANDLE_STMT, m_hStmt);

    m_connection = std::exchange(other.m_connection, nullptr);
    m_hStmt = std::exchange(other.m_hStmt, SQL_NULL_HSTMT);
    m_preparedQuery = std::move(other.m_preparedQuery);
    m_expectedParameterCount = other.m_expectedParameterCount;
    m_postExecuteCallbacks = std::move(other.m_postExecuteCallbacks);
    return *this;
}

SqlStatement::~SqlStatement() noexcept
{
    if (m_hStmt == SQL_NULL_HSTMT)
        return;

    SqlLogger::GetLogger().OnFetchEnd();
    SQLFreeHandle(SQL_HANDLE_STMT, m_hStmt);
}

void SqlStatement::PlanPostExecuteCallback(std::function<void()>&& cb)
{
    m_postExecuteCallbacks.emplace_back(std::move(cb));
}

void SqlStatement::ProcessPostExecuteCallbacks()
{
    auto callbacks = std::exchange(m_postExecuteCallbacks, {});
    for (auto& cb: callbacks)
        cb();
}

void SqlStatement::Prepare(std::string_view query)
{
    SqlLogger::GetLogger().OnPrepare(query);

    m_preparedQuery = std::string(query);
    m_postExecuteCallbacks.clear();

    RequireSuccess(SQLFreeStmt(m_hStmt, SQL_RESET_PARAMS));
    RequireSuccess(SQLPrepareA(m_hStmt, (SQLCHAR*) query.data(), (SQLINTEGER) query.size()));
    RequireSuccess(SQLNumParams(m_hStmt, &m_expectedParameterCount));
}

void SqlStatement::ExecuteDirect(std::string_view const& query, std::source_location location)
{
    if (query.empty())
        return;

    m_preparedQuery.clear();
    SqlLogger::GetLogger().OnExecuteDirect(query);

    // Parameters bound for a previously prepared query must not leak into this one.
    RequireSuccess(SQLFreeStmt(m_hStmt, SQL_RESET_PARAMS), location);

    auto const sqlResult = SQLExecDirectA(m_hStmt, (SQLCHAR*) query.data(), (SQLINTEGER) query.size());
    if (!ExecutionSucceeded(sqlResult))
        RequireSuccess(sqlResult, location);
}

void SqlStatement::ExecuteWithVariants(std::vector<SqlVariant> const& args)
{
    SqlLogger::GetLogger().OnExecute(m_preparedQuery);
    RequireParameterCount(args.size());

    for (auto const& [index, arg]: args | std::views::enumerate)
    {
        auto const position = static_cast<SQLUSMALLINT>(index + 1);
        SqlLogger::GetLogger().OnBindInputParameter({}, arg);
        RequireSuccess(SqlDataBinder<SqlVariant>::InputParameter(m_hStmt, position, arg, *this));
    }

    auto const sqlResult = SQLExecute(m_hStmt);
    if (!ExecutionSucceeded(sqlResult))
        RequireSuccess(sqlResult);
    ProcessPostExecuteCallbacks();
}

size_t SqlStatement::NumRowsAffected() const
{
    auto count = SQLLEN {};
    RequireSuccess(SQLRowCount(m_hStmt, &count));
    return count > 0 ? static_cast<size_t>(count) : 0;
}

size_t SqlStatement::NumColumnsAffected() const
{
    auto count = SQLSMALLINT {};
    RequireSuccess(SQLNumResultCols(m_hStmt, &count));
    return count > 0 ? static_cast<size_t>(count) : 0;
}

std::string SqlStatement::ColumnName(SQLUSMALLINT column) const
{
    auto const describe = [&](std::string& buffer) {
        auto length = SQLSMALLINT {};
        RequireSuccess(SQLColAttributeA(m_hStmt,
                                        column,
                                        SQL_DESC_LABEL,
                                        (SQLPOINTER) buffer.data(),
                                        (SQLSMALLINT) buffer.size(),
                                        &length,
                                        nullptr));
        return static_cast<size_t>(length);
    };

    auto name = std::string(InitialColumnNameLength, '\0');
    auto length = describe(name);
    if (length >= name.size())
    {
        name.resize(length + 1);
        length = describe(name);
    }
    name.resize(length);
    return name;
}

int64_t SqlStatement::LastInsertId()
{
    return ExecuteDirectScalar<int64_t>("SELECT last_insert_rowid()").value_or(0);
}

bool SqlStatement::FetchRow()
{
    auto const sqlResult = SQLFetch(m_hStmt);
    if (sqlResult == SQL_NO_DATA)
    {
        CloseCursor();
        return false;
    }

    RequireSuccess(sqlResult);
    SqlLogger::GetLogger().OnFetchRow();
    return true;
}

void SqlStatement::CloseCursor() noexcept
{
    // Also succeeds when no cursor is open.
    SQLFreeStmt(m_hStmt, SQL_CLOSE);
    SqlLogger::GetLogger().OnFetchEnd();
}

void SqlStatement::RequireParameterCount(size_t count) const
{
    if (count != static_cast<size_t>(m_expectedParameterCount))
        throw std::invalid_argument { std::format(
            "Invalid argument count: statement expects {} but {} were given", m_expectedParameterCount, count) };
}

void SqlStatement::RequireSuccess(SQLRETURN error, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(error))
        return;

    auto errorInfo = LastError();
    SqlLogger::GetLogger().OnError(errorInfo, sourceLocation);

    // 07009: invalid descriptor index, i.e. the caller asked for a column or parameter that does not exist.
    if (errorInfo.sqlState == "07009")
        throw std::invalid_argument(std::format("SQL error: {}", errorInfo));

    throw SqlException(std::move(errorInfo));
}
