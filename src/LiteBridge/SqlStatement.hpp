// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnection.hpp"
#include "SqlDataBinder.hpp"
#include "Utils.hpp"

#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

class SqlResultCursor;

// One ODBC statement handle on a connection.
//
// A statement is either executed directly (ExecuteDirect) or prepared once and executed with
// positional input parameters (Prepare + Execute / ExecuteWithVariants). A statement yielding a
// result set must have its cursor closed before the handle is reused; SqlResultCursor does that.
class SqlStatement final: public SqlDataBinderCallback
{
  public:
    LITEBRIDGE_API explicit SqlStatement(SqlConnection& connection);

    LITEBRIDGE_API SqlStatement(SqlStatement&& other) noexcept;
    LITEBRIDGE_API SqlStatement& operator=(SqlStatement&& other) noexcept;
    SqlStatement(SqlStatement const&) = delete;
    SqlStatement& operator=(SqlStatement const&) = delete;

    LITEBRIDGE_API ~SqlStatement() noexcept final;

    [[nodiscard]] bool IsAlive() const noexcept
    {
        return m_connection && m_connection->IsAlive() && m_hStmt != SQL_NULL_HSTMT;
    }

    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return *m_connection;
    }

    [[nodiscard]] SqlConnection const& Connection() const noexcept
    {
        return *m_connection;
    }

    // Diagnostics of the most recent failing call on this statement handle.
    [[nodiscard]] SqlErrorInfo LastError() const
    {
        return SqlErrorInfo::fromStatementHandle(m_hStmt);
    }

    [[nodiscard]] SQLHSTMT NativeHandle() const noexcept
    {
        return m_hStmt;
    }

    // Prepares the query for execution, dropping parameters bound for a previous query.
    LITEBRIDGE_API void Prepare(std::string_view query);

    [[nodiscard]] std::string const& PreparedQuery() const noexcept
    {
        return m_preparedQuery;
    }

    // Binds the arguments positionally to the prepared query and executes it.
    //
    // @throws std::invalid_argument if the argument count differs from the query's placeholder count.
    template <SqlInputParameterBinder... Args>
    void Execute(Args const&... args);

    // Same as Execute(), with the arguments only known at runtime.
    LITEBRIDGE_API void ExecuteWithVariants(std::vector<SqlVariant> const& args);

    LITEBRIDGE_API void ExecuteDirect(std::string_view const& query,
                                      std::source_location location = std::source_location::current());

    // Executes the query and returns the first column of its first row, or std::nullopt if the query
    // yields no row or a NULL value.
    template <typename T>
    [[nodiscard]] std::optional<T> ExecuteDirectScalar(std::string_view const& query,
                                                       std::source_location location = std::source_location::current());

    // Rows changed by the last INSERT, UPDATE or DELETE. Drivers reporting "unknown" yield 0.
    [[nodiscard]] LITEBRIDGE_API size_t NumRowsAffected() const;

    // Columns of the current result set, 0 for statements without one.
    [[nodiscard]] LITEBRIDGE_API size_t NumColumnsAffected() const;

    // Label of the given result column (1-based), as reported by the driver.
    [[nodiscard]] LITEBRIDGE_API std::string ColumnName(SQLUSMALLINT column) const;

    // Rowid of the most recent successful insert on this statement's connection.
    [[nodiscard]] LITEBRIDGE_API int64_t LastInsertId();

    // Advances to the next row. Returns false, closing the cursor, once the result set is exhausted.
    [[nodiscard]] LITEBRIDGE_API bool FetchRow();

    LITEBRIDGE_API void CloseCursor() noexcept;

    [[nodiscard]] SqlResultCursor GetResultCursor() noexcept;

    // Reads a column of the current row.
    //
    // @throws std::runtime_error if the value is NULL, unless T is SqlVariant.
    template <SqlGetColumnNativeType T>
    [[nodiscard]] T GetColumn(SQLUSMALLINT column) const;

    template <SqlGetColumnNativeType T>
    [[nodiscard]] std::optional<T> GetNullableColumn(SQLUSMALLINT column) const;

  private:
    LITEBRIDGE_API void RequireSuccess(SQLRETURN error,
                                       std::source_location sourceLocation = std::source_location::current()) const;
    LITEBRIDGE_API void RequireParameterCount(size_t count) const;
    LITEBRIDGE_API void PlanPostExecuteCallback(std::function<void()>&& cb) override;
    LITEBRIDGE_API void ProcessPostExecuteCallbacks();

    SqlConnection* m_connection {};
    SQLHSTMT m_hStmt {};
    std::string m_preparedQuery;
    SQLSMALLINT m_expectedParameterCount {};

    // Deferred work of the data binders, e.g. copying long values out of their transfer buffers.
    std::vector<std::function<void()>> m_postExecuteCallbacks;
};

// Scoped reader over the result set of an executed statement.
//
// The cursor is closed when this object goes out of scope, also when reading a column throws.
class [[nodiscard]] SqlResultCursor
{
  public:
    explicit LITEBRIDGE_FORCE_INLINE SqlResultCursor(SqlStatement& stmt) noexcept:
        m_stmt { &stmt }
    {
    }

    SqlResultCursor(SqlResultCursor const&) = delete;
    SqlResultCursor& operator=(SqlResultCursor const&) = delete;
    SqlResultCursor(SqlResultCursor&&) = delete;
    SqlResultCursor& operator=(SqlResultCursor&&) = delete;

    LITEBRIDGE_FORCE_INLINE ~SqlResultCursor()
    {
        m_stmt->CloseCursor();
    }

    [[nodiscard]] size_t ColumnCount() const
    {
        return m_stmt->NumColumnsAffected();
    }

    [[nodiscard]] std::string ColumnName(SQLUSMALLINT column) const
    {
        return m_stmt->ColumnName(column);
    }

    [[nodiscard]] bool FetchRow()
    {
        return m_stmt->FetchRow();
    }

    template <SqlGetColumnNativeType T>
    [[nodiscard]] T GetColumn(SQLUSMALLINT column) const
    {
        return m_stmt->GetColumn<T>(column);
    }

    template <SqlGetColumnNativeType T>
    [[nodiscard]] std::optional<T> GetNullableColumn(SQLUSMALLINT column) const
    {
        return m_stmt->GetNullableColumn<T>(column);
    }

  private:
    SqlStatement* m_stmt;
};

inline SqlResultCursor SqlStatement::GetResultCursor() noexcept
{
    return SqlResultCursor(*this);
}

template <SqlInputParameterBinder... Args>
void SqlStatement::Execute(Args const&... args)
{
    // The bound arguments are referenced, not copied, so they must outlive SQLExecute().
    SqlLogger::GetLogger().OnExecute(m_preparedQuery);
    RequireParameterCount(sizeof...(args));

    SQLUSMALLINT position = 0;
    auto const bind = [&]<typename T>(T const& arg) {
        ++position;
        SqlLogger::GetLogger().OnBindInputParameter({}, arg);
        RequireSuccess(SqlDataBinder<T>::InputParameter(m_hStmt, position, arg, *this));
    };
    (bind(args), ...);

    auto const sqlResult = SQLExecute(m_hStmt);
    if (sqlResult != SQL_NO_DATA)
        RequireSuccess(sqlResult);
    ProcessPostExecuteCallbacks();
}

template <SqlGetColumnNativeType T>
T SqlStatement::GetColumn(SQLUSMALLINT column) const
{
    auto result = T {};
    auto indicator = SQLLEN {};
    RequireSuccess(SqlDataBinder<T>::GetColumn(m_hStmt, column, &result, &indicator, *this));
    if constexpr (!std::same_as<T, SqlVariant>)
    {
        if (indicator == SQL_NULL_DATA)
            throw std::runtime_error { std::format("Column {} is NULL", column) };
    }
    return result;
}

template <SqlGetColumnNativeType T>
std::optional<T> SqlStatement::GetNullableColumn(SQLUSMALLINT column) const
{
    auto result = T {};
    auto indicator = SQLLEN {};
    RequireSuccess(SqlDataBinder<T>::GetColumn(m_hStmt, column, &result, &indicator, *this));
    if (indicator == SQL_NULL_DATA)
        return std::nullopt;
    return { std::move(result) };
}

template <typename T>
std::optional<T> SqlStatement::ExecuteDirectScalar(std::string_view const& query, std::source_location location)
{
    auto const _ = detail::Finally([this] { CloseCursor(); });
    ExecuteDirect(query, location);
    if (!FetchRow())
        return std::nullopt;
    return GetNullableColumn<T>(1);
}
