// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlTransaction.hpp"

#include <utility>

namespace
{

SQLRETURN SetAutocommit(SQLHDBC hDbc, bool enabled) noexcept
{
    auto const mode = enabled ? SQL_AUTOCOMMIT_ON : SQL_AUTOCOMMIT_OFF;
    return SQLSetConnectAttr(hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) (uintptr_t) mode, SQL_IS_UINTEGER);
}

} // namespace

SqlTransaction::SqlTransaction(SqlConnection& connection,
                               SqlTransactionMode defaultMode,
                               std::source_location location):
    m_hDbc { connection.NativeHandle() },
    m_defaultMode { defaultMode },
    m_location { location }
{
    if (connection.TransactionActive())
        throw SqlTransactionException("cannot start a transaction within a transaction");

    connection.RequireSuccess(SetAutocommit(m_hDbc, false), m_location);
    m_active = true;
}

SqlTransaction::SqlTransaction(SqlTransaction&& other) noexcept:
    m_hDbc { std::exchange(other.m_hDbc, SQL_NULL_HDBC) },
    m_defaultMode { other.m_defaultMode },
    m_active { std::exchange(other.m_active, false) },
    m_location { other.m_location }
{
}

SqlTransaction& SqlTransaction::operator=(SqlTransaction&& other) noexcept
{
    if (this == &other)
        return *this;

    ApplyDefaultMode();

    m_hDbc = std::exchange(other.m_hDbc, SQL_NULL_HDBC);
    m_defaultMode = other.m_defaultMode;
    m_active = std::exchange(other.m_active, false);
    m_location = other.m_location;
    return *this;
}

SqlTransaction::~SqlTransaction() noexcept
{
    ApplyDefaultMode();
}

void SqlTransaction::ApplyDefaultMode() noexcept
{
    if (!m_active)
        return;

    switch (m_defaultMode)
    {
        case SqlTransactionMode::NONE:
            break;
        case SqlTransactionMode::COMMIT:
            TryCommit();
            break;
        case SqlTransactionMode::ROLLBACK:
            TryRollback();
            break;
    }
}

std::optional<SqlErrorInfo> SqlTransaction::End(SQLSMALLINT completionType) noexcept
{
    if (!SQL_SUCCEEDED(SQLEndTran(SQL_HANDLE_DBC, m_hDbc, completionType)))
        return SqlErrorInfo::fromConnectionHandle(m_hDbc);

    // The transaction is over, even if the connection cannot be switched back to autocommit.
    m_active = false;

    if (!SQL_SUCCEEDED(SetAutocommit(m_hDbc, true)))
        return SqlErrorInfo::fromConnectionHandle(m_hDbc);

    return std::nullopt;
}

bool SqlTransaction::TryEnd(SQLSMALLINT completionType) noexcept
{
    if (!m_active)
        return false;

    auto const error = End(completionType);
    if (error)
        SqlLogger::GetLogger().OnError(*error, m_location);
    return !error;
}

void SqlTransaction::EndOrThrow(SQLSMALLINT completionType)
{
    if (auto error = End(completionType))
    {
        SqlLogger::GetLogger().OnError(*error, m_location);
        throw SqlException(std::move(*error));
    }
}

bool SqlTransaction::TryCommit() noexcept
{
    return TryEnd(SQL_COMMIT);
}

bool SqlTransaction::TryRollback() noexcept
{
    return TryEnd(SQL_ROLLBACK);
}

void SqlTransaction::Commit()
{
    if (!m_active)
        throw SqlTransactionException("cannot commit - no transaction is active");

    EndOrThrow(SQL_COMMIT);
}

void SqlTransaction::Rollback()
{
    if (!m_active)
        throw SqlTransactionException("cannot rollback - no transaction is active");

    EndOrThrow(SQL_ROLLBACK);
}
