// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

namespace
{

SqlConnectionString gDefaultConnectionString {};
std::atomic<uint64_t> gNextConnectionId { 1 };
std::function<void(SqlConnection&)> gPostConnectedHook {};

} // namespace

SqlConnection::SqlConnection():
    SqlConnection { DefaultConnectionString() }
{
}

SqlConnection::SqlConnection(std::optional<SqlConnectionString> connectionString):
    m_connectionId { gNextConnectionId++ }
{
    if (!AllocateHandles())
        return;

    if (connectionString)
        Connect(std::move(*connectionString));
}

SqlConnection::SqlConnection(SqlConnection&& other) noexcept:
    m_hEnv { std::exchange(other.m_hEnv, SQL_NULL_HENV) },
    m_hDbc { std::exchange(other.m_hDbc, SQL_NULL_HDBC) },
    m_connected { std::exchange(other.m_connected, false) },
    m_connectionId { other.m_connectionId },
    m_connectionString { std::move(other.m_connectionString) }
{
}

SqlConnection& SqlConnection::operator=(SqlConnection&& other) noexcept
{
    if (this == &other)
        return *this;

    Close();

    m_hEnv = std::exchange(other.m_hEnv, SQL_NULL_HENV);
    m_hDbc = std::exchange(other.m_hDbc, SQL_NULL_HDBC);
    m_connected = std::exchange(other.m_connected, false);
    m_connectionId = other.m_connectionId;
    m_connectionString = std::move(other.m_connectionString);
    return *this;
}

SqlConnection::~SqlConnection() noexcept
{
    Close();
}

SqlConnectionString const& SqlConnection::DefaultConnectionString() noexcept
{
    return gDefaultConnectionString;
}

void SqlConnection::SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept
{
    gDefaultConnectionString = connectionString;
}

void SqlConnection::SetPostConnectedHook(std::function<void(SqlConnection&)> hook)
{
    gPostConnectedHook = std::move(hook);
}

void SqlConnection::ResetPostConnectedHook()
{
    gPostConnectedHook = {};
}

bool SqlConnection::AllocateHandles() noexcept
{
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &m_hEnv)))
    {
        SqlLogger::GetLogger().OnError(SqlError::FAILURE);
        m_hEnv = SQL_NULL_HENV;
        return false;
    }

    SQLSetEnvAttr(m_hEnv, SQL_ATTR_ODBC_VERSION, (SQLPOINTER) SQL_OV_ODBC3, 0);

    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_DBC, m_hEnv, &m_hDbc)))
    {
        SqlLogger::GetLogger().OnError(SqlErrorInfo::fromHandle(SQL_HANDLE_ENV, m_hEnv));
        SQLFreeHandle(SQL_HANDLE_ENV, m_hEnv);
        m_hEnv = SQL_NULL_HENV;
        m_hDbc = SQL_NULL_HDBC;
        return false;
    }

    return true;
}

bool SqlConnection::Connect(SqlConnectionString connectionString) noexcept
{
    if (m_hDbc == SQL_NULL_HDBC && !AllocateHandles())
        return false;

    if (std::exchange(m_connected, false))
    {
        SqlLogger::GetLogger().OnConnectionClosed(*this);
        SQLDisconnect(m_hDbc);
    }

    m_connectionString = std::move(connectionString);
    auto const& text = m_connectionString.value;

    auto const sqlResult = SQLDriverConnectA(m_hDbc,
                                             (SQLHWND) nullptr,
                                             (SQLCHAR*) text.data(),
                                             (SQLSMALLINT) text.size(),
                                             nullptr,
                                             0,
                                             nullptr,
                                             SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(sqlResult))
    {
        SqlLogger::GetLogger().OnError(LastError());
        return false;
    }

    m_connected = true;
    return PostConnect();
}

bool SqlConnection::PostConnect() noexcept
{
    auto const sqlResult =
        SQLSetConnectAttrA(m_hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) SQL_AUTOCOMMIT_ON, SQL_IS_UINTEGER);
    if (!SQL_SUCCEEDED(sqlResult))
    {
        SqlLogger::GetLogger().OnError(LastError());
        return false;
    }

    SqlLogger::GetLogger().OnConnectionOpened(*this);

    if (gPostConnectedHook)
        gPostConnectedHook(*this);

    return true;
}

void SqlConnection::Close() noexcept
{
    if (m_hDbc == SQL_NULL_HDBC)
        return;

    if (std::exchange(m_connected, false))
    {
        SqlLogger::GetLogger().OnConnectionClosed(*this);
        if (!SQL_SUCCEEDED(SQLDisconnect(m_hDbc)))
            SqlLogger::GetLogger().OnError(LastError());
    }

    SQLFreeHandle(SQL_HANDLE_DBC, std::exchange(m_hDbc, SQL_NULL_HDBC));
    SQLFreeHandle(SQL_HANDLE_ENV, std::exchange(m_hEnv, SQL_NULL_HENV));
}

SqlErrorInfo SqlConnection::LastError() const
{
    return SqlErrorInfo::fromConnectionHandle(m_hDbc);
}

std::string SqlConnection::GetInfoString(SQLUSMALLINT infoType) const
{
    auto text = std::string(128, '\0');
    auto length = SQLSMALLINT {};
    RequireSuccess(SQLGetInfoA(m_hDbc, infoType, (SQLPOINTER) text.data(), (SQLSMALLINT) text.size(), &length));
    text.resize(std::min(static_cast<size_t>(length), text.size() - 1));
    return text;
}

std::string SqlConnection::ServerName() const
{
    return GetInfoString(SQL_DBMS_NAME);
}

std::string SqlConnection::ServerVersion() const
{
    return GetInfoString(SQL_DBMS_VER);
}

bool SqlConnection::TransactionActive() const noexcept
{
    auto autocommit = SQLUINTEGER {};
    auto const sqlResult = SQLGetConnectAttrA(m_hDbc, SQL_ATTR_AUTOCOMMIT, &autocommit, 0, nullptr);
    return SQL_SUCCEEDED(sqlResult) && autocommit == SQL_AUTOCOMMIT_OFF;
}

bool SqlConnection::IsAlive() const noexcept
{
    if (m_hDbc == SQL_NULL_HDBC || !m_connected)
        return false;

    auto dead = SQLUINTEGER {};
    auto const sqlResult = SQLGetConnectAttrA(m_hDbc, SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr);
    return SQL_SUCCEEDED(sqlResult) && dead == SQL_CD_FALSE;
}

void SqlConnection::RequireSuccess(SQLRETURN sqlResult, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(sqlResult))
        return;

    auto errorInfo = LastError();
    SqlLogger::GetLogger().OnError(errorInfo, sourceLocation);
    throw SqlException(std::move(errorInfo));
}
