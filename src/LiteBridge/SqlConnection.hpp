// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlError.hpp"
#include "SqlLogger.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <source_location>
#include <string>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// An ODBC connection, owning its environment and connection handles.
///
/// A freshly connected connection runs in autocommit mode. A transaction is active while autocommit
/// is switched off (see SqlTransaction).
class LITEBRIDGE_API SqlConnection final
{
  public:
    /// Connects to the process-wide default connection string.
    ///
    /// Failure to connect is not an exception. Check IsAlive() and LastError().
    SqlConnection();

    /// Connects to the given connection string, or only allocates the handles if there is none.
    explicit SqlConnection(std::optional<SqlConnectionString> connectionString);

    SqlConnection(SqlConnection&& other) noexcept;
    SqlConnection& operator=(SqlConnection&& other) noexcept;
    SqlConnection(SqlConnection const&) = delete;
    SqlConnection& operator=(SqlConnection const&) = delete;

    ~SqlConnection() noexcept;

    static SqlConnectionString const& DefaultConnectionString() noexcept;
    static void SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept;

    /// Installs a callback that runs after every successful connect, e.g. to enable ODBC tracing.
    static void SetPostConnectedHook(std::function<void(SqlConnection&)> hook);
    static void ResetPostConnectedHook();

    /// Process-unique number of this connection, for log output. Moving keeps the id.
    [[nodiscard]] uint64_t ConnectionId() const noexcept
    {
        return m_connectionId;
    }

    /// Connects to the database addressed by the given connection string, dropping an existing
    /// connection first.
    ///
    /// @retval false if connecting failed. LastError() has the driver diagnostics.
    bool Connect(SqlConnectionString connectionString) noexcept;

    /// Disconnects and releases the native handles. Does nothing if already closed.
    void Close() noexcept;

    [[nodiscard]] SqlErrorInfo LastError() const;

    /// DBMS name reported by the driver, e.g. "SQLite".
    [[nodiscard]] std::string ServerName() const;

    [[nodiscard]] std::string ServerVersion() const;

    [[nodiscard]] bool TransactionActive() const noexcept;

    [[nodiscard]] bool IsAlive() const noexcept;

    [[nodiscard]] SqlConnectionString const& ConnectionString() const noexcept
    {
        return m_connectionString;
    }

    [[nodiscard]] SQLHDBC NativeHandle() const noexcept
    {
        return m_hDbc;
    }

    /// Throws SqlException with the connection's diagnostics if the ODBC call did not succeed.
    void RequireSuccess(SQLRETURN sqlResult,
                        std::source_location sourceLocation = std::source_location::current()) const;

  private:
    bool AllocateHandles() noexcept;
    bool PostConnect() noexcept;
    [[nodiscard]] std::string GetInfoString(SQLUSMALLINT infoType) const;

    SQLHENV m_hEnv {};
    SQLHDBC m_hDbc {};
    bool m_connected = false;
    uint64_t m_connectionId;
    SqlConnectionString m_connectionString;
};
