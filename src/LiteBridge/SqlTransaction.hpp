// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlError.hpp"

#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

class SqlConnection;

// What a transaction does when it goes out of scope while still active.
enum class SqlTransactionMode : std::uint8_t
{
    NONE,
    COMMIT,
    ROLLBACK,
};

// Thrown on transaction state violations, e.g. committing while no transaction is active.
class SqlTransactionException: public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// A scoped transaction on a connection.
//
// Switches the connection out of autocommit mode for its lifetime. Unless committed or rolled back
// explicitly, the default mode is applied on destruction. Transactions do not nest.
class SqlTransaction
{
  public:
    SqlTransaction(SqlTransaction const&) = delete;
    SqlTransaction& operator=(SqlTransaction const&) = delete;
    LITEBRIDGE_API SqlTransaction(SqlTransaction&& other) noexcept;
    LITEBRIDGE_API SqlTransaction& operator=(SqlTransaction&& other) noexcept;

    // @throws SqlTransactionException if the connection is already within a transaction.
    LITEBRIDGE_API explicit SqlTransaction(SqlConnection& connection,
                                           SqlTransactionMode defaultMode = SqlTransactionMode::COMMIT,
                                           std::source_location location = std::source_location::current());

    LITEBRIDGE_API ~SqlTransaction() noexcept;

    // Neither committed nor rolled back yet.
    [[nodiscard]] bool Active() const noexcept
    {
        return m_active;
    }

    // @throws SqlTransactionException if the transaction is no longer active.
    // @throws SqlException if the driver fails to commit.
    LITEBRIDGE_API void Commit();

    // @throws SqlTransactionException if the transaction is no longer active.
    // @throws SqlException if the driver fails to roll back.
    LITEBRIDGE_API void Rollback();

    // Non-throwing variants. Failures are reported to the logger.
    LITEBRIDGE_API bool TryCommit() noexcept;
    LITEBRIDGE_API bool TryRollback() noexcept;

  private:
    void ApplyDefaultMode() noexcept;
    std::optional<SqlErrorInfo> End(SQLSMALLINT completionType) noexcept;
    bool TryEnd(SQLSMALLINT completionType) noexcept;
    void EndOrThrow(SQLSMALLINT completionType);

    SQLHDBC m_hDbc {};
    SqlTransactionMode m_defaultMode = SqlTransactionMode::NONE;
    bool m_active = false;
    std::source_location m_location;
};
