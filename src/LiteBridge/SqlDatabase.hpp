// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlTransaction.hpp"

#include <filesystem>
#include <optional>
#include <source_location>

// Owns the connection to a single database file and the transaction that is currently active on it.
//
// The handle has an explicit open, use, close lifecycle. It never reconnects implicitly.
class SqlDatabase
{
  public:
    SqlDatabase() = default;
    SqlDatabase(SqlDatabase const&) = delete;
    SqlDatabase& operator=(SqlDatabase const&) = delete;
    LITEBRIDGE_API SqlDatabase(SqlDatabase&& other) noexcept;
    LITEBRIDGE_API SqlDatabase& operator=(SqlDatabase&& other) noexcept;

    LITEBRIDGE_API ~SqlDatabase() noexcept;

    // Opens (and creates, if missing and allowed by the options) the database file at the given path.
    //
    // A previously opened database is closed first.
    //
    // @throws SqlOpenException if the database cannot be opened.
    LITEBRIDGE_API void Open(std::filesystem::path const& path, SqlDatabaseOptions const& options = {});

    // Opens the database addressed by the given connection string.
    //
    // @throws SqlOpenException if the database cannot be opened.
    LITEBRIDGE_API void Open(SqlConnectionString const& connectionString);

    // Closes the database, rolling back a still active transaction. Does nothing if not open.
    LITEBRIDGE_API void Close() noexcept;

    [[nodiscard]] bool IsOpen() const noexcept
    {
        return m_connection.has_value();
    }

    // The path the database was opened with, empty when opened by connection string.
    [[nodiscard]] std::filesystem::path const& Path() const noexcept
    {
        return m_path;
    }

    // Retrieves the underlying connection.
    //
    // @throws std::system_error with SqlError::DATABASE_CLOSED if the database is not open.
    [[nodiscard]] LITEBRIDGE_API SqlConnection& Connection();

    // Starts a transaction. Throws SqlTransactionException if one is already active.
    LITEBRIDGE_API void BeginTransaction(std::source_location location = std::source_location::current());

    // Commits the active transaction. Throws SqlTransactionException if none is active.
    LITEBRIDGE_API void CommitTransaction();

    // Rolls back the active transaction. Throws SqlTransactionException if none is active.
    LITEBRIDGE_API void RollbackTransaction();

    [[nodiscard]] bool TransactionActive() const noexcept
    {
        return m_transaction.has_value() && m_transaction->Active();
    }

  private:
    std::filesystem::path m_path;
    std::optional<SqlConnection> m_connection;

    // Declared after the connection so that it is rolled back before the connection goes away.
    std::optional<SqlTransaction> m_transaction;
};
