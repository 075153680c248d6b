// SPDX-License-Identifier: Apache-2.0

#include "SqlDatabase.hpp"
#include "SqlLogger.hpp"

#include <format>
#include <system_error>

SqlDatabase::SqlDatabase(SqlDatabase&& other) noexcept:
    m_path { std::move(other.m_path) },
    m_connection { std::move(other.m_connection) },
    m_transaction { std::move(other.m_transaction) }
{
    other.m_connection.reset();
    other.m_transaction.reset();
}

SqlDatabase& SqlDatabase::operator=(SqlDatabase&& other) noexcept
{
    if (this == &other)
        return *this;

    Close();

    m_path = std::move(other.m_path);
    m_connection = std::move(other.m_connection);
    m_transaction = std::move(other.m_transaction);

    other.m_connection.reset();
    other.m_transaction.reset();

    return *this;
}

SqlDatabase::~SqlDatabase() noexcept
{
    Close();
}

void SqlDatabase::Open(std::filesystem::path const& path, SqlDatabaseOptions const& options)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        if (!options.createIfMissing)
            throw SqlOpenException(std::format("Database file does not exist: {}", path.string()));

        SqlLogger::GetLogger().OnInfo(std::format("Creating database: {}", path.string()));
    }

    Open(options.ToConnectionString(path));
    m_path = path;
}

void SqlDatabase::Open(SqlConnectionString const& connectionString)
{
    Close();

    auto connection = SqlConnection { std::nullopt };
    if (!connection.Connect(connectionString))
    {
        auto const errorInfo = connection.LastError();
        throw SqlOpenException(
            std::format("Failed to open database ({}): {}", connectionString.Sanitized(), errorInfo));
    }

    m_connection.emplace(std::move(connection));
}

void SqlDatabase::Close() noexcept
{
    if (m_transaction)
    {
        if (m_transaction->Active() && !m_transaction->TryRollback())
            SqlLogger::GetLogger().OnWarning("Failed to roll back the active transaction while closing the database.");
        m_transaction.reset();
    }

    if (m_connection)
    {
        m_connection->Close();
        m_connection.reset();
    }

    m_path.clear();
}

SqlConnection& SqlDatabase::Connection()
{
    if (!m_connection)
        throw std::system_error(make_error_code(SqlError::DATABASE_CLOSED));

    return *m_connection;
}

void SqlDatabase::BeginTransaction(std::source_location location)
{
    if (TransactionActive())
        throw SqlTransactionException("cannot start a transaction within a transaction");

    m_transaction.reset();
    m_transaction.emplace(Connection(), SqlTransactionMode::ROLLBACK, location);
}

void SqlDatabase::CommitTransaction()
{
    if (!TransactionActive())
        throw SqlTransactionException("cannot commit - no transaction is active");

    m_transaction->Commit();
    m_transaction.reset();
}

void SqlDatabase::RollbackTransaction()
{
    if (!TransactionActive())
        throw SqlTransactionException("cannot rollback - no transaction is active");

    m_transaction->Rollback();
    m_transaction.reset();
}
