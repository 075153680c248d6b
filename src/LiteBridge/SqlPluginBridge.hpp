// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlConnectInfo.hpp"
#include "SqlDatabase.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

// Response sink of an inbound plugin call. Exactly one of the two functions is invoked per call.
class LITEBRIDGE_API SqlResultChannel
{
  public:
    SqlResultChannel() = default;
    SqlResultChannel(SqlResultChannel&&) = default;
    SqlResultChannel(SqlResultChannel const&) = default;
    SqlResultChannel& operator=(SqlResultChannel&&) = default;
    SqlResultChannel& operator=(SqlResultChannel const&) = default;
    virtual ~SqlResultChannel() = default;

    virtual void Success(nlohmann::json const& result) = 0;
    virtual void Error(std::string_view message) = 0;
};

// Inbound call surface of the host plugin runtime, bound to a single database.
class SqlPluginBridge
{
  public:
    // Opens the database file, creating it if missing.
    //
    // @throws SqlOpenException if the database cannot be opened.
    LITEBRIDGE_API void Open(std::filesystem::path const& path, SqlDatabaseOptions const& options = {});

    // Opens the database addressed by the given connection string.
    LITEBRIDGE_API void Open(SqlConnectionString const& connectionString);

    LITEBRIDGE_API void Close() noexcept;

    [[nodiscard]] bool IsOpen() const noexcept
    {
        return m_database.IsOpen();
    }

    [[nodiscard]] SqlDatabase& Database() noexcept
    {
        return m_database;
    }

    // Executes a batch given as three parallel lists and delivers the aggregated result to the channel.
    //
    // The channel receives Success() with one {"qid", "type", "result"} entry per query, or Error()
    // if the request is malformed or the database is not open.
    LITEBRIDGE_API void ExecuteSqlBatch(nlohmann::json const& queries,
                                        nlohmann::json const& params,
                                        nlohmann::json const& ids,
                                        SqlResultChannel& channel);

  private:
    SqlDatabase m_database;
};
