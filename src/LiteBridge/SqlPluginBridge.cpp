// SPDX-License-Identifier: Apache-2.0

#include "SqlBatchExecutor.hpp"
#include "SqlBatchJson.hpp"
#include "SqlLogger.hpp"
#include "SqlPluginBridge.hpp"

#include <stdexcept>
#include <vector>

void SqlPluginBridge::Open(std::filesystem::path const& path, SqlDatabaseOptions const& options)
{
    m_database.Open(path, options);
}

void SqlPluginBridge::Open(SqlConnectionString const& connectionString)
{
    m_database.Open(connectionString);
}

void SqlPluginBridge::Close() noexcept
{
    m_database.Close();
}

void SqlPluginBridge::ExecuteSqlBatch(nlohmann::json const& queries,
                                      nlohmann::json const& params,
                                      nlohmann::json const& ids,
                                      SqlResultChannel& channel)
{
    std::vector<SqlStatementRequest> requests;
    try
    {
        requests = MakeBatchRequest(queries, params, ids);
    }
    catch (std::invalid_argument const& e)
    {
        SqlLogger::GetLogger().OnWarning(e.what());
        channel.Error(e.what());
        return;
    }

    auto const result = SqlBatchExecutor { m_database }.Execute(requests);
    if (!result)
    {
        channel.Error(result.error().message);
        return;
    }

    channel.Success(ToJson(*result));
}
