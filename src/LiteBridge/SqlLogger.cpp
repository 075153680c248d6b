// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <format>
#include <optional>
#include <print>
#include <ranges>
#include <string>
#include <utility>
#include <vector>
#include <version>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

namespace
{

// Writes timestamped lines to standard output.
class SqlStandardLogger: public SqlLogger
{
  public:
    explicit SqlStandardLogger(SupportBindLogging supportBindLogging = SupportBindLogging::No):
        SqlLogger { supportBindLogging }
    {
    }

    void OnInfo(std::string_view const& message) noexcept override
    {
        WriteLine("{}", message);
    }

    void OnWarning(std::string_view const& message) noexcept override
    {
        WriteLine("Warning: {}", message);
    }

    void OnError(SqlError error, std::source_location /*sourceLocation*/) noexcept override
    {
        WriteLine("SQL Error: {}", error);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location /*sourceLocation*/) noexcept override
    {
        WriteLine("SQL Error: {}", errorInfo);
    }

    void OnConnectionOpened(SqlConnection const& /*connection*/) noexcept override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) noexcept override {}
    void OnExecuteDirect(std::string_view const& /*query*/) noexcept override {}
    void OnPrepare(std::string_view const& /*query*/) noexcept override {}
    void OnBind(std::string_view const& /*name*/, std::string /*value*/) noexcept override {}
    void OnExecute(std::string_view const& /*query*/) noexcept override {}
    void OnExecuteBatch(std::size_t /*statementCount*/) noexcept override {}

    void OnBatchStatementFailed(std::string_view const& id, std::string_view const& message) noexcept override
    {
        WriteLine("Statement {} failed: {}", id, message);
    }

    void OnFetchRow() noexcept override {}
    void OnFetchEnd() noexcept override {}

  protected:
    template <typename... Args>
    void WriteLine(std::format_string<Args...> const& fmt, Args&&... args) noexcept
    {
        Guarded([&] {
            auto const now =
                std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
            std::println("[{:%F %T}] {}", now, std::format(fmt, std::forward<Args>(args)...));
        });
    }

    // Runs an event handler body. A failure to format or write is reported on stderr, where
    // nothing needs to be allocated, instead of escaping the noexcept event handler.
    template <typename Handler>
    static void Guarded(Handler&& handler) noexcept
    {
        try
        {
            std::forward<Handler>(handler)();
        }
        catch (std::exception const& e)
        {
            std::fputs("LiteBridge: failed to log an event: ", stderr);
            std::fputs(e.what(), stderr);
            std::fputc('\n', stderr);
        }
    }
};

// Additionally traces every statement with its duration, fetched row count and bound parameters.
class SqlTraceLogger final: public SqlStandardLogger
{
  public:
    SqlTraceLogger():
        SqlStandardLogger { SupportBindLogging::Yes }
    {
    }

    void OnError(SqlError error, std::source_location sourceLocation) noexcept override
    {
        SqlStandardLogger::OnError(error, sourceLocation);
        WriteErrorContext(sourceLocation);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) noexcept override
    {
        SqlStandardLogger::OnError(errorInfo, sourceLocation);
        WriteErrorContext(sourceLocation);
    }

    void OnConnectionOpened(SqlConnection const& connection) noexcept override
    {
        Flush();
        WriteLine("Connection {} opened: {}", connection.ConnectionId(), connection.ConnectionString().Sanitized());
    }

    void OnConnectionClosed(SqlConnection const& connection) noexcept override
    {
        Flush();
        WriteLine("Connection {} closed.", connection.ConnectionId());
    }

    void OnPrepare(std::string_view const& query) noexcept override
    {
        Begin(query);
    }

    void OnExecuteDirect(std::string_view const& query) noexcept override
    {
        Begin(query);
    }

    void OnExecute(std::string_view const& query) noexcept override
    {
        // Binds are reported after OnExecute(), so a prepared statement keeps its pending record.
        if (!m_pending || m_pending->query != query)
            Begin(query);
    }

    void OnBind(std::string_view const& name, std::string value) noexcept override
    {
        if (m_pending)
            Guarded([&] { m_pending->binds.emplace_back(name, std::move(value)); });
    }

    void OnExecuteBatch(std::size_t statementCount) noexcept override
    {
        Flush();
        WriteLine("Executing batch of {} {}", statementCount, statementCount == 1 ? "statement" : "statements");
    }

    void OnFetchRow() noexcept override
    {
        if (m_pending)
            ++m_pending->rowCount;
    }

    void OnFetchEnd() noexcept override
    {
        Flush();
    }

  private:
    struct PendingStatement
    {
        std::string query;
        std::vector<std::pair<std::string, std::string>> binds;
        std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
        size_t rowCount = 0;
    };

    void Begin(std::string_view query) noexcept
    {
        Flush();
        Guarded([&] { m_pending = PendingStatement { .query = std::string(query) }; });
    }

    void Flush() noexcept
    {
        if (!m_pending)
            return;

        Guarded([&] { Write(std::exchange(m_pending, std::nullopt).value()); });
    }

    void Write(PendingStatement const& pending)
    {
        auto const elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now()
                                                                                   - pending.startedAt);

        auto line = std::format("[{:.6f}s]", static_cast<double>(elapsed.count()) / 1'000'000.0);
        if (pending.rowCount > 0)
            line += std::format(" [{} {}]", pending.rowCount, pending.rowCount == 1 ? "row" : "rows");
        line += ' ';
        line += pending.query;

        if (!pending.binds.empty())
        {
            line += " WITH [";
            for (auto const& [index, bind]: pending.binds | std::views::enumerate)
            {
                if (index > 0)
                    line += ", ";
                line += bind.first.empty() ? bind.second : std::format("{}={}", bind.first, bind.second);
            }
            line += ']';
        }

        WriteLine("{}", line);
    }

    void WriteErrorContext(std::source_location sourceLocation) noexcept
    {
        WriteLine("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
        if (m_pending)
            WriteLine("  Query: {}", m_pending->query);

#if __has_include(<stacktrace>) && defined(__cpp_lib_stacktrace)
        Guarded([&] {
            auto const stackTrace = std::stacktrace::current(1, 25);
            WriteLine("  Stack trace:");
            for (auto const& [index, entry]: stackTrace | std::views::enumerate)
                WriteLine("    [{:>2}] {}", index, std::to_string(entry));
        });
#endif
    }

    std::optional<PendingStatement> m_pending;
};

SqlLogger* theCurrentLogger = &SqlLogger::NullLogger();

} // namespace

SqlLogger::Null& SqlLogger::NullLogger() noexcept
{
    static SqlLogger::Null theNullLogger {};
    return theNullLogger;
}

SqlLogger& SqlLogger::StandardLogger()
{
    static auto theStandardLogger = SqlStandardLogger {};
    return theStandardLogger;
}

SqlLogger& SqlLogger::TraceLogger()
{
    static auto theTraceLogger = SqlTraceLogger {};
    return theTraceLogger;
}

SqlLogger& SqlLogger::GetLogger()
{
    return *theCurrentLogger;
}

void SqlLogger::SetLogger(SqlLogger& logger)
{
    theCurrentLogger = &logger;
}
