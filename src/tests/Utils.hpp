// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include <LiteBridge/SqlBatch.hpp>
#include <LiteBridge/SqlConnectInfo.hpp>
#include <LiteBridge/SqlConnection.hpp>
#include <LiteBridge/SqlDataBinder.hpp>
#include <LiteBridge/SqlDatabase.hpp>
#include <LiteBridge/SqlLogger.hpp>
#include <LiteBridge/SqlStatement.hpp>
#include <LiteBridge/SqlStatementKind.hpp>

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <format>
#include <optional>
#include <ostream>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

// In-memory SQLite database through the sqliteodbc driver (http://www.ch-werner.de/sqliteodbc/).
// Every connection to it starts out empty.
auto const inline DefaultTestConnectionString = SqlConnectionString {
    .value = std::format("DRIVER={};Database={}",
#if defined(_WIN32) || defined(_WIN64)
                         "SQLite3 ODBC Driver",
#else
                         "SQLite3",
#endif
                         "file::memory:"),
};

// Routes library events into the Catch2 report of the running test case.
class TestSuiteSqlLogger: public SqlLogger::Null
{
  public:
    static TestSuiteSqlLogger& GetLogger() noexcept
    {
        static TestSuiteSqlLogger theLogger;
        return theLogger;
    }

    void OnInfo(std::string_view const& message) noexcept override
    {
        UNSCOPED_INFO(std::format("[LiteBridge] {}", message));
    }

    void OnWarning(std::string_view const& message) noexcept override
    {
        WARN(message);
    }

    void OnError(SqlError error, std::source_location sourceLocation) noexcept override
    {
        WARN(std::format("SQL Error: {} ({}:{})", error, sourceLocation.file_name(), sourceLocation.line()));
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) noexcept override
    {
        WARN(std::format("SQL Error: {} ({}:{})", errorInfo, sourceLocation.file_name(), sourceLocation.line()));
        if (!m_lastQuery.empty())
            UNSCOPED_INFO(std::format("[LiteBridge] Query: {}", m_lastQuery));
    }

    void OnExecuteDirect(std::string_view const& query) noexcept override
    {
        m_lastQuery = query;
    }

    void OnPrepare(std::string_view const& query) noexcept override
    {
        m_lastQuery = query;
    }

    void OnBatchStatementFailed(std::string_view const& id, std::string_view const& message) noexcept override
    {
        UNSCOPED_INFO(std::format("[LiteBridge] Statement {} failed: {}", id, message));
    }

  private:
    std::string m_lastQuery;
};

// Silences the library for the lifetime of this object, e.g. for tests that provoke errors on purpose.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedSqlNullLogger: public SqlLogger::Null
{
  public:
    ScopedSqlNullLogger()
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedSqlNullLogger() override
    {
        SqlLogger::SetLogger(m_previousLogger);
    }

  private:
    SqlLogger& m_previousLogger = SqlLogger::GetLogger();
};

// Opens the database every test case runs against, with an empty schema.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class SqlTestFixture
{
  public:
    static inline bool odbcTrace = false;

    // Consumes the test suite's own flags and configures the database connection.
    //
    // Returns the exit code if the program is done, or std::nullopt to continue with the Catch2
    // session on the remaining arguments.
    static std::optional<int> Initialize(int& argc, char**& argv)
    {
        using namespace std::string_view_literals;

        auto* logger = static_cast<SqlLogger*>(&TestSuiteSqlLogger::GetLogger());
        auto consumed = 0;
        for (auto i = 1; i < argc; ++i, ++consumed)
        {
            auto const arg = std::string_view(argv[i]);
            if (arg == "--trace-sql"sv)
                logger = &SqlLogger::TraceLogger();
            else if (arg == "--trace-odbc"sv)
                odbcTrace = true;
            else if (arg == "--help"sv || arg == "-h"sv)
            {
                std::println("{} [--trace-sql] [--trace-odbc] [[--] [Catch2 flags ...]]", argv[0]);
                return EXIT_SUCCESS;
            }
            else
            {
                if (arg == "--"sv)
                    ++consumed;
                break;
            }
        }

        if (consumed > 0)
        {
            argv[consumed] = argv[0];
            argv += consumed;
            argc -= consumed;
        }

        auto const* env = std::getenv("ODBC_CONNECTION_STRING");
        auto const connectionString =
            env && *env ? SqlConnectionString { .value = env } : DefaultTestConnectionString;
        std::println("Using ODBC connection string: '{}'", connectionString.Sanitized());
        SqlConnection::SetDefaultConnectionString(connectionString);
        SqlConnection::SetPostConnectedHook(&SqlTestFixture::PostConnectedHook);

        // Events are reported to standard output until the Catch2 session runs.
        SqlLogger::SetLogger(SqlLogger::StandardLogger());
        {
            auto connection = SqlConnection {};
            if (!connection.IsAlive())
            {
                std::println("Failed to connect to the database: {}", connection.LastError());
                return EXIT_FAILURE;
            }
            std::println("Running test cases against: {} {}", connection.ServerName(), connection.ServerVersion());
        }
        SqlLogger::SetLogger(*logger);

        return std::nullopt;
    }

    static void PostConnectedHook(SqlConnection& connection)
    {
#if !defined(_WIN32) && !defined(_WIN64)
        if (odbcTrace)
        {
            SQLHDBC handle = connection.NativeHandle();
            SQLSetConnectAttrA(handle, SQL_ATTR_TRACEFILE, (SQLPOINTER) "/dev/stdout", SQL_NTS);
            SQLSetConnectAttrA(handle, SQL_ATTR_TRACE, (SQLPOINTER) SQL_OPT_TRACE_ON, SQL_IS_UINTEGER);
        }
#else
        (void) connection;
#endif
    }

    SqlTestFixture()
    {
        database.Open(SqlConnection::DefaultConnectionString());
        REQUIRE(database.IsOpen());
        DropAllTables(database.Connection());
    }

    virtual ~SqlTestFixture() = default;

    // A file based database keeps its tables across test cases.
    static void DropAllTables(SqlConnection& connection)
    {
        auto stmt = SqlStatement { connection };

        std::vector<std::string> tableNames;
        stmt.ExecuteDirect("SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%'");
        while (stmt.FetchRow())
            tableNames.emplace_back(stmt.GetColumn<std::string>(1));

        for (auto const& tableName: tableNames)
            stmt.ExecuteDirect(std::format("DROP TABLE IF EXISTS \"{}\"", tableName));
    }

    SqlDatabase database;
};

// {{{ ostream support for LiteBridge, for debugging purposes
inline std::ostream& operator<<(std::ostream& os, SqlVariant const& value)
{
    return os << std::format("SqlVariant {{ {} }}", value);
}

inline std::ostream& operator<<(std::ostream& os, SqlBlob const& value)
{
    return os << std::format("SqlBlob {{ {} bytes }}", value.size());
}

inline std::ostream& operator<<(std::ostream& os, SqlStatementKind value)
{
    return os << std::format("{}", value);
}
// }}}

// Creates the table most batch tests work with.
inline void CreatePeopleTable(SqlConnection& connection,
                              std::source_location sourceLocation = std::source_location::current())
{
    auto stmt = SqlStatement { connection };
    stmt.ExecuteDirect(R"SQL(CREATE TABLE people (
                                 id INTEGER PRIMARY KEY AUTOINCREMENT,
                                 name TEXT NOT NULL,
                                 age INTEGER,
                                 height REAL,
                                 photo BLOB
                             )
                            )SQL",
                       sourceLocation);
}

// Counts the rows of the given table.
inline int64_t CountRows(SqlConnection& connection, std::string_view table)
{
    auto stmt = SqlStatement { connection };
    return stmt.ExecuteDirectScalar<int64_t>(std::format("SELECT COUNT(*) FROM {}", table)).value_or(-1);
}
