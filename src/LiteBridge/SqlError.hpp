// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <system_error>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

/// Diagnostic record of the most recent failing ODBC call on a connection or statement handle.
struct SqlErrorInfo
{
    SQLINTEGER nativeErrorCode {};
    std::string sqlState;
    std::string message;

    LITEBRIDGE_API static SqlErrorInfo fromConnectionHandle(SQLHDBC hDbc);
    LITEBRIDGE_API static SqlErrorInfo fromStatementHandle(SQLHSTMT hStmt);

    /// Reads the first diagnostic record of the given handle. All fields stay empty if there is none.
    LITEBRIDGE_API static SqlErrorInfo fromHandle(SQLSMALLINT handleType, SQLHANDLE handle);
};

/// Thrown when an ODBC call fails. Carries the driver's diagnostic record.
class LITEBRIDGE_API SqlException: public std::runtime_error
{
  public:
    explicit SqlException(SqlErrorInfo info);

    [[nodiscard]] SqlErrorInfo const& info() const noexcept
    {
        return _info;
    }

  private:
    SqlErrorInfo _info;
};

/// Thrown when a database file cannot be opened or created.
class SqlOpenException: public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// ODBC return codes, extended by the failures LiteBridge itself detects.
enum class SqlError : std::int16_t
{
    SUCCESS = SQL_SUCCESS,
    SUCCESS_WITH_INFO = SQL_SUCCESS_WITH_INFO,
    NODATA = SQL_NO_DATA,
    FAILURE = SQL_ERROR,
    INVALID_HANDLE = SQL_INVALID_HANDLE,
    UNSUPPORTED_TYPE = 1'000,
    INVALID_ARGUMENT = 1'001,
    DATABASE_CLOSED = 1'002,
    NO_ACTIVE_TRANSACTION = 1'003,
};

struct LITEBRIDGE_API SqlErrorCategory final: std::error_category
{
    static SqlErrorCategory const& get() noexcept;

    [[nodiscard]] char const* name() const noexcept override
    {
        return "LiteBridge";
    }

    [[nodiscard]] std::string message(int code) const override;
};

template <>
struct std::is_error_code_enum<SqlError>: public std::true_type
{
};

inline std::error_code make_error_code(SqlError e)
{
    return { static_cast<int>(e), SqlErrorCategory::get() };
}

template <>
struct std::formatter<SqlError>: formatter<std::string>
{
    auto format(SqlError value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(SqlErrorCategory::get().message(static_cast<int>(value)), ctx);
    }
};

template <>
struct std::formatter<SqlErrorInfo>: formatter<std::string>
{
    auto format(SqlErrorInfo const& info, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(
            std::format("{} ({}) - {}", info.sqlState, info.nativeErrorCode, info.message), ctx);
    }
};
