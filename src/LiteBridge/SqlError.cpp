// SPDX-License-Identifier: Apache-2.0

#include "SqlError.hpp"

#include <algorithm>
#include <array>
#include <utility>

SqlErrorInfo SqlErrorInfo::fromConnectionHandle(SQLHDBC hDbc)
{
    return fromHandle(SQL_HANDLE_DBC, hDbc);
}

SqlErrorInfo SqlErrorInfo::fromStatementHandle(SQLHSTMT hStmt)
{
    return fromHandle(SQL_HANDLE_STMT, hStmt);
}

SqlErrorInfo SqlErrorInfo::fromHandle(SQLSMALLINT handleType, SQLHANDLE handle)
{
    auto info = SqlErrorInfo {};
    if (handle == SQL_NULL_HANDLE)
        return info;

    auto state = std::array<SQLCHAR, SQL_SQLSTATE_SIZE + 1> {};
    auto text = std::string(SQL_MAX_MESSAGE_LENGTH, '\0');
    auto textLength = SQLSMALLINT {};

    auto const sqlResult = SQLGetDiagRecA(handleType,
                                          handle,
                                          1,
                                          state.data(),
                                          &info.nativeErrorCode,
                                          (SQLCHAR*) text.data(),
                                          (SQLSMALLINT) text.size(),
                                          &textLength);
    if (!SQL_SUCCEEDED(sqlResult))
        return info;

    info.sqlState.assign(reinterpret_cast<char const*>(state.data()), SQL_SQLSTATE_SIZE);
    text.resize(std::clamp(static_cast<size_t>(textLength), size_t { 0 }, text.size() - 1));
    info.message = std::move(text);
    return info;
}

SqlException::SqlException(SqlErrorInfo info):
    std::runtime_error(info.message.empty() ? std::format("{}", info) : info.message),
    _info { std::move(info) }
{
}

SqlErrorCategory const& SqlErrorCategory::get() noexcept
{
    static SqlErrorCategory const category;
    return category;
}

std::string SqlErrorCategory::message(int code) const
{
    switch (static_cast<SqlError>(code))
    {
        case SqlError::SUCCESS:
            return "SQL_SUCCESS";
        case SqlError::SUCCESS_WITH_INFO:
            return "SQL_SUCCESS_WITH_INFO";
        case SqlError::NODATA:
            return "SQL_NO_DATA";
        case SqlError::FAILURE:
            return "SQL_ERROR";
        case SqlError::INVALID_HANDLE:
            return "SQL_INVALID_HANDLE";
        case SqlError::UNSUPPORTED_TYPE:
            return "unsupported column type";
        case SqlError::INVALID_ARGUMENT:
            return "invalid argument";
        case SqlError::DATABASE_CLOSED:
            return "database has been closed";
        case SqlError::NO_ACTIVE_TRANSACTION:
            return "no transaction is active";
    }
    return std::format("SQL error code {}", code);
}
