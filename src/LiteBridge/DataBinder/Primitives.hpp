// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Core.hpp"

#include <cstdint>
#include <format>
#include <string>

// Binds fixed-size numbers in place: ODBC reads and writes the C value directly, no buffer involved.
template <typename T, SQLSMALLINT CType, SQLSMALLINT SqlType>
struct SqlFixedSizeDataBinder
{
    static LITEBRIDGE_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                            SQLUSMALLINT column,
                                                            T const& value,
                                                            SqlDataBinderCallback& /*cb*/) noexcept
    {
        auto* const address = const_cast<T*>(&value); // NOLINT(cppcoreguidelines-pro-type-const-cast)
        return SQLBindParameter(stmt, column, SQL_PARAM_INPUT, CType, SqlType, 0, 0, address, sizeof(T), nullptr);
    }

    static LITEBRIDGE_FORCE_INLINE SQLRETURN GetColumn(
        SQLHSTMT stmt, SQLUSMALLINT column, T* result, SQLLEN* indicator, SqlDataBinderCallback const& /*cb*/) noexcept
    {
        return SQLGetData(stmt, column, CType, result, sizeof(T), indicator);
    }

    static std::string Inspect(T value)
    {
        return std::format("{}", value);
    }
};

// clang-format off
template <> struct SqlDataBinder<int32_t>: SqlFixedSizeDataBinder<int32_t, SQL_C_SLONG, SQL_INTEGER> {};
template <> struct SqlDataBinder<int64_t>: SqlFixedSizeDataBinder<int64_t, SQL_C_SBIGINT, SQL_BIGINT> {};
template <> struct SqlDataBinder<double>: SqlFixedSizeDataBinder<double, SQL_C_DOUBLE, SQL_DOUBLE> {};

// int64_t is `long` on LP64 platforms, which leaves `long long` without a binder.
#if !defined(_WIN32) && !defined(__APPLE__)
template <> struct SqlDataBinder<long long>: SqlFixedSizeDataBinder<long long, SQL_C_SBIGINT, SQL_BIGINT> {};
#endif
// clang-format on
