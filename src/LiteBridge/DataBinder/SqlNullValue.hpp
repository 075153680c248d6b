// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Core.hpp"

#include <string>

// Marker type of the SQL NULL value, both as bound parameter and as column value.
struct SqlNullType
{
    constexpr bool operator==(SqlNullType const& /*other*/) const noexcept
    {
        return true;
    }
};

constexpr auto SqlNullValue = SqlNullType {};

template <>
struct SqlDataBinder<SqlNullType>
{
    static inline SQLLEN nullIndicator = SQL_NULL_DATA;

    static LITEBRIDGE_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                            SQLUSMALLINT column,
                                                            SqlNullType const& /*value*/,
                                                            SqlDataBinderCallback& /*cb*/) noexcept
    {
        // Some drivers reject a zero column size, even for NULL.
        return SQLBindParameter(
            stmt, column, SQL_PARAM_INPUT, SQL_C_CHAR, SQL_VARCHAR, 1, 0, nullptr, 0, &nullIndicator);
    }

    static std::string Inspect(SqlNullType const& /*value*/)
    {
        return "NULL";
    }
};
