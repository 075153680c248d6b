// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "BasicStringBinder.hpp"
#include "Core.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>

template <>
struct SqlDataBinder<std::string>
{
    static LITEBRIDGE_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                            SQLUSMALLINT column,
                                                            std::string const& value,
                                                            SqlDataBinderCallback& /*cb*/) noexcept
    {
        // The string is NUL-terminated, so no length indicator is needed.
        return SQLBindParameter(stmt,
                                column,
                                SQL_PARAM_INPUT,
                                SQL_C_CHAR,
                                SQL_VARCHAR,
                                (std::max)(value.size(), size_t { 1 }),
                                0,
                                (SQLPOINTER) value.c_str(),
                                static_cast<SQLLEN>(value.size() + 1),
                                nullptr);
    }

    static LITEBRIDGE_FORCE_INLINE SQLRETURN GetColumn(SQLHSTMT stmt,
                                                       SQLUSMALLINT column,
                                                       std::string* result,
                                                       SQLLEN* indicator,
                                                       SqlDataBinderCallback const& /*cb*/) noexcept
    {
        return detail::GetLongColumnData<SQL_C_CHAR>(stmt, column, result, indicator);
    }

    static LITEBRIDGE_FORCE_INLINE std::string_view Inspect(std::string const& value) noexcept
    {
        return value;
    }
};

template <>
struct SqlDataBinder<std::string_view>
{
    static LITEBRIDGE_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                            SQLUSMALLINT column,
                                                            std::string_view value,
                                                            SqlDataBinderCallback& cb) noexcept
    {
        // A string view is not necessarily NUL-terminated, so its length must be passed explicitly.
        auto length = std::make_shared<SQLLEN>(static_cast<SQLLEN>(value.size()));
        cb.PlanPostExecuteCallback([length] {}); // Keep the indicator alive
        return SQLBindParameter(stmt,
                                column,
                                SQL_PARAM_INPUT,
                                SQL_C_CHAR,
                                SQL_VARCHAR,
                                (std::max)(value.size(), size_t { 1 }),
                                0,
                                (SQLPOINTER) value.data(),
                                static_cast<SQLLEN>(value.size()),
                                length.get());
    }

    static LITEBRIDGE_FORCE_INLINE std::string_view Inspect(std::string_view value) noexcept
    {
        return value;
    }
};
