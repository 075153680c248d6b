// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "BasicStringBinder.hpp"
#include "Core.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <memory>
#include <vector>

// Raw byte sequence, as stored in BLOB columns (e.g. SpatiaLite geometries).
struct SqlBlob
{
    std::vector<uint8_t> data;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return data.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return data.empty();
    }

    void clear() noexcept
    {
        data.clear();
    }

    template <typename Iter>
    void insert(std::vector<uint8_t>::const_iterator pos, Iter first, Iter last)
    {
        data.insert(pos, first, last);
    }

    [[nodiscard]] auto end() const noexcept
    {
        return data.cend();
    }

    bool operator==(SqlBlob const& other) const = default;
};

template <>
struct SqlDataBinder<SqlBlob>
{
    static LITEBRIDGE_FORCE_INLINE SQLRETURN InputParameter(SQLHSTMT stmt,
                                                            SQLUSMALLINT column,
                                                            SqlBlob const& value,
                                                            SqlDataBinderCallback& cb) noexcept
    {
        auto length = std::make_shared<SQLLEN>(static_cast<SQLLEN>(value.size()));
        cb.PlanPostExecuteCallback([length] {}); // Keep the indicator alive
        return SQLBindParameter(stmt,
                                column,
                                SQL_PARAM_INPUT,
                                SQL_C_BINARY,
                                SQL_LONGVARBINARY,
                                (std::max)(value.size(), size_t { 1 }),
                                0,
                                (SQLPOINTER) value.data.data(),
                                static_cast<SQLLEN>(value.size()),
                                length.get());
    }

    static LITEBRIDGE_FORCE_INLINE SQLRETURN GetColumn(SQLHSTMT stmt,
                                                       SQLUSMALLINT column,
                                                       SqlBlob* result,
                                                       SQLLEN* indicator,
                                                       SqlDataBinderCallback const& /*cb*/) noexcept
    {
        return detail::GetLongColumnData<SQL_C_BINARY>(stmt, column, result, indicator);
    }

    static std::string Inspect(SqlBlob const& value)
    {
        return std::format("<BLOB {} bytes>", value.size());
    }
};
