// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Utils.hpp"
#include "Core.hpp"
#include "Primitives.hpp"
#include "SqlBlob.hpp"
#include "SqlNullValue.hpp"
#include "StdString.hpp"

#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// A single column value or bound parameter, restricted to the SQLite storage classes.
struct SqlVariant
{
    using InnerType = std::variant<SqlNullType, int64_t, double, std::string, SqlBlob>;

    InnerType value;

    SqlVariant() = default;

    // clang-format off
    SqlVariant(SqlNullType /*null*/) noexcept: value { SqlNullValue } {}
    SqlVariant(double number) noexcept: value { number } {}
    SqlVariant(std::string text) noexcept: value { std::move(text) } {}
    SqlVariant(std::string_view text): value { std::string(text) } {}
    SqlVariant(char const* text): value { std::string(text) } {}
    SqlVariant(SqlBlob blob) noexcept: value { std::move(blob) } {}
    // clang-format on

    // All integer types are stored as 64-bit integers, the width of SQLite's INTEGER storage class.
    template <std::integral T>
    SqlVariant(T number) noexcept:
        value { static_cast<int64_t>(number) }
    {
    }

    // An empty optional is NULL.
    template <typename T>
    SqlVariant(std::optional<T> const& optional):
        SqlVariant { optional ? SqlVariant { *optional } : SqlVariant { SqlNullValue } }
    {
    }

    bool operator==(SqlVariant const& other) const = default;

    [[nodiscard]] bool IsNull() const noexcept
    {
        return std::holds_alternative<SqlNullType>(value);
    }

    template <typename T>
    [[nodiscard]] bool Is() const noexcept
    {
        return std::holds_alternative<T>(value);
    }

    // @throws std::bad_variant_access if the value holds another type.
    template <typename T>
    [[nodiscard]] T const& Get() const
    {
        return std::get<T>(value);
    }

    [[nodiscard]] std::optional<int64_t> TryGetInt64() const noexcept
    {
        if (auto const* number = std::get_if<int64_t>(&value))
            return *number;
        return std::nullopt;
    }

    // Integers are widened to double.
    [[nodiscard]] std::optional<double> TryGetDouble() const noexcept
    {
        if (auto const* number = std::get_if<double>(&value))
            return *number;
        if (auto const* number = std::get_if<int64_t>(&value))
            return static_cast<double>(*number);
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string_view> TryGetStringView() const noexcept
    {
        if (auto const* text = std::get_if<std::string>(&value))
            return std::string_view { *text };
        return std::nullopt;
    }

    // Human readable form for logging. NULL prints as "NULL" and blobs print their size.
    [[nodiscard]] LITEBRIDGE_API std::string ToString() const;
};

template <>
struct std::formatter<SqlVariant>: formatter<string>
{
    auto format(SqlVariant const& value, format_context& ctx) const -> format_context::iterator
    {
        return std::formatter<string>::format(value.ToString(), ctx);
    }
};

template <>
struct LITEBRIDGE_API SqlDataBinder<SqlVariant>
{
    static SQLRETURN InputParameter(SQLHSTMT stmt,
                                    SQLUSMALLINT column,
                                    SqlVariant const& variantValue,
                                    SqlDataBinderCallback& cb) noexcept;

    static SQLRETURN GetColumn(SQLHSTMT stmt,
                               SQLUSMALLINT column,
                               SqlVariant* result,
                               SQLLEN* indicator,
                               SqlDataBinderCallback const& cb) noexcept;

    static LITEBRIDGE_FORCE_INLINE std::string Inspect(SqlVariant const& value)
    {
        return value.ToString();
    }
};
