// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <cstdint>
#include <format>
#include <string_view>

// The closed set of statement kinds the batch executor dispatches on.
enum class SqlStatementKind : std::uint8_t
{
    Update,
    Insert,
    Delete,
    Begin,
    Commit,
    Rollback,
    RawQuery,
};

// Classifies a statement by its first whitespace-delimited token, case-insensitively.
//
// Anything that is not one of the recognized keywords, including empty input, is a raw query.
[[nodiscard]] LITEBRIDGE_API SqlStatementKind ClassifyStatement(std::string_view query) noexcept;

template <>
struct std::formatter<SqlStatementKind>: formatter<std::string_view>
{
    auto format(SqlStatementKind value, format_context& ctx) const -> format_context::iterator
    {
        std::string_view name;
        switch (value)
        {
            case SqlStatementKind::Update:
                name = "update";
                break;
            case SqlStatementKind::Insert:
                name = "insert";
                break;
            case SqlStatementKind::Delete:
                name = "delete";
                break;
            case SqlStatementKind::Begin:
                name = "begin";
                break;
            case SqlStatementKind::Commit:
                name = "commit";
                break;
            case SqlStatementKind::Rollback:
                name = "rollback";
                break;
            case SqlStatementKind::RawQuery:
                name = "raw";
                break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};
