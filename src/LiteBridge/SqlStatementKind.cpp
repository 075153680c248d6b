// SPDX-License-Identifier: Apache-2.0

#include "SqlStatementKind.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace
{

constexpr bool IsSpace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::string_view FirstToken(std::string_view query) noexcept
{
    auto const begin = std::ranges::find_if_not(query, IsSpace);
    auto const end = std::find_if(begin, query.end(), IsSpace);
    return { begin, end };
}

} // namespace

SqlStatementKind ClassifyStatement(std::string_view query) noexcept
{
    using namespace std::string_view_literals;

    static constexpr auto keywords = std::array {
        std::pair { "update"sv, SqlStatementKind::Update },     std::pair { "insert"sv, SqlStatementKind::Insert },
        std::pair { "delete"sv, SqlStatementKind::Delete },     std::pair { "begin"sv, SqlStatementKind::Begin },
        std::pair { "commit"sv, SqlStatementKind::Commit },     std::pair { "rollback"sv, SqlStatementKind::Rollback },
    };

    auto const token = FirstToken(query);
    for (auto const& [keyword, kind]: keywords)
        if (EqualsIgnoreCase(token, keyword))
            return kind;

    return SqlStatementKind::RawQuery;
}
