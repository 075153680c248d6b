// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

namespace
{

constexpr std::string_view Whitespace = " \t\r\n";

constexpr std::string_view Trim(std::string_view text) noexcept
{
    auto const first = text.find_first_not_of(Whitespace);
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(Whitespace);
    return text.substr(first, last - first + 1);
}

// "{a;b}" -> "a;b"
constexpr std::string_view Unbrace(std::string_view text) noexcept
{
    if (text.size() >= 2 && text.starts_with('{') && text.ends_with('}'))
        return text.substr(1, text.size() - 2);
    return text;
}

std::string UpperCased(std::string_view text)
{
    auto upper = std::string(text.size(), '\0');
    std::ranges::transform(text, upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

// Values containing separators, braces or surrounding whitespace must be braced to survive a round trip.
bool RequiresBraces(std::string_view text) noexcept
{
    return text.find_first_of(";{}") != std::string_view::npos || Trim(text) != text;
}

} // namespace

std::string SqlConnectionString::Sanitized() const
{
    return SanitizePwd(value);
}

std::string SqlConnectionString::SanitizePwd(std::string_view input)
{
    std::regex const pwdRegex {
        R"(PWD=.*?(;|$))",
        std::regex_constants::ECMAScript | std::regex_constants::icase,
    };
    std::stringstream outputString;
    std::regex_replace(
        std::ostreambuf_iterator<char> { outputString }, input.begin(), input.end(), pwdRegex, "Pwd=***$1");
    return outputString.str();
}

SqlConnectionStringMap ParseConnectionString(SqlConnectionString const& connectionString)
{
    SqlConnectionStringMap result;

    // Splits on ';', except inside a braced value such as "Database={a;b.db}".
    std::string_view input = connectionString.value;
    while (!input.empty())
    {
        size_t end = 0;
        bool braced = false;
        while (end < input.size() && (braced || input[end] != ';'))
        {
            if (input[end] == '{')
                braced = true;
            else if (input[end] == '}')
                braced = false;
            ++end;
        }

        auto const pair = input.substr(0, end);
        input.remove_prefix((std::min)(end + 1, input.size()));

        auto separatorPosition = pair.find('=');
        if (separatorPosition != std::string_view::npos)
        {
            auto const key = Trim(pair.substr(0, separatorPosition));
            auto const value = Unbrace(Trim(pair.substr(separatorPosition + 1)));
            result.insert_or_assign(UpperCased(key), std::string(value));
        }
    }

    return result;
}

SqlConnectionString BuildConnectionString(SqlConnectionStringMap const& map)
{
    auto result = SqlConnectionString {};
    for (auto const& [key, value]: map)
    {
        if (!result.value.empty())
            result.value += ';';
        result.value += RequiresBraces(value) ? std::format("{}={{{}}}", key, value) : std::format("{}={}", key, value);
    }
    return result;
}

SqlConnectionString SqlDatabaseOptions::ToConnectionString(std::filesystem::path const& path) const
{
    auto map = SqlConnectionStringMap {
        { "DRIVER", driver },
        { "DATABASE", path.string() },
        { "NOCREAT", createIfMissing ? "0" : "1" },
        { "TIMEOUT", std::to_string(busyTimeout.count()) },
        { "FKSUPPORT", foreignKeys ? "1" : "0" },
    };

    if (!extensions.empty())
    {
        auto loadExt = std::string {};
        for (auto const& [index, extension]: extensions | std::views::enumerate)
            loadExt += std::format("{}{}", index > 0 ? "," : "", extension);
        map.emplace("LOADEXT", std::move(loadExt));
    }

    return BuildConnectionString(map);
}
