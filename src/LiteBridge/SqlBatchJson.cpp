// SPDX-License-Identifier: Apache-2.0

#include "SqlBatchJson.hpp"
#include "Utils.hpp"

#include <cstdint>
#include <format>
#include <ranges>
#include <stdexcept>

namespace
{

SqlVariant ToParameter(nlohmann::json const& value)
{
    // Every parameter is bound as text, including null, which becomes "null".
    switch (value.type())
    {
        case nlohmann::json::value_t::null:
            return SqlVariant { "null" };
        case nlohmann::json::value_t::string:
            return SqlVariant { value.get<std::string>() };
        case nlohmann::json::value_t::boolean:
            return SqlVariant { value.get<bool>() ? "true" : "false" };
        default:
            // numbers in their JSON textual form, objects and arrays as compact JSON
            return SqlVariant { value.dump() };
    }
}

std::string ToIdentifier(nlohmann::json const& value)
{
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

void RequireArray(nlohmann::json const& value, std::string_view name)
{
    if (!value.is_array())
        throw std::invalid_argument(std::format("{} must be an array, got {}", name, value.type_name()));
}

} // namespace

std::optional<std::vector<SqlVariant>> ParseStatementParameters(nlohmann::json const& params)
{
    if (params.is_null())
        return std::nullopt;

    RequireArray(params, "Statement parameters");

    std::vector<SqlVariant> result;
    result.reserve(params.size());
    for (auto const& element: params)
        result.emplace_back(ToParameter(element));
    return result;
}

std::vector<SqlStatementRequest> MakeBatchRequest(nlohmann::json const& queries,
                                                  nlohmann::json const& params,
                                                  nlohmann::json const& ids)
{
    RequireArray(queries, "Queries");
    RequireArray(params, "Parameters");
    RequireArray(ids, "Query identifiers");

    if (queries.size() != params.size() || queries.size() != ids.size())
        throw std::invalid_argument(std::format("Batch lists differ in length: {} queries, {} parameter lists, {} ids",
                                                queries.size(),
                                                params.size(),
                                                ids.size()));

    std::vector<SqlStatementRequest> requests;
    requests.reserve(queries.size());
    for (auto const i: std::views::iota(size_t { 0 }, queries.size()))
    {
        if (!queries[i].is_string())
            throw std::invalid_argument(std::format("Query #{} is not a string", i));

        requests.emplace_back(SqlStatementRequest {
            .query = queries[i].get<std::string>(),
            .parameters = ParseStatementParameters(params[i]),
            .id = ToIdentifier(ids[i]),
        });
    }
    return requests;
}

std::string EncodeBase64(SqlBlob const& blob)
{
    static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    auto const* data = blob.data.data();
    auto const len = blob.data.size();

    std::string result;
    result.reserve(4 * ((len + 2) / 3));

    for (size_t i = 0; i < len; i += 3)
    {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<uint32_t>(data[i + 2]);

        result += alphabet[(n >> 18) & 0x3F];
        result += alphabet[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? alphabet[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? alphabet[n & 0x3F] : '=';
    }
    return result;
}

nlohmann::json ToJson(SqlVariant const& value)
{
    // clang-format off
    return std::visit(detail::overloaded {
        [](SqlNullType) { return nlohmann::json(nullptr); },
        [](int64_t v) { return nlohmann::json(v); },
        [](double v) { return nlohmann::json(v); },
        [](std::string const& v) { return nlohmann::json(v); },
        [](SqlBlob const& v) { return nlohmann::json(EncodeBase64(v)); }
    }, value.value);
    // clang-format on
}

nlohmann::json ToJson(SqlRow const& row)
{
    auto object = nlohmann::json::object();
    for (auto const& [name, value]: row)
        object[name] = ToJson(value);
    return object;
}

nlohmann::json ToJson(SqlStatementOutcome const& outcome)
{
    // clang-format off
    return std::visit(detail::overloaded {
        [](SqlRowSet const& rowSet) {
            auto rows = nlohmann::json::array();
            for (auto const& row: rowSet.rows)
                rows.push_back(ToJson(row));
            return nlohmann::json { { "rows", std::move(rows) } };
        },
        [](SqlAffectedCount const& count) {
            return nlohmann::json { { "rowsAffected", count.rowsAffected } };
        },
        [](SqlInsertResult const& insert) {
            return nlohmann::json { { "insertId", insert.insertId }, { "rowsAffected", insert.rowsAffected } };
        },
        [](SqlEmptyResult const&) {
            return nlohmann::json::object();
        },
        [](SqlStatementError const& error) {
            return nlohmann::json { { "message", error.message } };
        }
    }, outcome);
    // clang-format on
}

nlohmann::json ToJson(SqlBatchResult const& result)
{
    auto entries = nlohmann::json::array();
    for (auto const& entry: result.entries)
    {
        entries.push_back(nlohmann::json {
            { "qid", entry.id },
            { "type", entry.Failed() ? "error" : "success" },
            { "result", ToJson(entry.outcome) },
        });
    }
    return entries;
}
