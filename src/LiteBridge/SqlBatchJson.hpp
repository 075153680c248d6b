// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlBatch.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Converts the JSON parameter list of one statement into bound values.
//
// JSON null (or an absent list) means "no parameters". Array elements are all bound as text; a
// JSON null element binds the text "null".
//
// @throws std::invalid_argument if the value is neither null nor an array.
[[nodiscard]] LITEBRIDGE_API std::optional<std::vector<SqlVariant>> ParseStatementParameters(
    nlohmann::json const& params);

// Builds the batch request from the three parallel lists of queries, parameter lists and identifiers.
//
// @throws std::invalid_argument if the lists are malformed or differ in length.
[[nodiscard]] LITEBRIDGE_API std::vector<SqlStatementRequest> MakeBatchRequest(nlohmann::json const& queries,
                                                                             nlohmann::json const& params,
                                                                             nlohmann::json const& ids);

// Encodes binary data as base64 text (RFC 4648, with padding).
[[nodiscard]] LITEBRIDGE_API std::string EncodeBase64(SqlBlob const& blob);

[[nodiscard]] LITEBRIDGE_API nlohmann::json ToJson(SqlVariant const& value);
[[nodiscard]] LITEBRIDGE_API nlohmann::json ToJson(SqlRow const& row);
[[nodiscard]] LITEBRIDGE_API nlohmann::json ToJson(SqlStatementOutcome const& outcome);

// Encodes the batch result as an array of {"qid", "type", "result"} objects, in batch order.
[[nodiscard]] LITEBRIDGE_API nlohmann::json ToJson(SqlBatchResult const& result);
