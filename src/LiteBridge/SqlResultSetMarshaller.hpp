// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlBatch.hpp"

class SqlStatement;

// Reads all rows of the current result set of the given statement.
//
// Column values are typed by the driver-reported column type and NULL is preserved.
// The cursor is closed when this function returns or throws.
[[nodiscard]] LITEBRIDGE_API SqlRowSet ReadRowSet(SqlStatement& stmt);
