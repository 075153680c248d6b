// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Core.hpp"

#include <array>
#include <cstddef>

namespace detail
{

// Reads a character or binary column of arbitrary length via successive SQLGetData() calls.
//
// On return, *indicator holds the total number of bytes read, or SQL_NULL_DATA.
template <SQLSMALLINT CType, typename Container>
SQLRETURN GetLongColumnData(SQLHSTMT stmt, SQLUSMALLINT column, Container* result, SQLLEN* indicator) noexcept
{
    // SQL_C_CHAR data is always NUL-terminated, binary data is not.
    constexpr SQLLEN TerminatorSize = CType == SQL_C_CHAR ? 1 : 0;

    std::array<char, 1024> buffer {};
    result->clear();
    *indicator = 0;

    while (true)
    {
        SQLLEN chunkIndicator {};
        SQLRETURN const rv =
            SQLGetData(stmt, column, CType, buffer.data(), static_cast<SQLLEN>(buffer.size()), &chunkIndicator);

        if (rv == SQL_NO_DATA)
        {
            // All data has been retrieved by the previous calls.
            *indicator = static_cast<SQLLEN>(result->size());
            return SQL_SUCCESS;
        }

        if (!SQL_SUCCEEDED(rv))
            return rv;

        if (chunkIndicator == SQL_NULL_DATA)
        {
            *indicator = SQL_NULL_DATA;
            return rv;
        }

        auto const chunkCapacity = static_cast<SQLLEN>(buffer.size()) - TerminatorSize;
        if (rv == SQL_SUCCESS_WITH_INFO && (chunkIndicator == SQL_NO_TOTAL || chunkIndicator > chunkCapacity))
        {
            // Truncated, more data pending.
            result->insert(result->end(), buffer.data(), buffer.data() + chunkCapacity);
            continue;
        }

        result->insert(result->end(), buffer.data(), buffer.data() + chunkIndicator);
        *indicator = static_cast<SQLLEN>(result->size());
        return SQL_SUCCESS;
    }
}

} // namespace detail
