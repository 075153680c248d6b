// SPDX-License-Identifier: Apache-2.0

#include "SqlResultSetMarshaller.hpp"
#include "SqlStatement.hpp"

#include <ranges>

SqlRowSet ReadRowSet(SqlStatement& stmt)
{
    SqlRowSet rowSet;

    auto cursor = stmt.GetResultCursor();
    auto const columnCount = static_cast<SQLUSMALLINT>(cursor.ColumnCount());
    if (columnCount == 0)
        return rowSet;

    std::vector<std::string> columnNames;
    columnNames.reserve(columnCount);
    for (auto const column: std::views::iota(SQLUSMALLINT { 1 }, static_cast<SQLUSMALLINT>(columnCount + 1)))
        columnNames.emplace_back(cursor.ColumnName(column));

    while (cursor.FetchRow())
    {
        SqlRow row;
        for (auto const column: std::views::iota(SQLUSMALLINT { 1 }, static_cast<SQLUSMALLINT>(columnCount + 1)))
            row.Set(columnNames[column - 1], cursor.GetColumn<SqlVariant>(column));
        rowSet.rows.emplace_back(std::move(row));
    }

    return rowSet;
}
