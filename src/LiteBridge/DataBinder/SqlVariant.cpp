// SPDX-License-Identifier: Apache-2.0

#include "SqlVariant.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <span>
#include <string_view>
#include <system_error>

namespace
{

// How the value of a result column is read into the variant.
enum class ColumnStorage : uint8_t
{
    Null,
    Integer,
    Real,
    Text,
    Blob,

    // Read as text and narrowed to an integer or real when the text is one.
    // Columns with numeric affinity may hold values of any storage class.
    Numeric,
};

constexpr auto IntegerTypeNames = std::array<std::string_view, 14> {
    "INT", "INTEGER", "TINYINT", "SMALLINT", "MEDIUMINT", "BIGINT", "UNSIGNED BIG INT",
    "INT2", "INT4", "INT8", "BOOLEAN", "BOOL", "BIT", "COUNTER",
};

constexpr auto RealTypeNames = std::array<std::string_view, 5> {
    "REAL", "FLOAT", "DOUBLE", "DOUBLE PRECISION", "FLOAT8",
};

constexpr auto NumericTypeNames = std::array<std::string_view, 3> {
    "NUMERIC", "DECIMAL", "NUMBER",
};

constexpr auto TextTypeNames = std::array<std::string_view, 18> {
    "TEXT",     "CHAR",      "CHARACTER", "VARCHAR",           "VARYING CHARACTER",
    "NCHAR",    "NVARCHAR",  "NATIVE CHARACTER", "LONGVARCHAR", "WCHAR",
    "WVARCHAR", "CLOB",      "STRING",    "DATE",              "TIME",
    "DATETIME", "TIMESTAMP", "UUID",
};

constexpr auto BlobTypeNames = std::array<std::string_view, 4> {
    "BLOB", "BINARY", "VARBINARY", "LONGVARBINARY",
};

constexpr bool Contains(auto const& names, std::string_view name) noexcept
{
    return std::ranges::find(names, name) != names.end();
}

// Storage by the declared type name of a table column, e.g. "VARCHAR(20)" or "MULTIPOLYGON".
//
// Names outside the known SQL types are user or extension types. SpatiaLite declares its geometry
// columns that way (POINT, GEOMETRY, ...), and stores blobs in them.
constexpr ColumnStorage StorageOfDeclaredType(std::string_view name) noexcept
{
    if (Contains(IntegerTypeNames, name))
        return ColumnStorage::Numeric;
    if (Contains(RealTypeNames, name))
        return ColumnStorage::Real;
    if (Contains(NumericTypeNames, name))
        return ColumnStorage::Numeric;
    if (Contains(TextTypeNames, name))
        return ColumnStorage::Text;
    return ColumnStorage::Blob;
}

// Storage by the driver's concise type, for result columns without a declared type (expressions).
constexpr ColumnStorage StorageOfConciseType(SQLLEN conciseType) noexcept
{
    switch (conciseType)
    {
        case SQL_TYPE_NULL:
            return ColumnStorage::Null;
        case SQL_BIT:
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT:
            return ColumnStorage::Integer;
        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return ColumnStorage::Real;
        case SQL_DECIMAL:
        case SQL_NUMERIC:
            return ColumnStorage::Numeric;
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            return ColumnStorage::Blob;
        default:
            return ColumnStorage::Text;
    }
}

// Upper-cased declared type name without its size suffix, or empty if the column has none.
// Reads into a fixed buffer; longer names are truncated, which only affects user type names.
struct DeclaredTypeName
{
    std::array<char, 64> buffer {};
    std::size_t length = 0;

    [[nodiscard]] std::string_view View() const noexcept
    {
        return { buffer.data(), length };
    }
};

SQLRETURN ReadDeclaredTypeName(SQLHSTMT stmt, SQLUSMALLINT column, DeclaredTypeName& name) noexcept
{
    auto length = SQLSMALLINT {};
    auto const rc = SQLColAttributeA(stmt,
                                     column,
                                     SQL_DESC_TYPE_NAME,
                                     (SQLPOINTER) name.buffer.data(),
                                     static_cast<SQLSMALLINT>(name.buffer.size()),
                                     &length,
                                     nullptr);
    if (!SQL_SUCCEEDED(rc))
        return rc;

    auto const available = length > 0 ? std::min(static_cast<std::size_t>(length), name.buffer.size() - 1) : 0;
    auto text = std::string_view { name.buffer.data(), available };
    text = text.substr(0, text.find('('));
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);

    name.length = text.size();
    for (auto& c: std::span { name.buffer.data(), name.length })
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return rc;
}

// "42" -> 42, "2.5" -> 2.5, anything else stays text.
void NarrowNumericText(SqlVariant::InnerType& storage) noexcept
{
    auto const& text = std::get<std::string>(storage);
    if (text.empty())
        return;

    auto const* const first = text.data();
    auto const* const last = text.data() + text.size();

    auto integer = int64_t {};
    if (auto const [end, ec] = std::from_chars(first, last, integer); ec == std::errc {} && end == last)
    {
        storage = integer;
        return;
    }

    auto real = double {};
    if (auto const [end, ec] = std::from_chars(first, last, real); ec == std::errc {} && end == last)
        storage = real;
}

template <typename T>
SQLRETURN ReadInto(SqlVariant::InnerType& storage,
                   SQLHSTMT stmt,
                   SQLUSMALLINT column,
                   SQLLEN* indicator,
                   SqlDataBinderCallback const& cb) noexcept
{
    return SqlDataBinder<T>::GetColumn(stmt, column, &storage.emplace<T>(), indicator, cb);
}

} // namespace

SQLRETURN SqlDataBinder<SqlVariant>::InputParameter(SQLHSTMT stmt,
                                                    SQLUSMALLINT column,
                                                    SqlVariant const& variantValue,
                                                    SqlDataBinderCallback& cb) noexcept
{
    return std::visit(
        [&]<typename T>(T const& value) { return SqlDataBinder<T>::InputParameter(stmt, column, value, cb); },
        variantValue.value);
}

SQLRETURN SqlDataBinder<SqlVariant>::GetColumn(
    SQLHSTMT stmt, SQLUSMALLINT column, SqlVariant* result, SQLLEN* indicator, SqlDataBinderCallback const& cb) noexcept
{
    auto typeName = DeclaredTypeName {};
    if (auto const rc = ReadDeclaredTypeName(stmt, column, typeName); !SQL_SUCCEEDED(rc))
        return rc;

    auto storageClass = ColumnStorage {};
    if (!typeName.View().empty())
        storageClass = StorageOfDeclaredType(typeName.View());
    else
    {
        auto conciseType = SQLLEN {};
        if (auto const rc = SQLColAttributeA(stmt, column, SQL_DESC_CONCISE_TYPE, nullptr, 0, nullptr, &conciseType);
            !SQL_SUCCEEDED(rc))
            return rc;
        storageClass = StorageOfConciseType(conciseType);
    }

    auto& storage = result->value;
    auto rc = SQLRETURN { SQL_SUCCESS };

    switch (storageClass)
    {
        case ColumnStorage::Null:
            *indicator = SQL_NULL_DATA;
            break;
        case ColumnStorage::Integer:
            rc = ReadInto<int64_t>(storage, stmt, column, indicator, cb);
            break;
        case ColumnStorage::Real:
            rc = ReadInto<double>(storage, stmt, column, indicator, cb);
            break;
        case ColumnStorage::Blob:
            rc = ReadInto<SqlBlob>(storage, stmt, column, indicator, cb);
            break;
        case ColumnStorage::Text:
            rc = ReadInto<std::string>(storage, stmt, column, indicator, cb);
            break;
        case ColumnStorage::Numeric:
            rc = ReadInto<std::string>(storage, stmt, column, indicator, cb);
            if (SQL_SUCCEEDED(rc) && *indicator != SQL_NULL_DATA)
                NarrowNumericText(storage);
            break;
    }

    if (*indicator == SQL_NULL_DATA)
        storage = SqlNullValue;
    return rc;
}

std::string SqlVariant::ToString() const
{
    return std::visit(detail::overloaded {
                          [](SqlNullType) -> std::string { return "NULL"; },
                          [](int64_t v) -> std::string { return std::to_string(v); },
                          [](double v) -> std::string { return std::format("{}", v); },
                          [](std::string const& v) -> std::string { return v; },
                          [](SqlBlob const& v) -> std::string { return std::format("<BLOB {} bytes>", v.size()); },
                      },
                      value);
}
