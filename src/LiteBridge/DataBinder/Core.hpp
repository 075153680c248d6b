// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "../Api.hpp"

#include <concepts>
#include <functional>
#include <string>
#include <type_traits>

#include <sql.h>
#include <sqlext.h>
#include <sqltypes.h>

// Callback interface for SqlDataBinder to keep bound input data alive until the statement has been executed.
//
// SQLBindParameter() only records pointers. Binders that need temporary storage (length indicators,
// converted buffers) hand that storage over to the statement via PlanPostExecuteCallback().
class LITEBRIDGE_API SqlDataBinderCallback
{
  public:
    SqlDataBinderCallback() = default;
    SqlDataBinderCallback(SqlDataBinderCallback&&) = default;
    SqlDataBinderCallback(SqlDataBinderCallback const&) = default;
    SqlDataBinderCallback& operator=(SqlDataBinderCallback&&) = default;
    SqlDataBinderCallback& operator=(SqlDataBinderCallback const&) = default;

    virtual ~SqlDataBinderCallback() = default;

    virtual void PlanPostExecuteCallback(std::function<void()>&&) = 0;
};

template <typename>
struct SqlDataBinder;

template <typename T>
concept SqlInputParameterBinder =
    requires(SQLHSTMT hStmt, SQLUSMALLINT column, T const& value, SqlDataBinderCallback& cb) {
        { SqlDataBinder<T>::InputParameter(hStmt, column, value, cb) } -> std::same_as<SQLRETURN>;
    };

template <typename T>
concept SqlGetColumnNativeType =
    requires(SQLHSTMT hStmt, SQLUSMALLINT column, T* result, SQLLEN* indicator, SqlDataBinderCallback const& cb) {
        { SqlDataBinder<T>::GetColumn(hStmt, column, result, indicator, cb) } -> std::same_as<SQLRETURN>;
    };

template <typename T>
concept SqlDataBinderSupportsInspect = requires(T const& value) {
    { SqlDataBinder<std::remove_cvref_t<T>>::Inspect(value) } -> std::convertible_to<std::string>;
};
