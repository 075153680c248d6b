// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlDataBinder.hpp"
#include "SqlError.hpp"

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

class SqlConnection;

/// Event sink for everything the library does with the database.
///
/// One logger is current per process (see SetLogger()). It defaults to the null logger, which
/// discards all events.
///
/// Events are also raised while closing cursors, connections and transactions, so the event
/// handlers must not throw.
class LITEBRIDGE_API SqlLogger
{
  public:
    /// Whether bound parameter values are rendered and passed to OnBind().
    enum class SupportBindLogging : uint8_t
    {
        No,
        Yes
    };

    SqlLogger() = default;
    explicit SqlLogger(SupportBindLogging supportBindLogging):
        _supportsBindLogging { supportBindLogging == SupportBindLogging::Yes }
    {
    }

    SqlLogger(SqlLogger const&) = default;
    SqlLogger(SqlLogger&&) = default;
    SqlLogger& operator=(SqlLogger const&) = default;
    SqlLogger& operator=(SqlLogger&&) = default;
    virtual ~SqlLogger() = default;

    // {{{ diagnostics
    virtual void OnInfo(std::string_view const& message) noexcept = 0;
    virtual void OnWarning(std::string_view const& message) noexcept = 0;
    virtual void OnError(SqlError errorCode,
                         std::source_location sourceLocation = std::source_location::current()) noexcept = 0;
    virtual void OnError(SqlErrorInfo const& errorInfo,
                         std::source_location sourceLocation = std::source_location::current()) noexcept = 0;
    // }}}

    // {{{ connection lifecycle
    virtual void OnConnectionOpened(SqlConnection const& connection) noexcept = 0;
    virtual void OnConnectionClosed(SqlConnection const& connection) noexcept = 0;
    // }}}

    // {{{ statement execution
    virtual void OnExecuteDirect(std::string_view const& query) noexcept = 0;
    virtual void OnPrepare(std::string_view const& query) noexcept = 0;
    virtual void OnExecute(std::string_view const& query) noexcept = 0;

    /// Renders the value through its data binder, if bind logging is enabled, and reports it via OnBind().
    template <typename T>
    void OnBindInputParameter(std::string_view const& name, T const& value)
    {
        if constexpr (SqlDataBinderSupportsInspect<T>)
        {
            if (_supportsBindLogging)
                OnBind(name, std::string(SqlDataBinder<std::remove_cvref_t<T>>::Inspect(value)));
        }
    }

    /// A parameter was bound. The name is empty for positional parameters.
    virtual void OnBind(std::string_view const& name, std::string value) noexcept = 0;

    virtual void OnFetchRow() noexcept = 0;

    /// The result set was exhausted or its cursor closed.
    virtual void OnFetchEnd() noexcept = 0;
    // }}}

    // {{{ batches
    virtual void OnExecuteBatch(std::size_t statementCount) noexcept = 0;

    /// A statement of a batch failed. The batch continues with the next statement.
    virtual void OnBatchStatementFailed(std::string_view const& id,
                                        std::string_view const& message) noexcept = 0;
    // }}}

    class Null;

    static Null& NullLogger() noexcept;

    /// Timestamped output of warnings, errors and failed batch statements to standard output.
    static SqlLogger& StandardLogger();

    /// Like StandardLogger(), and additionally every statement with its duration, row count and
    /// bound parameters.
    static SqlLogger& TraceLogger();

    static SqlLogger& GetLogger();

    /// Makes the given logger current. The caller keeps ownership and must keep it alive.
    static void SetLogger(SqlLogger& logger);

  private:
    bool _supportsBindLogging = false;
};

class SqlLogger::Null: public SqlLogger
{
  public:
    void OnInfo(std::string_view const& /*message*/) noexcept override {}
    void OnWarning(std::string_view const& /*message*/) noexcept override {}
    void OnError(SqlError /*errorCode*/, std::source_location /*sourceLocation*/) noexcept override {}
    void OnError(SqlErrorInfo const& /*errorInfo*/, std::source_location /*sourceLocation*/) noexcept override {}
    void OnConnectionOpened(SqlConnection const& /*connection*/) noexcept override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) noexcept override {}
    void OnExecuteDirect(std::string_view const& /*query*/) noexcept override {}
    void OnPrepare(std::string_view const& /*query*/) noexcept override {}
    void OnBind(std::string_view const& /*name*/, std::string /*value*/) noexcept override {}
    void OnExecute(std::string_view const& /*query*/) noexcept override {}
    void OnExecuteBatch(std::size_t /*statementCount*/) noexcept override {}
    void OnBatchStatementFailed(std::string_view const& /*id*/,
                                std::string_view const& /*message*/) noexcept override {}
    void OnFetchRow() noexcept override {}
    void OnFetchEnd() noexcept override {}
};
