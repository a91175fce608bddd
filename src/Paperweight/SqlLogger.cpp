// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"
#include "SqlConnection.hpp"
#include "SqlLogger.hpp"

#include <chrono>
#include <cstddef>
#include <format>
#include <optional>
#include <print>
#include <ranges>
#include <string>
#include <utility>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

namespace
{

// Writes warnings and errors, each line stamped with the wall clock time.
class SqlStandardLogger: public SqlLogger
{
  public:
    void OnWarning(std::string_view const& message) override
    {
        Write("Warning: {}", message);
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        Write("SQL Error: {}", errorInfo.message);
        Write("  SQLSTATE: {}, native error code: {}", errorInfo.sqlState, errorInfo.nativeErrorCode);
        Write("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
    }

    void OnConnectionOpened(SqlConnection const& /*connection*/) override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) override {}
    void OnExecuteDirect(std::string_view const& /*query*/) override {}
    void OnFetchRow() override {}
    void OnFetchEnd() override {}
    void OnSchemaStatement(std::string_view const& /*statement*/) override {}

    void OnSchemaError(SqlSchemaError const& error) override
    {
        Write("Schema operation failed ({}): {}", error.kind, error.message);
    }

  protected:
    template <typename... Args>
    void Write(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto const now = std::chrono::system_clock::now();
        auto const milliseconds = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
        std::println("[{:%F %X}.{:03}] {}",
                     std::chrono::time_point_cast<std::chrono::seconds>(now),
                     milliseconds.time_since_epoch().count() % 1'000,
                     std::format(fmt, std::forward<Args>(args)...));
    }
};

// Additionally writes connection events, every executed query with its duration and row count,
// and the DDL statements of the schema builder.
class SqlTraceLogger final: public SqlStandardLogger
{
    struct RunningQuery
    {
        std::string text;
        std::chrono::steady_clock::time_point startedAt;
        std::size_t rowCount {};
    };

    std::optional<RunningQuery> _runningQuery;
    std::string _lastQuery;
    std::size_t _schemaStatementCount {};

  public:
    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        if (_runningQuery)
            _lastQuery = std::move(_runningQuery->text);
        _runningQuery.reset();

        SqlStandardLogger::OnError(errorInfo, sourceLocation);
        if (!_lastQuery.empty())
            Write("  Query: {}", _lastQuery);
        WriteStackTrace();
    }

    void OnConnectionOpened(SqlConnection const& connection) override
    {
        Write("Connection {} opened: {}", connection.ConnectionId(), connection.ConnectionString().Sanitized());
    }

    void OnConnectionClosed(SqlConnection const& connection) override
    {
        FinishQuery();
        Write("Connection {} closed.", connection.ConnectionId());
    }

    void OnExecuteDirect(std::string_view const& query) override
    {
        FinishQuery();
        _runningQuery = RunningQuery { .text = std::string(query), .startedAt = std::chrono::steady_clock::now() };
    }

    void OnFetchRow() override
    {
        if (_runningQuery)
            ++_runningQuery->rowCount;
    }

    void OnFetchEnd() override
    {
        FinishQuery();
    }

    void OnSchemaStatement(std::string_view const& statement) override
    {
        Write("Schema statement #{}: {}", ++_schemaStatementCount, statement);
    }

    void OnSchemaError(SqlSchemaError const& error) override
    {
        SqlStandardLogger::OnSchemaError(error);
        if (!_lastQuery.empty())
            Write("  Last query: {}", _lastQuery);
    }

  private:
    void FinishQuery()
    {
        if (!_runningQuery)
            return;

        auto const duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now()
                                                                                     - _runningQuery->startedAt);
        auto const rows = [count = _runningQuery->rowCount]() -> std::string {
            switch (count)
            {
                case 0:
                    return "";
                case 1:
                    return " [1 row]";
                default:
                    return std::format(" [{} rows]", count);
            }
        }();

        Write("[{}.{:06}]{} {}", duration.count() / 1'000'000, duration.count() % 1'000'000, rows, _runningQuery->text);

        _lastQuery = std::move(_runningQuery->text);
        _runningQuery.reset();
    }

    void WriteStackTrace()
    {
#if __has_include(<stacktrace>)
        auto const stackTrace = std::stacktrace::current(2, 25);
        Write("  Stack trace:");
        for (std::size_t const i: std::views::iota(std::size_t(0), stackTrace.size()))
            Write("    [{:>2}] {}", i, stackTrace[i]);
#endif
    }
};

SqlLogger* theCurrentLogger = &SqlLogger::NullLogger();

} // namespace

SqlLogger::Null& SqlLogger::NullLogger() noexcept
{
    static SqlLogger::Null theNullLogger {};
    return theNullLogger;
}

SqlLogger& SqlLogger::StandardLogger()
{
    static SqlStandardLogger theStandardLogger {};
    return theStandardLogger;
}

SqlLogger& SqlLogger::TraceLogger()
{
    static SqlTraceLogger theTraceLogger {};
    return theTraceLogger;
}

SqlLogger& SqlLogger::GetLogger()
{
    return *theCurrentLogger;
}

void SqlLogger::SetLogger(SqlLogger& logger)
{
    theCurrentLogger = &logger;
}
