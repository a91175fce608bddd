// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "../Paperweight/SqlConnectInfo.hpp"
#include "../Paperweight/SqlConnection.hpp"
#include "../Paperweight/SqlDialect.hpp"
#include "../Paperweight/SqlError.hpp"
#include "../Paperweight/SqlLogger.hpp"
#include "../Paperweight/SqlSchemaBuilder.hpp"
#include "../Paperweight/SqlStatement.hpp"

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <functional>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#if __has_include(<stacktrace>)
    #include <stacktrace>
#endif

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

// Refer to an in-memory SQLite database (and assuming the sqliteodbc driver is installed)
// See:
// - https://www.sqlite.org/inmemorydb.html
// - http://www.ch-werner.de/sqliteodbc/
//
auto const inline DefaultTestConnectionString = SqlConnectionString {
    .value = std::format("DRIVER={};Database={}",
#if defined(_WIN32) || defined(_WIN64)
                         "SQLite3 ODBC Driver",
#else
                         "SQLite3",
#endif
                         "file::memory:"),
};

class TestSuiteSqlLogger: public SqlLogger
{
  private:
    std::string m_lastStatement;

    template <typename... Args>
    void WriteInfo(std::format_string<Args...> const& fmt, Args&&... args)
    {
        auto message = std::format(fmt, std::forward<Args>(args)...);
        message = std::format("[{}] {}", "Paperweight", message);
        UNSCOPED_INFO(message);
    }

    template <typename... Args>
    void WriteWarning(std::format_string<Args...> const& fmt, Args&&... args)
    {
        WARN(std::format(fmt, std::forward<Args>(args)...));
    }

  public:
    static TestSuiteSqlLogger& GetLogger() noexcept
    {
        static TestSuiteSqlLogger theLogger;
        return theLogger;
    }

    void OnError(SqlErrorInfo const& errorInfo, std::source_location sourceLocation) override
    {
        WriteWarning("SQL Error: {}", errorInfo);
        WriteDetails(sourceLocation);
    }

    void OnWarning(std::string_view const& message) override
    {
        WriteWarning("{}", message);
    }

    void OnConnectionOpened(SqlConnection const& /*connection*/) override {}

    void OnConnectionClosed(SqlConnection const& /*connection*/) override {}

    void OnExecuteDirect(std::string_view const& query) override
    {
        m_lastStatement = query;
        WriteInfo("ExecuteDirect: {}", query);
    }

    void OnFetchRow() override {}

    void OnFetchEnd() override {}

    void OnSchemaStatement(std::string_view const& statement) override
    {
        WriteInfo("Schema: {}", statement);
    }

    void OnSchemaError(SqlSchemaError const& error) override
    {
        WriteWarning("Schema operation failed ({}): {}", error.kind, error.message);
    }

  private:
    void WriteDetails(std::source_location sourceLocation)
    {
        WriteInfo("  Source: {}:{}", sourceLocation.file_name(), sourceLocation.line());
        if (!m_lastStatement.empty())
            WriteInfo("  Query: {}", m_lastStatement);
        WriteInfo("  Stack trace:");

#if __has_include(<stacktrace>)
        auto stackTrace = std::stacktrace::current(1, 25);
        for (std::size_t const i: std::views::iota(std::size_t(0), stackTrace.size()))
            WriteInfo("    [{:>2}] {}", i, stackTrace[i]);
#endif
    }
};

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedSqlNullLogger: public SqlLogger
{
  private:
    SqlLogger& m_previousLogger = SqlLogger::GetLogger();

  public:
    ScopedSqlNullLogger()
    {
        SqlLogger::SetLogger(*this);
    }

    ~ScopedSqlNullLogger() override
    {
        SqlLogger::SetLogger(m_previousLogger);
    }

    void OnWarning(std::string_view const& /*message*/) override {}
    void OnError(SqlErrorInfo const& /*errorInfo*/, std::source_location /*sourceLocation*/) override {}
    void OnConnectionOpened(SqlConnection const& /*connection*/) override {}
    void OnConnectionClosed(SqlConnection const& /*connection*/) override {}
    void OnExecuteDirect(std::string_view const& /*query*/) override {}
    void OnFetchRow() override {}
    void OnFetchEnd() override {}
    void OnSchemaStatement(std::string_view const& /*statement*/) override {}
    void OnSchemaError(SqlSchemaError const& /*error*/) override {}
};

// Captures what the schema builder reports, for as long as it is alive.
class ScopedSqlRecordingLogger final: public ScopedSqlNullLogger
{
  public:
    std::vector<std::string> schemaStatements;
    std::vector<SqlSchemaError> schemaErrors;

    void OnSchemaStatement(std::string_view const& statement) override
    {
        schemaStatements.emplace_back(statement);
    }

    void OnSchemaError(SqlSchemaError const& error) override
    {
        schemaErrors.emplace_back(error);
    }
};

// Schema executor that only records the statements it is given.
//
// A statement containing failOn (if set) is rejected the way a database rejects a duplicate table.
class RecordingSchemaExecutor final: public SqlSchemaExecutor
{
  public:
    std::vector<std::string> statements;
    std::string failOn;

    void Execute(std::string_view sql) override
    {
        if (!failOn.empty() && sql.find(failOn) != std::string_view::npos)
            throw SqlException(SqlErrorInfo {
                .nativeErrorCode = 2714,
                .sqlState = "42S01",
                .message = std::format("There is already an object named '{}' in the database.", failOn),
            });
        statements.emplace_back(sql);
    }
};

[[nodiscard]] inline std::string NormalizeText(std::string_view const& text)
{
    auto result = std::string(text);

    // Remove any newlines and reduce all whitespace to a single space
    std::ranges::replace_if(result, [](char c) { return std::isspace(static_cast<unsigned char>(c)); }, ' ');
    result.erase(std::unique(result.begin(), result.end(), [](char a, char b) { return a == ' ' && b == ' '; }),
                 result.end());

    // trim leading and trailing whitespace
    while (!result.empty() && result.front() == ' ')
        result.erase(result.begin());

    while (!result.empty() && result.back() == ' ')
        result.pop_back();

    return result;
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class SqlTestFixture
{
  public:
    static inline bool odbcTrace = false;
    static inline bool databaseAvailable = false;

    using MainProgramArgs = std::tuple<int, char**>;

    static std::variant<MainProgramArgs, int> Initialize(int argc, char** argv)
    {
        SqlLogger::SetLogger(TestSuiteSqlLogger::GetLogger());

        using namespace std::string_view_literals;
        int i = 1;
        for (; i < argc; ++i)
        {
            if (argv[i] == "--trace-sql"sv)
                SqlLogger::SetLogger(SqlLogger::TraceLogger());
            else if (argv[i] == "--trace-odbc"sv)
                odbcTrace = true;
            else if (argv[i] == "--help"sv || argv[i] == "-h"sv)
            {
                std::println("{} [--trace-sql] [--trace-odbc] [[--] [Catch2 flags ...]]", argv[0]);
                return { EXIT_SUCCESS };
            }
            else if (argv[i] == "--"sv)
            {
                ++i;
                break;
            }
            else
                break;
        }

        if (i < argc)
            argv[i - 1] = argv[0];

#if defined(_MSC_VER)
        char* envBuffer = nullptr;
        size_t envBufferLen = 0;
        _dupenv_s(&envBuffer, &envBufferLen, "ODBC_CONNECTION_STRING");
        if (auto const* s = envBuffer; s && *s)
#else
        if (auto const* s = std::getenv("ODBC_CONNECTION_STRING"); s && *s)
#endif

        {
            std::println("Using ODBC connection string: '{}'", SqlConnectionString::SanitizePwd(s));
            SqlConnection::SetDefaultConnectionString(SqlConnectionString { s });
        }
        else
        {
            // Use an in-memory SQLite3 database by default (for testing purposes)
            std::println("Using default ODBC connection string: '{}'", DefaultTestConnectionString.value);
            SqlConnection::SetDefaultConnectionString(DefaultTestConnectionString);
        }

        SqlConnection::SetPostConnectedHook(&SqlTestFixture::PostConnectedHook);

        auto sqlConnection = SqlConnection();
        databaseAvailable = sqlConnection.IsAlive();
        if (databaseAvailable)
            std::println("Running database test cases against: {} ({}) (identified as: {})",
                         sqlConnection.ServerName(),
                         sqlConnection.ServerVersion(),
                         sqlConnection.ServerType());
        else
            std::println("Skipping database test cases, failed to connect: {}", sqlConnection.LastError());

        return MainProgramArgs { argc - (i - 1), argv + (i - 1) };
    }

    static void PostConnectedHook(SqlConnection& connection)
    {
        if (odbcTrace)
        {
#if !defined(_WIN32) && !defined(_WIN64)
            SQLHDBC handle = connection.NativeHandle();
            SQLSetConnectAttrA(handle, SQL_ATTR_TRACEFILE, (SQLPOINTER) "/dev/stdout", SQL_NTS);
            SQLSetConnectAttrA(handle, SQL_ATTR_TRACE, (SQLPOINTER) SQL_OPT_TRACE_ON, SQL_IS_UINTEGER);
#endif
        }

        switch (connection.ServerType())
        {
            case SqlServerType::SQLITE: {
                auto stmt = SqlStatement { connection };
                // Enable foreign key constraints for SQLite
                stmt.ExecuteDirect("PRAGMA foreign_keys = ON");
                break;
            }
            case SqlServerType::MICROSOFT_SQL:
            case SqlServerType::POSTGRESQL:
            case SqlServerType::MYSQL:
            case SqlServerType::UNKNOWN:
                break;
        }
    }

    SqlTestFixture()
    {
        if (!databaseAvailable)
            SKIP("No database connection available");
    }

    virtual ~SqlTestFixture() = default;

    // Drops the given tables, if they exist, in the given order.
    static void DropTablesIfExist(SqlConnection& connection, std::vector<std::string> const& tableNames)
    {
        auto stmt = SqlStatement { connection };
        auto const& dialect = connection.Dialect();
        for (auto const& tableName: tableNames)
            stmt.ExecuteDirect(std::format("DROP TABLE IF EXISTS {}{}",
                                           dialect.QuoteForTableName(tableName, {}),
                                           dialect.CascadeConstraintsString()));
    }
};
