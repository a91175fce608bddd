// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"

#include <source_location>
#include <string_view>

class SqlConnection;

/// Receives what the store does on the database.
///
/// There is exactly one active logger per process, see SetLogger().
/// The default one discards everything.
class PAPERWEIGHT_API SqlLogger
{
  public:
    SqlLogger() = default;
    SqlLogger(SqlLogger const& /*other*/) = default;
    SqlLogger(SqlLogger&& /*other*/) = default;
    SqlLogger& operator=(SqlLogger const& /*other*/) = default;
    SqlLogger& operator=(SqlLogger&& /*other*/) = default;
    virtual ~SqlLogger() = default;

    /// Invoked on a warning.
    virtual void OnWarning(std::string_view const& message) = 0;

    /// Invoked when the database rejected a call, with the diagnostic record of that call.
    virtual void OnError(SqlErrorInfo const& errorInfo,
                         std::source_location sourceLocation = std::source_location::current()) = 0;

    /// Invoked when a connection is opened.
    virtual void OnConnectionOpened(SqlConnection const& connection) = 0;

    /// Invoked when a connection is closed.
    virtual void OnConnectionClosed(SqlConnection const& connection) = 0;

    /// Invoked when a direct query is executed.
    virtual void OnExecuteDirect(std::string_view const& query) = 0;

    /// Invoked when a row is fetched.
    virtual void OnFetchRow() = 0;

    /// Invoked when fetching is done.
    virtual void OnFetchEnd() = 0;

    /// Invoked right before the schema builder executes a DDL statement.
    virtual void OnSchemaStatement(std::string_view const& statement) = 0;

    /// Invoked when a schema operation failed and the schema builder discards the failure.
    ///
    /// Failures that are rethrown to the caller are not reported here.
    virtual void OnSchemaError(SqlSchemaError const& error) = 0;

    class Null;

    /// Retrieves a null logger that does nothing.
    static Null& NullLogger() noexcept;

    /// Retrieves a logger that writes warnings and errors to standard output.
    static SqlLogger& StandardLogger();

    /// Retrieves a logger that additionally writes every statement, with its duration, to standard output.
    static SqlLogger& TraceLogger();

    /// Retrieves the currently configured logger.
    static SqlLogger& GetLogger();

    /// Sets the current logger.
    ///
    /// The ownership of the logger is not transferred and remains with the caller.
    static void SetLogger(SqlLogger& logger);
};

class SqlLogger::Null: public SqlLogger
{
  public:
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
