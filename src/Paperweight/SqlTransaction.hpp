// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlError.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <utility>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

class SqlConnection;

// How a transaction ends if it was neither committed nor rolled back explicitly.
enum class SqlTransactionMode : std::uint8_t
{
    NONE,
    COMMIT,
    ROLLBACK,
};

// Thrown if the database refuses to end a transaction.
class PAPERWEIGHT_API SqlTransactionException: public std::runtime_error
{
  public:
    SqlTransactionException(std::string const& message, SqlErrorInfo info):
        std::runtime_error(std::format("{}: {}", message, info.message)),
        m_info { std::move(info) }
    {
    }

    [[nodiscard]] SqlErrorInfo const& info() const noexcept
    {
        return m_info;
    }

  private:
    SqlErrorInfo m_info;
};

// Groups the statements issued on a connection into one unit of work.
//
// Auto-commit is disabled for as long as the transaction is active. A transaction that is still active
// when it goes out of scope ends with its default mode, except while an exception is propagating,
// in which case it is always rolled back. Schema operations that fail half way thus leave no partial tables behind
// on servers with transactional DDL.
class SqlTransaction
{
  public:
    SqlTransaction(SqlTransaction const&) = delete;
    SqlTransaction& operator=(SqlTransaction const&) = delete;
    SqlTransaction(SqlTransaction&&) = delete;
    SqlTransaction& operator=(SqlTransaction&&) = delete;

    PAPERWEIGHT_API explicit SqlTransaction(SqlConnection& connection,
                                            SqlTransactionMode defaultMode = SqlTransactionMode::COMMIT,
                                            std::source_location location = std::source_location::current());

    PAPERWEIGHT_API ~SqlTransaction() noexcept;

    // Retrieves the connection this transaction is running on.
    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return *m_connection;
    }

    // Tests whether the transaction has neither been committed nor rolled back yet.
    [[nodiscard]] bool IsActive() const noexcept
    {
        return m_active;
    }

    // Rolls back the transaction, throwing SqlTransactionException on failure.
    PAPERWEIGHT_API void Rollback();

    // Commits the transaction, throwing SqlTransactionException on failure.
    PAPERWEIGHT_API void Commit();

    // Rolls back the transaction and reports whether that succeeded.
    PAPERWEIGHT_API bool TryRollback() noexcept;

    // Commits the transaction and reports whether that succeeded.
    PAPERWEIGHT_API bool TryCommit() noexcept;

  private:
    // Ends the transaction, returning the diagnostics of the failing call if any.
    std::optional<SqlErrorInfo> End(SQLSMALLINT completionType) noexcept;

    SqlConnection* m_connection;
    SQLHDBC m_hDbc;
    SqlTransactionMode m_defaultMode;
    std::source_location m_location;
    int m_uncaughtExceptions;
    bool m_active = true;
};
