// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlLogger.hpp"
#include "SqlTransaction.hpp"

#include <exception>

SqlTransaction::SqlTransaction(SqlConnection& connection,
                               SqlTransactionMode defaultMode,
                               std::source_location location):
    m_connection { &connection },
    m_hDbc { connection.NativeHandle() },
    m_defaultMode { defaultMode },
    m_location { location },
    m_uncaughtExceptions { std::uncaught_exceptions() }
{
    connection.RequireSuccess(
        SQLSetConnectAttr(m_hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) SQL_AUTOCOMMIT_OFF, SQL_IS_UINTEGER), m_location);
}

SqlTransaction::~SqlTransaction() noexcept
{
    if (!m_active)
        return;

    if (std::uncaught_exceptions() > m_uncaughtExceptions)
    {
        TryRollback();
        return;
    }

    switch (m_defaultMode)
    {
        case SqlTransactionMode::NONE:
            break;
        case SqlTransactionMode::COMMIT:
            TryCommit();
            break;
        case SqlTransactionMode::ROLLBACK:
            TryRollback();
            break;
    }
}

std::optional<SqlErrorInfo> SqlTransaction::End(SQLSMALLINT completionType) noexcept
{
    auto const succeeded = [](SQLRETURN result) {
        return result == SQL_SUCCESS || result == SQL_SUCCESS_WITH_INFO;
    };

    if (!succeeded(SQLEndTran(SQL_HANDLE_DBC, m_hDbc, completionType))
        || !succeeded(
            SQLSetConnectAttr(m_hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) SQL_AUTOCOMMIT_ON, SQL_IS_UINTEGER)))
    {
        auto info = SqlErrorInfo::fromConnectionHandle(m_hDbc);
        SqlLogger::GetLogger().OnError(info, m_location);
        return info;
    }

    m_active = false;
    return std::nullopt;
}

bool SqlTransaction::TryRollback() noexcept
{
    return !End(SQL_ROLLBACK).has_value();
}

bool SqlTransaction::TryCommit() noexcept
{
    return !End(SQL_COMMIT).has_value();
}

void SqlTransaction::Rollback()
{
    if (auto error = End(SQL_ROLLBACK); error)
        throw SqlTransactionException("Failed to roll back the transaction", std::move(*error));
}

void SqlTransaction::Commit()
{
    if (auto error = End(SQL_COMMIT); error)
        throw SqlTransactionException("Failed to commit the transaction", std::move(*error));
}
