// SPDX-License-Identifier: Apache-2.0

#include "SqlStatement.hpp"

#include <utility>

SqlStatement::SqlStatement():
    m_ownedConnection { SqlConnection() },
    // NOLINTNEXTLINE(bugprone-unchecked-optional-access)
    m_connection { &*m_ownedConnection }
{
    if (m_connection->NativeHandle())
        RequireSuccess(SQLAllocHandle(SQL_HANDLE_STMT, m_connection->NativeHandle(), &m_hStmt));
}

SqlStatement::SqlStatement(SqlConnection& relatedConnection):
    m_connection { &relatedConnection }
{
    RequireSuccess(SQLAllocHandle(SQL_HANDLE_STMT, m_connection->NativeHandle(), &m_hStmt));
}

SqlStatement::SqlStatement(SqlStatement&& other) noexcept:
    m_ownedConnection { std::move(other.m_ownedConnection) },
    m_connection { m_ownedConnection ? &*m_ownedConnection : other.m_connection },
    m_hStmt { std::exchange(other.m_hStmt, SQL_NULL_HSTMT) }
{
    other.m_ownedConnection.reset();
    other.m_connection = nullptr;
}

SqlStatement& SqlStatement::operator=(SqlStatement&& other) noexcept
{
    if (this == &other)
        return *this;

    if (m_hStmt)
        SQLFreeHandle(SQL_HANDLE_STMT, m_hStmt);

    m_ownedConnection = std::move(other.m_ownedConnection);
    m_connection = m_ownedConnection ? &*m_ownedConnection : other.m_connection;
    m_hStmt = std::exchange(other.m_hStmt, SQL_NULL_HSTMT);

    other.m_ownedConnection.reset();
    other.m_connection = nullptr;

    return *this;
}

SqlStatement::~SqlStatement() noexcept
{
    if (!m_hStmt)
        return;

    SqlLogger::GetLogger().OnFetchEnd();
    SQLFreeHandle(SQL_HANDLE_STMT, m_hStmt);
}

void SqlStatement::ExecuteDirect(std::string_view const& query, std::source_location location)
{
    if (query.empty())
        return;

    SqlLogger::GetLogger().OnExecuteDirect(query);

    CloseCursor();
    RequireSuccess(SQLExecDirectA(m_hStmt, (SQLCHAR*) query.data(), (SQLINTEGER) query.size()), location);
}

bool SqlStatement::FetchRow()
{
    auto const sqlResult = SQLFetch(m_hStmt);
    switch (sqlResult)
    {
        case SQL_NO_DATA:
            CloseCursor();
            SqlLogger::GetLogger().OnFetchEnd();
            return false;
        default:
            RequireSuccess(sqlResult);
            SqlLogger::GetLogger().OnFetchRow();
            return true;
    }
}

void SqlStatement::CloseCursor() noexcept
{
    SQLFreeStmt(m_hStmt, SQL_CLOSE);
}

std::optional<std::string> SqlStatement::GetStringColumn(SQLUSMALLINT column) const
{
    std::string result;
    result.resize(128);
    SQLLEN indicator {};
    size_t written = 0;

    while (true)
    {
        auto const sqlResult = SQLGetData(m_hStmt,
                                          column,
                                          SQL_C_CHAR,
                                          (SQLPOINTER) (result.data() + written),
                                          (SQLLEN) (result.size() - written + 1),
                                          &indicator);
        if (sqlResult == SQL_NO_DATA)
            break;

        RequireSuccess(sqlResult);

        if (indicator == SQL_NULL_DATA)
            return std::nullopt;

        // SQL_SUCCESS_WITH_INFO is only a truncation if the value did not fit into the remaining space.
        auto const available = result.size() - written;
        if (sqlResult == SQL_SUCCESS || (indicator != SQL_NO_TOTAL && static_cast<size_t>(indicator) <= available))
        {
            written += static_cast<size_t>(indicator);
            break;
        }

        // truncated, so grow the buffer and fetch the remainder
        written = result.size();
        result.resize(indicator != SQL_NO_TOTAL ? written + static_cast<size_t>(indicator) - available
                                                : result.size() * 2);
    }

    result.resize(written);
    return result;
}

std::optional<int64_t> SqlStatement::GetInt64Column(SQLUSMALLINT column) const
{
    SQLBIGINT value {};
    SQLLEN indicator {};
    RequireSuccess(SQLGetData(m_hStmt, column, SQL_C_SBIGINT, &value, sizeof(value), &indicator));
    if (indicator == SQL_NULL_DATA)
        return std::nullopt;
    return static_cast<int64_t>(value);
}

void SqlStatement::RequireSuccess(SQLRETURN error, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(error))
        return;

    throw SqlException(SqlErrorInfo::fromStatementHandle(m_hStmt), sourceLocation);
}
