// SPDX-License-Identifier: Apache-2.0

#include "SqlConnection.hpp"
#include "SqlDialect.hpp"

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

using namespace std::string_view_literals;

static SqlConnectionString gDefaultConnectionString {};
static std::atomic<uint64_t> gNextConnectionId { 1 };
static std::function<void(SqlConnection&)> gPostConnectedHook {};

// Substrings of SQL_DBMS_NAME identifying the server.
static constexpr auto ServerTypeMappings = std::array {
    std::pair { "Microsoft SQL Server"sv, SqlServerType::MICROSOFT_SQL },
    std::pair { "PostgreSQL"sv, SqlServerType::POSTGRESQL },
    std::pair { "SQLite"sv, SqlServerType::SQLITE },
    std::pair { "MySQL"sv, SqlServerType::MYSQL },
};

SqlConnection::SqlConnection():
    SqlConnection { std::optional { DefaultConnectionString() } }
{
}

SqlConnection::SqlConnection(std::optional<SqlConnectionString> connectInfo):
    m_connectionId { gNextConnectionId++ },
    m_dialect { &SqlDialect::Sqlite() }
{
    SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &m_hEnv);
    SQLSetEnvAttr(m_hEnv, SQL_ATTR_ODBC_VERSION, (SQLPOINTER) SQL_OV_ODBC3, 0);
    SQLAllocHandle(SQL_HANDLE_DBC, m_hEnv, &m_hDbc);

    if (connectInfo.has_value())
        Connect(std::move(*connectInfo));
}

SqlConnection::SqlConnection(SqlConnection&& other) noexcept:
    m_hEnv { std::exchange(other.m_hEnv, {}) },
    m_hDbc { std::exchange(other.m_hDbc, {}) },
    m_connectionId { other.m_connectionId },
    m_serverType { other.m_serverType },
    m_dialect { other.m_dialect },
    m_connectionString { std::move(other.m_connectionString) }
{
}

SqlConnection& SqlConnection::operator=(SqlConnection&& other) noexcept
{
    if (this == &other)
        return *this;

    Close();

    m_hEnv = std::exchange(other.m_hEnv, {});
    m_hDbc = std::exchange(other.m_hDbc, {});
    m_connectionId = other.m_connectionId;
    m_serverType = other.m_serverType;
    m_dialect = other.m_dialect;
    m_connectionString = std::move(other.m_connectionString);

    return *this;
}

SqlConnection::~SqlConnection() noexcept
{
    Close();
}

SqlConnectionString const& SqlConnection::DefaultConnectionString() noexcept
{
    return gDefaultConnectionString;
}

void SqlConnection::SetDefaultConnectionString(SqlConnectionString const& connectionString) noexcept
{
    gDefaultConnectionString = connectionString;
}

void SqlConnection::SetDefaultDataSource(SqlConnectionDataSource const& dataSource) noexcept
{
    gDefaultConnectionString = dataSource.ToConnectionString();
}

void SqlConnection::SetPostConnectedHook(std::function<void(SqlConnection&)> hook)
{
    gPostConnectedHook = std::move(hook);
}

bool SqlConnection::Connect(SqlConnectionDataSource const& info) noexcept
{
    if (m_hDbc)
        SQLDisconnect(m_hDbc);

    m_connectionString = info.ToConnectionString();

    // NOLINTNEXTLINE(performance-no-int-to-ptr)
    if (!SQL_SUCCEEDED(SQLSetConnectAttrA(m_hDbc, SQL_LOGIN_TIMEOUT, (SQLPOINTER) info.timeout.count(), 0)))
    {
        SqlLogger::GetLogger().OnError(LastError());
        return false;
    }

    return FinishConnect(SQLConnectA(m_hDbc,
                                     (SQLCHAR*) info.datasource.data(),
                                     (SQLSMALLINT) info.datasource.size(),
                                     (SQLCHAR*) info.username.data(),
                                     (SQLSMALLINT) info.username.size(),
                                     (SQLCHAR*) info.password.data(),
                                     (SQLSMALLINT) info.password.size()));
}

bool SqlConnection::Connect(SqlConnectionString sqlConnectionString) noexcept
{
    if (m_hDbc)
        SQLDisconnect(m_hDbc);

    m_connectionString = std::move(sqlConnectionString);

    auto const& connectionString = m_connectionString.value;
    return FinishConnect(SQLDriverConnectA(m_hDbc,
                                           (SQLHWND) nullptr,
                                           (SQLCHAR*) connectionString.data(),
                                           (SQLSMALLINT) connectionString.size(),
                                           nullptr,
                                           0,
                                           nullptr,
                                           SQL_DRIVER_NOPROMPT));
}

bool SqlConnection::FinishConnect(SQLRETURN connectResult) noexcept
{
    if (!SQL_SUCCEEDED(connectResult)
        || !SQL_SUCCEEDED(
            SQLSetConnectAttrA(m_hDbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER) SQL_AUTOCOMMIT_ON, SQL_IS_UINTEGER)))
    {
        SqlLogger::GetLogger().OnError(LastError());
        return false;
    }

    // Anything not recognized is spoken to in the SQLite dialect.
    auto const dbmsName = GetInfo(SQL_DBMS_NAME).value_or(std::string {});
    m_serverType = SqlServerType::UNKNOWN;
    for (auto const& [name, type]: ServerTypeMappings)
    {
        if (dbmsName.contains(name))
        {
            m_serverType = type;
            break;
        }
    }
    m_dialect = &SqlDialect::Get(m_serverType);

    SqlLogger::GetLogger().OnConnectionOpened(*this);

    if (gPostConnectedHook)
        gPostConnectedHook(*this);

    return true;
}

std::optional<std::string> SqlConnection::GetInfo(SQLUSMALLINT infoType) const
{
    std::string text(128, '\0');
    SQLSMALLINT textLength {};
    if (!SQL_SUCCEEDED(
            SQLGetInfoA(m_hDbc, infoType, (SQLPOINTER) text.data(), (SQLSMALLINT) text.size(), &textLength)))
        return std::nullopt;

    text.resize(static_cast<std::size_t>(textLength));
    return text;
}

SqlErrorInfo SqlConnection::LastError() const
{
    return SqlErrorInfo::fromConnectionHandle(m_hDbc);
}

void SqlConnection::Close() noexcept
{
    if (!m_hDbc)
        return;

    SqlLogger::GetLogger().OnConnectionClosed(*this);

    SQLDisconnect(m_hDbc);
    SQLFreeHandle(SQL_HANDLE_DBC, m_hDbc);
    SQLFreeHandle(SQL_HANDLE_ENV, m_hEnv);

    m_hDbc = {};
    m_hEnv = {};
}

std::string SqlConnection::ServerName() const
{
    if (auto name = GetInfo(SQL_DBMS_NAME); name)
        return std::move(*name);
    throw SqlException(LastError());
}

std::string SqlConnection::ServerVersion() const
{
    if (auto version = GetInfo(SQL_DBMS_VER); version)
        return std::move(*version);
    throw SqlException(LastError());
}

bool SqlConnection::TransactionActive() const noexcept
{
    SQLUINTEGER state {};
    SQLRETURN const sqlResult = SQLGetConnectAttrA(m_hDbc, SQL_ATTR_AUTOCOMMIT, &state, 0, nullptr);
    return sqlResult == SQL_SUCCESS && state == SQL_AUTOCOMMIT_OFF;
}

bool SqlConnection::IsAlive() const noexcept
{
    if (!m_hDbc)
        return false;

    SQLUINTEGER state {};
    SQLRETURN const sqlResult = SQLGetConnectAttrA(m_hDbc, SQL_ATTR_CONNECTION_DEAD, &state, 0, nullptr);
    return SQL_SUCCEEDED(sqlResult) && state == SQL_CD_FALSE;
}

void SqlConnection::RequireSuccess(SQLRETURN error, std::source_location sourceLocation) const
{
    if (SQL_SUCCEEDED(error))
        return;

    throw SqlException(LastError(), sourceLocation);
}
