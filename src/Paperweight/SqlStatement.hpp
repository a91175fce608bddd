// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #include <Windows.h>
#endif

#include "Api.hpp"
#include "SqlConnection.hpp"
#include "Utils.hpp"

#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <sql.h>
#include <sqlext.h>
#include <sqlspi.h>
#include <sqltypes.h>

template <typename T>
concept SqlGetColumnNativeType = detail::OneOf<T, std::string, int64_t>;

// High level API for direct (unprepared) SQL statements.
//
// The store issues DDL without parameters, so statements are executed directly.
// Result sets, if any, are walked with FetchRow() and read with GetColumn().
class SqlStatement final
{
  public:
    // Construct a new SqlStatement object, using a new connection, and connect to the default database.
    PAPERWEIGHT_API SqlStatement();

    PAPERWEIGHT_API SqlStatement(SqlStatement&&) noexcept;
    PAPERWEIGHT_API SqlStatement& operator=(SqlStatement&&) noexcept;

    SqlStatement(SqlStatement const&) noexcept = delete;
    SqlStatement& operator=(SqlStatement const&) noexcept = delete;

    // Construct a new SqlStatement object, using the given connection.
    PAPERWEIGHT_API explicit SqlStatement(SqlConnection& relatedConnection);

    PAPERWEIGHT_API ~SqlStatement() noexcept;

    // Retrieves the connection associated with this statement.
    [[nodiscard]] SqlConnection& Connection() noexcept
    {
        return *m_connection;
    }

    // Retrieves the connection associated with this statement.
    [[nodiscard]] SqlConnection const& Connection() const noexcept
    {
        return *m_connection;
    }

    // Retrieves the native handle of the statement.
    [[nodiscard]] SQLHSTMT NativeHandle() const noexcept
    {
        return m_hStmt;
    }

    // Executes the given query directly. Empty queries are ignored.
    PAPERWEIGHT_API void ExecuteDirect(std::string_view const& query,
                                       std::source_location location = std::source_location::current());

    // Fetches the next row of the result set.
    //
    // @note Automatically closes the cursor at the end of the result set.
    //
    // @retval true The next result row was successfully fetched
    // @retval false No result row was fetched, because the end of the result set was reached.
    [[nodiscard]] PAPERWEIGHT_API bool FetchRow();

    // Closes the result cursor on queries that yield a result set, e.g. SELECT statements.
    PAPERWEIGHT_API void CloseCursor() noexcept;

    // Retrieves the value of the column at the given index for the currently selected row.
    template <SqlGetColumnNativeType T>
    [[nodiscard]] T GetColumn(SQLUSMALLINT column) const;

    // Retrieves the value of the column at the given index for the currently selected row.
    //
    // If the value is NULL, std::nullopt is returned.
    template <SqlGetColumnNativeType T>
    [[nodiscard]] std::optional<T> GetNullableColumn(SQLUSMALLINT column) const;

  private:
    PAPERWEIGHT_API void RequireSuccess(SQLRETURN error,
                                        std::source_location sourceLocation = std::source_location::current()) const;

    [[nodiscard]] PAPERWEIGHT_API std::optional<std::string> GetStringColumn(SQLUSMALLINT column) const;
    [[nodiscard]] PAPERWEIGHT_API std::optional<int64_t> GetInt64Column(SQLUSMALLINT column) const;

    std::optional<SqlConnection> m_ownedConnection; // The connection object (if owned)
    SqlConnection* m_connection {};                 // Pointer to the connection object
    SQLHSTMT m_hStmt {};                            // The native ODBC statement handle
};

template <SqlGetColumnNativeType T>
inline std::optional<T> SqlStatement::GetNullableColumn(SQLUSMALLINT column) const
{
    if constexpr (std::same_as<T, std::string>)
        return GetStringColumn(column);
    else
        return GetInt64Column(column);
}

template <SqlGetColumnNativeType T>
inline T SqlStatement::GetColumn(SQLUSMALLINT column) const
{
    auto result = GetNullableColumn<T>(column);
    if (!result)
        throw std::runtime_error(std::format("Column {} is NULL", column));
    return std::move(*result);
}
