// SPDX-License-Identifier: Apache-2.0

#include "SqlError.hpp"
#include "SqlLogger.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

SqlException::SqlException(SqlErrorInfo info, std::source_location sourceLocation):
    std::runtime_error(std::format("{}", info)),
    _info { std::move(info) }
{
    SqlLogger::GetLogger().OnError(_info, sourceLocation);
}

bool SqlException::IsDuplicateObject() const noexcept
{
    // Table or view (ODBC, SQL Server, MySQL), relation and object (PostgreSQL), and index (ODBC).
    static constexpr auto DuplicateObjectStates = std::array { "42S01"sv, "42P07"sv, "42710"sv, "42S11"sv };

    auto const sqlState = std::string_view(_info.sqlState).substr(0, 5);
    if (std::ranges::find(DuplicateObjectStates, sqlState) != DuplicateObjectStates.end())
        return true;

    // SQLite reports nearly every failure as HY000, so only the message tells.
    return _info.message.find("already exists") != std::string::npos;
}
