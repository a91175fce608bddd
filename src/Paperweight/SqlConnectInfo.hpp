// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <chrono>
#include <format>
#include <string>
#include <string_view>

/// An ODBC connection string, e.g. @c "DRIVER=SQLite3;Database=store.db".
struct SqlConnectionString
{
    std::string value;

    PAPERWEIGHT_API auto operator<=>(SqlConnectionString const&) const noexcept = default;

    /// The connection string with the password masked, suitable for logging.
    [[nodiscard]] PAPERWEIGHT_API std::string Sanitized() const;

    /// Masks the value of every @c PWD attribute (case-insensitive) of the given connection string.
    [[nodiscard]] PAPERWEIGHT_API static std::string SanitizePwd(std::string_view input);
};

/// A data source registered with the ODBC driver manager, and the credentials to log into it.
struct SqlConnectionDataSource
{
    std::string datasource;
    std::string username;
    std::string password;
    std::chrono::seconds timeout { 5 };

    [[nodiscard]] SqlConnectionString ToConnectionString() const
    {
        return SqlConnectionString { .value = std::format("DSN={};UID={};PWD={};TIMEOUT={}",
                                                          datasource,
                                                          username,
                                                          password,
                                                          timeout.count()) };
    }

    PAPERWEIGHT_API auto operator<=>(SqlConnectionDataSource const&) const noexcept = default;
};
