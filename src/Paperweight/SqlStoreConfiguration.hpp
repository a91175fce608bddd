// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlColumnTypeDefinitions.hpp"
#include "SqlServerType.hpp"
#include "SqlTableNameConvention.hpp"

#include <memory>
#include <string>

class SqlBuilder;
class SqlCommandInterpreter;
class SqlConnection;
class SqlDialect;

/// Settings shared by the schema builder and the SQL builder of one document store.
struct PAPERWEIGHT_API SqlStoreConfiguration
{
    SqlDialect const* dialect {};

    // Prepended to every table, foreign key and index name.
    std::string tablePrefix {};

    // Schema the tables live in, or empty for the default schema of the connection.
    std::string schema {};

    std::shared_ptr<SqlTableNameConvention const> tableNameConvention =
        std::make_shared<SqlDefaultTableNameConvention>();

    SqlIdentityColumnSize identityColumnSize = SqlIdentityColumnSize::Int64;

    /// Creates a configuration speaking the dialect of the given server type.
    static SqlStoreConfiguration ForServer(SqlServerType serverType, std::string tablePrefix = {});

    /// Creates a configuration speaking the dialect of the server the given connection is connected to.
    static SqlStoreConfiguration ForConnection(SqlConnection const& connection, std::string tablePrefix = {});

    /// The column type of identity columns and columns referencing them.
    [[nodiscard]] SqlColumnTypeDefinition IdentityColumnType() const noexcept
    {
        return ToColumnType(identityColumnSize);
    }

    /// Retrieves the dialect.
    ///
    /// @throws std::logic_error if no dialect has been configured.
    [[nodiscard]] SqlDialect const& Dialect() const;

    /// Creates a command interpreter for the configured dialect and schema.
    [[nodiscard]] SqlCommandInterpreter CommandInterpreter() const;

    /// Creates an empty SQL builder for the configured dialect and table prefix.
    [[nodiscard]] SqlBuilder CreateSqlBuilder() const;
};
