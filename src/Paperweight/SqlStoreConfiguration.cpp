// SPDX-License-Identifier: Apache-2.0

#include "SqlBuilder.hpp"
#include "SqlConnection.hpp"
#include "SqlDialect.hpp"
#include "SqlSchema/CommandInterpreter.hpp"
#include "SqlStoreConfiguration.hpp"

#include <stdexcept>
#include <utility>

SqlStoreConfiguration SqlStoreConfiguration::ForServer(SqlServerType serverType, std::string tablePrefix)
{
    return SqlStoreConfiguration {
        .dialect = &SqlDialect::Get(serverType),
        .tablePrefix = std::move(tablePrefix),
    };
}

SqlStoreConfiguration SqlStoreConfiguration::ForConnection(SqlConnection const& connection, std::string tablePrefix)
{
    return SqlStoreConfiguration {
        .dialect = &connection.Dialect(),
        .tablePrefix = std::move(tablePrefix),
    };
}

SqlDialect const& SqlStoreConfiguration::Dialect() const
{
    if (!dialect)
        throw std::logic_error("No SQL dialect configured");
    return *dialect;
}

SqlCommandInterpreter SqlStoreConfiguration::CommandInterpreter() const
{
    return SqlCommandInterpreter { Dialect(), schema };
}

SqlBuilder SqlStoreConfiguration::CreateSqlBuilder() const
{
    return SqlBuilder { tablePrefix, Dialect() };
}
