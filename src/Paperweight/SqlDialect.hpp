// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlSchema/SchemaCommands.hpp"
#include "SqlServerType.hpp"

#include <string>
#include <string_view>
#include <vector>

class SqlBuilder;

/// API to describe the SQL dialect of a database engine.
///
/// A dialect knows how identifiers are quoted, how legal constraint names look,
/// how result sets are paged and how schema commands are spelled.
/// Dialects are stateless and shared process wide, see Sqlite(), PostgreSQL(), SqlServer(), MySQL().
class [[nodiscard]] PAPERWEIGHT_API SqlDialect
{
  public:
    SqlDialect() = default;
    SqlDialect(SqlDialect&&) = default;
    SqlDialect(SqlDialect const&) = default;
    SqlDialect& operator=(SqlDialect&&) = default;
    SqlDialect& operator=(SqlDialect const&) = default;
    virtual ~SqlDialect() = default;

    using StringList = std::vector<std::string>;

    /// The server type this dialect is spoken by.
    [[nodiscard]] virtual SqlServerType ServerType() const noexcept = 0;

    /// Quotes the given table name, qualified by @p schema if not empty.
    [[nodiscard]] virtual std::string QuoteForTableName(std::string_view tableName, std::string_view schema) const = 0;

    /// Quotes the given column name.
    [[nodiscard]] virtual std::string QuoteForColumnName(std::string_view columnName) const = 0;

    /// Quotes the given alias name.
    [[nodiscard]] virtual std::string QuoteForAliasName(std::string_view aliasName) const = 0;

    /// Makes the given name legal as a constraint name.
    [[nodiscard]] virtual std::string FormatKeyName(std::string_view name) const = 0;

    /// Makes the given name legal as an index name.
    [[nodiscard]] virtual std::string FormatIndexName(std::string_view name) const = 0;

    /// Suffix appended to DROP TABLE statements to cascade to dependent constraints.
    ///
    /// An empty string means the dialect cannot cascade, so foreign keys must be dropped first.
    [[nodiscard]] virtual std::string_view CascadeConstraintsString() const noexcept = 0;

    /// Expression to order a result set randomly.
    [[nodiscard]] virtual std::string_view RandomOrderByClause() const noexcept = 0;

    /// Tests whether SELECT DISTINCT ON (expression) is understood.
    [[nodiscard]] virtual bool SupportsDistinctOn() const noexcept = 0;

    /// Rewrites the given query builder to page its result set.
    ///
    /// @param builder The query builder to modify.
    /// @param skip Number of rows to skip, or empty if no rows are skipped.
    /// @param count Number of rows to return, or empty for no limit.
    ///
    /// Both values are raw SQL text, so they can be literals or parameter placeholders.
    virtual void Page(SqlBuilder& builder, std::string_view skip, std::string_view count) const = 0;

    /// Convert the given column type definition to the SQL type.
    [[nodiscard]] virtual std::string ColumnType(SqlColumnTypeDefinition const& type) const = 0;

    /// Constructs the statements creating the given table.
    [[nodiscard]] virtual StringList CreateTable(std::string_view schema, SqlCreateTableCommand const& command) const = 0;

    /// Constructs the statements altering the given table, one per operation.
    [[nodiscard]] virtual StringList AlterTable(std::string_view schema, SqlAlterTableCommand const& command) const = 0;

    /// Constructs the statements dropping the given table.
    [[nodiscard]] virtual StringList DropTable(std::string_view schema, SqlDropTableCommand const& command) const = 0;

    /// Constructs the statements adding a foreign key to an existing table.
    [[nodiscard]] virtual StringList CreateForeignKey(std::string_view schema,
                                                      SqlCreateForeignKeyCommand const& command) const = 0;

    /// Constructs the statements dropping a foreign key.
    [[nodiscard]] virtual StringList DropForeignKey(std::string_view schema,
                                                    SqlDropForeignKeyCommand const& command) const = 0;

    /// Constructs the statements creating a schema (namespace of tables).
    [[nodiscard]] virtual StringList CreateSchema(SqlCreateSchemaCommand const& command) const = 0;

    /// Retrieves the dialect for SQLite.
    static SqlDialect const& Sqlite();

    /// Retrieves the dialect for Microsoft SQL server.
    static SqlDialect const& SqlServer();

    /// Retrieves the dialect for PostgreSQL.
    static SqlDialect const& PostgreSQL();

    /// Retrieves the dialect for MySQL.
    static SqlDialect const& MySQL();

    /// Retrieves the dialect for the given SqlServerType.
    ///
    /// Unknown servers are spoken to in the SQLite dialect.
    static SqlDialect const& Get(SqlServerType serverType) noexcept;
};
