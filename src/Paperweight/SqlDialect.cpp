// SPDX-License-Identifier: Apache-2.0

#include "SqlBuilder.hpp"
#include "SqlDialect.hpp"
#include "Utils.hpp"

#include <concepts>
#include <format>
#include <sstream>
#include <stdexcept>
#include <type_traits>

using namespace std::string_view_literals;

namespace
{

// Speaks SQLite. The other dialects derive from it and override what they spell differently.
class BasicSqlDialect: public SqlDialect
{
  public:
    [[nodiscard]] SqlServerType ServerType() const noexcept override
    {
        return SqlServerType::SQLITE;
    }

    [[nodiscard]] std::string QuoteForTableName(std::string_view tableName, std::string_view schema) const override
    {
        if (schema.empty())
            return QuoteIdentifier(tableName);
        return std::format("{}.{}", QuoteIdentifier(schema), QuoteIdentifier(tableName));
    }

    [[nodiscard]] std::string QuoteForColumnName(std::string_view columnName) const override
    {
        return QuoteIdentifier(columnName);
    }

    [[nodiscard]] std::string QuoteForAliasName(std::string_view aliasName) const override
    {
        return QuoteIdentifier(aliasName);
    }

    [[nodiscard]] std::string FormatKeyName(std::string_view name) const override
    {
        return Truncate(name);
    }

    [[nodiscard]] std::string FormatIndexName(std::string_view name) const override
    {
        return Truncate(name);
    }

    [[nodiscard]] std::string_view CascadeConstraintsString() const noexcept override
    {
        return ""sv;
    }

    [[nodiscard]] std::string_view RandomOrderByClause() const noexcept override
    {
        return "random()"sv;
    }

    [[nodiscard]] bool SupportsDistinctOn() const noexcept override
    {
        return false;
    }

    void Page(SqlBuilder& builder, std::string_view skip, std::string_view count) const override
    {
        if (skip.empty())
        {
            if (!count.empty())
                builder.Trail(std::format(" LIMIT {}", count));
            return;
        }

        // SQLite does not know OFFSET without LIMIT, and a negative limit means no limit.
        builder.Trail(std::format(" LIMIT {} OFFSET {}", count.empty() ? "-1"sv : count, skip));
    }

    [[nodiscard]] std::string ColumnType(SqlColumnTypeDefinition const& type) const override
    {
        using namespace SqlColumnTypeDefinitions;
        return std::visit(
            [](auto const& actualType) -> std::string {
                using Type = std::decay_t<decltype(actualType)>;
                if constexpr (std::same_as<Type, Bigint>)
                    return "BIGINT";
                else if constexpr (std::same_as<Type, Bool>)
                    return "BOOLEAN";
                else if constexpr (std::same_as<Type, Char>)
                    return std::format("CHAR({})", actualType.size);
                else if constexpr (std::same_as<Type, Date>)
                    return "DATE";
                else if constexpr (std::same_as<Type, DateTime>)
                    return "DATETIME";
                else if constexpr (std::same_as<Type, Decimal>)
                    return std::format("DECIMAL({}, {})", actualType.precision, actualType.scale);
                else if constexpr (std::same_as<Type, Guid>)
                    return "GUID";
                else if constexpr (std::same_as<Type, Integer>)
                    return "INTEGER";
                else if constexpr (std::same_as<Type, NChar>)
                    return std::format("NCHAR({})", actualType.size);
                else if constexpr (std::same_as<Type, NVarchar>)
                    return std::format("NVARCHAR({})", actualType.size);
                else if constexpr (std::same_as<Type, Real>)
                    return "REAL";
                else if constexpr (std::same_as<Type, Smallint>)
                    return "SMALLINT";
                else if constexpr (std::same_as<Type, Text>)
                    return "TEXT";
                else if constexpr (std::same_as<Type, Time>)
                    return "TIME";
                else if constexpr (std::same_as<Type, Timestamp>)
                    return "TIMESTAMP";
                else if constexpr (std::same_as<Type, Varchar>)
                    return std::format("VARCHAR({})", actualType.size);
                else
                    static_assert(detail::AlwaysFalse<Type>, "non-exhaustive visitor");
            },
            type);
    }

    [[nodiscard]] StringList CreateTable(std::string_view schema, SqlCreateTableCommand const& command) const override
    {
        std::stringstream sqlQueryString;
        sqlQueryString << "CREATE TABLE " << QuoteForTableName(command.tableName, schema) << " (";

        size_t currentColumn = 0;
        std::string primaryKeyColumns;
        for (SqlColumnDeclaration const& column: command.columns)
        {
            if (currentColumn > 0)
                sqlQueryString << ",";
            ++currentColumn;
            sqlQueryString << "\n    " << BuildColumnDefinition(column);

            // identity columns carry their primary key inline
            if (column.primaryKey && !column.identity)
            {
                if (!primaryKeyColumns.empty())
                    primaryKeyColumns += ", ";
                primaryKeyColumns += QuoteForColumnName(column.name);
            }
        }

        if (!primaryKeyColumns.empty())
            sqlQueryString << ",\n    PRIMARY KEY (" << primaryKeyColumns << ")";

        sqlQueryString << "\n);";
        return { sqlQueryString.str() };
    }

    [[nodiscard]] StringList AlterTable(std::string_view schema, SqlAlterTableCommand const& command) const override
    {
        auto const quotedTable = QuoteForTableName(command.tableName, schema);

        StringList sqlQueries;
        for (SqlAlterTableOperation const& operation: command.operations)
            sqlQueries.emplace_back(AlterTableOperation(quotedTable, schema, command, operation));
        return sqlQueries;
    }

    [[nodiscard]] StringList DropTable(std::string_view schema, SqlDropTableCommand const& command) const override
    {
        return { std::format("DROP TABLE {}{};", QuoteForTableName(command.tableName, schema), CascadeConstraintsString()) };
    }

    [[nodiscard]] StringList CreateForeignKey(std::string_view /*schema*/,
                                              SqlCreateForeignKeyCommand const& /*command*/) const override
    {
        // SQLite can only declare foreign keys when creating a table.
        return {};
    }

    [[nodiscard]] StringList DropForeignKey(std::string_view /*schema*/,
                                            SqlDropForeignKeyCommand const& /*command*/) const override
    {
        return {};
    }

    [[nodiscard]] StringList CreateSchema(SqlCreateSchemaCommand const& /*command*/) const override
    {
        // SQLite schemas are attached databases, they cannot be created by a statement.
        return {};
    }

  protected:
    [[nodiscard]] virtual std::string QuoteIdentifier(std::string_view identifier) const
    {
        return std::format(R"("{}")", identifier);
    }

    // Longest identifier the engine accepts, or 0 if there is no practical limit.
    [[nodiscard]] virtual std::size_t MaxIdentifierLength() const noexcept
    {
        return 0;
    }

    [[nodiscard]] std::string Truncate(std::string_view name) const
    {
        if (auto const limit = MaxIdentifierLength(); limit != 0 && name.size() > limit)
            name = name.substr(0, limit);
        return std::string(name);
    }

    [[nodiscard]] std::string QuoteColumnList(std::vector<std::string> const& columns) const
    {
        std::string result;
        for (auto const& column: columns)
        {
            if (!result.empty())
                result += ", ";
            result += QuoteForColumnName(column);
        }
        return result;
    }

    [[nodiscard]] virtual std::string BuildColumnDefinition(SqlColumnDeclaration const& column) const
    {
        std::stringstream sqlQueryString;

        sqlQueryString << QuoteForColumnName(column.name) << ' ';

        // SQLite only auto increments INTEGER PRIMARY KEY columns, which are 64 bit wide anyway.
        if (column.identity)
            sqlQueryString << ColumnType(SqlColumnTypeDefinitions::Integer {});
        else
            sqlQueryString << ColumnType(column.type);

        if (column.required)
            sqlQueryString << " NOT NULL";

        if (column.identity)
            sqlQueryString << " PRIMARY KEY AUTOINCREMENT";
        else if (column.unique)
            sqlQueryString << " UNIQUE";

        if (column.defaultValue)
            sqlQueryString << " DEFAULT " << *column.defaultValue;

        return sqlQueryString.str();
    }

    [[nodiscard]] std::string AddColumnKeyword() const
    {
        return ServerType() == SqlServerType::MICROSOFT_SQL ? "ADD" : "ADD COLUMN";
    }

    [[nodiscard]] virtual std::string AlterTableOperation(std::string const& quotedTable,
                                                          std::string_view schema,
                                                          SqlAlterTableCommand const& command,
                                                          SqlAlterTableOperation const& operation) const
    {
        using namespace SqlAlterTableCommands;
        return std::visit(
            detail::overloaded {
                [&](AddColumn const& actualCommand) -> std::string {
                    return std::format("ALTER TABLE {} {} {} {} {};",
                                       quotedTable,
                                       AddColumnKeyword(),
                                       QuoteForColumnName(actualCommand.columnName),
                                       ColumnType(actualCommand.columnType),
                                       actualCommand.nullable ? "NULL" : "NOT NULL");
                },
                [&](DropColumn const& actualCommand) -> std::string {
                    return std::format(
                        "ALTER TABLE {} DROP COLUMN {};", quotedTable, QuoteForColumnName(actualCommand.columnName));
                },
                [&](AlterColumn const& actualCommand) -> std::string {
                    return AlterColumnStatement(quotedTable, actualCommand);
                },
                [&](RenameColumn const& actualCommand) -> std::string {
                    return RenameColumnStatement(quotedTable, actualCommand);
                },
                [&](AddDefault const& actualCommand) -> std::string {
                    return AddDefaultStatement(quotedTable, command.tableName, actualCommand);
                },
                [&](CreateIndex const& actualCommand) -> std::string {
                    return std::format("CREATE {}INDEX {} ON {} ({});",
                                       actualCommand.unique ? "UNIQUE "sv : ""sv,
                                       QuoteIdentifier(actualCommand.indexName),
                                       quotedTable,
                                       QuoteColumnList(actualCommand.columns));
                },
                [&](DropIndex const& actualCommand) -> std::string {
                    return DropIndexStatement(quotedTable, schema, actualCommand);
                },
            },
            operation);
    }

    [[nodiscard]] virtual std::string AlterColumnStatement(std::string const& /*quotedTable*/,
                                                           SqlAlterTableCommands::AlterColumn const& command) const
    {
        throw std::runtime_error(
            std::format("Altering column {} is not supported by {}", command.columnName, ServerType()));
    }

    [[nodiscard]] virtual std::string RenameColumnStatement(std::string const& quotedTable,
                                                            SqlAlterTableCommands::RenameColumn const& command) const
    {
        return std::format("ALTER TABLE {} RENAME COLUMN {} TO {};",
                           quotedTable,
                           QuoteForColumnName(command.oldColumnName),
                           QuoteForColumnName(command.newColumnName));
    }

    [[nodiscard]] virtual std::string AddDefaultStatement(std::string const& /*quotedTable*/,
                                                          std::string_view /*tableName*/,
                                                          SqlAlterTableCommands::AddDefault const& command) const
    {
        throw std::runtime_error(
            std::format("Adding a default to column {} is not supported by {}", command.columnName, ServerType()));
    }

    [[nodiscard]] virtual std::string DropIndexStatement(std::string const& /*quotedTable*/,
                                                         std::string_view schema,
                                                         SqlAlterTableCommands::DropIndex const& command) const
    {
        // Index names are scoped by the schema, not by the table.
        return std::format("DROP INDEX {};", QuoteForTableName(command.indexName, schema));
    }

    [[nodiscard]] std::string ForeignKeyStatement(std::string_view schema,
                                                  SqlCreateForeignKeyCommand const& command) const
    {
        return std::format("ALTER TABLE {} ADD CONSTRAINT {} FOREIGN KEY ({}) REFERENCES {} ({});",
                           QuoteForTableName(command.sourceTable, schema),
                           QuoteIdentifier(command.name),
                           QuoteColumnList(command.sourceColumns),
                           QuoteForTableName(command.destinationTable, schema),
                           QuoteColumnList(command.destinationColumns));
    }
};

class PostgreSqlDialect final: public BasicSqlDialect
{
  public:
    [[nodiscard]] SqlServerType ServerType() const noexcept override
    {
        return SqlServerType::POSTGRESQL;
    }

    [[nodiscard]] std::string_view CascadeConstraintsString() const noexcept override
    {
        return " CASCADE"sv;
    }

    [[nodiscard]] bool SupportsDistinctOn() const noexcept override
    {
        return true;
    }

    void Page(SqlBuilder& builder, std::string_view skip, std::string_view count) const override
    {
        if (!count.empty())
            builder.Trail(std::format(" LIMIT {}", count));

        if (!skip.empty())
            builder.Trail(std::format(" OFFSET {}", skip));
    }

    [[nodiscard]] std::string ColumnType(SqlColumnTypeDefinition const& type) const override
    {
        using namespace SqlColumnTypeDefinitions;
        return std::visit(
            [this, &type](auto const& actualType) -> std::string {
                using Type = std::decay_t<decltype(actualType)>;
                if constexpr (std::same_as<Type, NChar>)
                    // PostgreSQL stores all strings as UTF-8
                    return std::format("CHAR({})", actualType.size);
                else if constexpr (std::same_as<Type, NVarchar>)
                    // PostgreSQL stores all strings as UTF-8
                    return std::format("VARCHAR({})", actualType.size);
                else if constexpr (std::same_as<Type, Guid>)
                    return "UUID";
                else if constexpr (std::same_as<Type, DateTime>)
                    return "TIMESTAMP";
                else
                    return BasicSqlDialect::ColumnType(type);
            },
            type);
    }

    [[nodiscard]] StringList CreateForeignKey(std::string_view schema,
                                              SqlCreateForeignKeyCommand const& command) const override
    {
        return { ForeignKeyStatement(schema, command) };
    }

    [[nodiscard]] StringList DropForeignKey(std::string_view schema,
                                            SqlDropForeignKeyCommand const& command) const override
    {
        return { std::format("ALTER TABLE {} DROP CONSTRAINT {};",
                             QuoteForTableName(command.sourceTable, schema),
                             QuoteIdentifier(command.name)) };
    }

    [[nodiscard]] StringList CreateSchema(SqlCreateSchemaCommand const& command) const override
    {
        return { std::format("CREATE SCHEMA IF NOT EXISTS {};", QuoteIdentifier(command.schemaName)) };
    }

  protected:
    [[nodiscard]] std::size_t MaxIdentifierLength() const noexcept override
    {
        return 63;
    }

    [[nodiscard]] std::string BuildColumnDefinition(SqlColumnDeclaration const& column) const override
    {
        std::stringstream sqlQueryString;

        sqlQueryString << QuoteForColumnName(column.name) << ' ';

        if (column.identity)
            sqlQueryString << (std::holds_alternative<SqlColumnTypeDefinitions::Integer>(column.type) ? "SERIAL"
                                                                                                     : "BIGSERIAL");
        else
            sqlQueryString << ColumnType(column.type);

        if (column.required)
            sqlQueryString << " NOT NULL";

        if (column.identity)
            sqlQueryString << " PRIMARY KEY";
        else if (column.unique)
            sqlQueryString << " UNIQUE";

        if (column.defaultValue)
            sqlQueryString << " DEFAULT " << *column.defaultValue;

        return sqlQueryString.str();
    }

    [[nodiscard]] std::string AlterColumnStatement(std::string const& quotedTable,
                                                   SqlAlterTableCommands::AlterColumn const& command) const override
    {
        auto const column = QuoteForColumnName(command.columnName);
        return std::format("ALTER TABLE {0} ALTER COLUMN {1} TYPE {2}, ALTER COLUMN {1} {3};",
                           quotedTable,
                           column,
                           ColumnType(command.columnType),
                           command.nullable ? "DROP NOT NULL" : "SET NOT NULL");
    }

    [[nodiscard]] std::string AddDefaultStatement(std::string const& quotedTable,
                                                  std::string_view /*tableName*/,
                                                  SqlAlterTableCommands::AddDefault const& command) const override
    {
        return std::format("ALTER TABLE {} ALTER COLUMN {} SET DEFAULT {};",
                           quotedTable,
                           QuoteForColumnName(command.columnName),
                           command.value);
    }
};

class SqlServerDialect final: public BasicSqlDialect
{
  public:
    [[nodiscard]] SqlServerType ServerType() const noexcept override
    {
        return SqlServerType::MICROSOFT_SQL;
    }

    [[nodiscard]] std::string_view RandomOrderByClause() const noexcept override
    {
        return "newid()"sv;
    }

    void Page(SqlBuilder& builder, std::string_view skip, std::string_view count) const override
    {
        if (skip.empty())
        {
            if (!count.empty())
                builder.InsertSelector(std::format("TOP ({}) ", count));
            return;
        }

        // OFFSET is part of the ORDER BY clause, so there must be one.
        if (!builder.HasOrder())
            builder.OrderBy("(SELECT NULL)");

        builder.Trail(std::format(" OFFSET {} ROWS", skip));

        if (!count.empty())
            builder.Trail(std::format(" FETCH NEXT {} ROWS ONLY", count));
    }

    [[nodiscard]] std::string ColumnType(SqlColumnTypeDefinition const& type) const override
    {
        using namespace SqlColumnTypeDefinitions;
        return std::visit(
            [this, &type](auto const& actualType) -> std::string {
                using Type = std::decay_t<decltype(actualType)>;
                if constexpr (std::same_as<Type, Bool>)
                    return "BIT";
                else if constexpr (std::same_as<Type, Guid>)
                    return "UNIQUEIDENTIFIER";
                else if constexpr (std::same_as<Type, Text>)
                    return "VARCHAR(MAX)";
                else
                    return BasicSqlDialect::ColumnType(type);
            },
            type);
    }

    [[nodiscard]] StringList CreateForeignKey(std::string_view schema,
                                              SqlCreateForeignKeyCommand const& command) const override
    {
        return { ForeignKeyStatement(schema, command) };
    }

    [[nodiscard]] StringList DropForeignKey(std::string_view schema,
                                            SqlDropForeignKeyCommand const& command) const override
    {
        return { std::format("ALTER TABLE {} DROP CONSTRAINT {};",
                             QuoteForTableName(command.sourceTable, schema),
                             QuoteIdentifier(command.name)) };
    }

    [[nodiscard]] StringList CreateSchema(SqlCreateSchemaCommand const& command) const override
    {
        return { std::format("CREATE SCHEMA {};", QuoteIdentifier(command.schemaName)) };
    }

  protected:
    [[nodiscard]] std::string QuoteIdentifier(std::string_view identifier) const override
    {
        return std::format("[{}]", identifier);
    }

    [[nodiscard]] std::size_t MaxIdentifierLength() const noexcept override
    {
        return 128;
    }

    [[nodiscard]] std::string BuildColumnDefinition(SqlColumnDeclaration const& column) const override
    {
        std::stringstream sqlQueryString;
        sqlQueryString << QuoteForColumnName(column.name) << ' ' << ColumnType(column.type);

        if (column.required)
            sqlQueryString << " NOT NULL";

        if (column.identity)
            sqlQueryString << " IDENTITY(1,1) PRIMARY KEY";
        else if (column.unique)
            sqlQueryString << " UNIQUE";

        if (column.defaultValue)
            sqlQueryString << " DEFAULT " << *column.defaultValue;

        return sqlQueryString.str();
    }

    [[nodiscard]] std::string AlterColumnStatement(std::string const& quotedTable,
                                                   SqlAlterTableCommands::AlterColumn const& command) const override
    {
        return std::format("ALTER TABLE {} ALTER COLUMN {} {} {};",
                           quotedTable,
                           QuoteForColumnName(command.columnName),
                           ColumnType(command.columnType),
                           command.nullable ? "NULL" : "NOT NULL");
    }

    [[nodiscard]] std::string RenameColumnStatement(std::string const& quotedTable,
                                                    SqlAlterTableCommands::RenameColumn const& command) const override
    {
        return std::format("EXEC sp_rename '{}.{}', '{}', 'COLUMN';",
                           quotedTable,
                           QuoteForColumnName(command.oldColumnName),
                           command.newColumnName);
    }

    [[nodiscard]] std::string AddDefaultStatement(std::string const& quotedTable,
                                                  std::string_view tableName,
                                                  SqlAlterTableCommands::AddDefault const& command) const override
    {
        return std::format("ALTER TABLE {} ADD CONSTRAINT {} DEFAULT {} FOR {};",
                           quotedTable,
                           QuoteIdentifier(FormatKeyName(std::format("DF_{}_{}", tableName, command.columnName))),
                           command.value,
                           QuoteForColumnName(command.columnName));
    }

    [[nodiscard]] std::string DropIndexStatement(std::string const& quotedTable,
                                                 std::string_view /*schema*/,
                                                 SqlAlterTableCommands::DropIndex const& command) const override
    {
        return std::format("DROP INDEX {} ON {};", QuoteIdentifier(command.indexName), quotedTable);
    }
};

class MySqlDialect final: public BasicSqlDialect
{
  public:
    [[nodiscard]] SqlServerType ServerType() const noexcept override
    {
        return SqlServerType::MYSQL;
    }

    [[nodiscard]] std::string_view RandomOrderByClause() const noexcept override
    {
        return "rand()"sv;
    }

    void Page(SqlBuilder& builder, std::string_view skip, std::string_view count) const override
    {
        if (skip.empty())
        {
            if (!count.empty())
                builder.Trail(std::format(" LIMIT {}", count));
            return;
        }

        // MySQL has no OFFSET without LIMIT, so the largest possible row count stands in for "all rows".
        builder.Trail(std::format(" LIMIT {}, {}", skip, count.empty() ? "18446744073709551615"sv : count));
    }

    [[nodiscard]] std::string ColumnType(SqlColumnTypeDefinition const& type) const override
    {
        using namespace SqlColumnTypeDefinitions;
        return std::visit(
            [this, &type](auto const& actualType) -> std::string {
                using Type = std::decay_t<decltype(actualType)>;
                if constexpr (std::same_as<Type, Bool>)
                    return "BIT";
                else if constexpr (std::same_as<Type, Guid>)
                    return "CHAR(36)";
                else if constexpr (std::same_as<Type, NChar>)
                    return std::format("CHAR({})", actualType.size);
                else if constexpr (std::same_as<Type, NVarchar>)
                    return std::format("VARCHAR({})", actualType.size);
                else
                    return BasicSqlDialect::ColumnType(type);
            },
            type);
    }

    [[nodiscard]] StringList CreateForeignKey(std::string_view schema,
                                              SqlCreateForeignKeyCommand const& command) const override
    {
        return { ForeignKeyStatement(schema, command) };
    }

    [[nodiscard]] StringList DropForeignKey(std::string_view schema,
                                            SqlDropForeignKeyCommand const& command) const override
    {
        return { std::format("ALTER TABLE {} DROP FOREIGN KEY {};",
                             QuoteForTableName(command.sourceTable, schema),
                             QuoteIdentifier(command.name)) };
    }

    [[nodiscard]] StringList CreateSchema(SqlCreateSchemaCommand const& command) const override
    {
        return { std::format("CREATE SCHEMA IF NOT EXISTS {};", QuoteIdentifier(command.schemaName)) };
    }

  protected:
    [[nodiscard]] std::string QuoteIdentifier(std::string_view identifier) const override
    {
        return std::format("`{}`", identifier);
    }

    [[nodiscard]] std::size_t MaxIdentifierLength() const noexcept override
    {
        return 64;
    }

    [[nodiscard]] std::string BuildColumnDefinition(SqlColumnDeclaration const& column) const override
    {
        std::stringstream sqlQueryString;
        sqlQueryString << QuoteForColumnName(column.name) << ' ' << ColumnType(column.type);

        if (column.required)
            sqlQueryString << " NOT NULL";

        if (column.identity)
            sqlQueryString << " AUTO_INCREMENT PRIMARY KEY";
        else if (column.unique)
            sqlQueryString << " UNIQUE";

        if (column.defaultValue)
            sqlQueryString << " DEFAULT " << *column.defaultValue;

        return sqlQueryString.str();
    }

    [[nodiscard]] std::string AlterColumnStatement(std::string const& quotedTable,
                                                   SqlAlterTableCommands::AlterColumn const& command) const override
    {
        return std::format("ALTER TABLE {} MODIFY COLUMN {} {} {};",
                           quotedTable,
                           QuoteForColumnName(command.columnName),
                           ColumnType(command.columnType),
                           command.nullable ? "NULL" : "NOT NULL");
    }

    [[nodiscard]] std::string AddDefaultStatement(std::string const& quotedTable,
                                                  std::string_view /*tableName*/,
                                                  SqlAlterTableCommands::AddDefault const& command) const override
    {
        return std::format("ALTER TABLE {} ALTER COLUMN {} SET DEFAULT {};",
                           quotedTable,
                           QuoteForColumnName(command.columnName),
                           command.value);
    }

    [[nodiscard]] std::string DropIndexStatement(std::string const& quotedTable,
                                                 std::string_view /*schema*/,
                                                 SqlAlterTableCommands::DropIndex const& command) const override
    {
        return std::format("DROP INDEX {} ON {};", QuoteIdentifier(command.indexName), quotedTable);
    }
};

} // namespace

SqlDialect const& SqlDialect::Sqlite()
{
    static const BasicSqlDialect dialect {};
    return dialect;
}

SqlDialect const& SqlDialect::SqlServer()
{
    static const SqlServerDialect dialect {};
    return dialect;
}

SqlDialect const& SqlDialect::PostgreSQL()
{
    static const PostgreSqlDialect dialect {};
    return dialect;
}

SqlDialect const& SqlDialect::MySQL()
{
    static const MySqlDialect dialect {};
    return dialect;
}

SqlDialect const& SqlDialect::Get(SqlServerType serverType) noexcept
{
    switch (serverType)
    {
        case SqlServerType::MICROSOFT_SQL:
            return SqlServer();
        case SqlServerType::POSTGRESQL:
            return PostgreSQL();
        case SqlServerType::MYSQL:
            return MySQL();
        case SqlServerType::SQLITE:
        case SqlServerType::UNKNOWN:
            break;
    }
    return Sqlite();
}
