// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "SchemaCommands.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

class SqlDialect;

/// @brief Builder for the columns of a CREATE TABLE command.
///
/// Modifiers such as NotNull() or Unique() apply to the most recently declared column.
class [[nodiscard]] SqlCreateTableCommandBuilder final
{
  public:
    explicit SqlCreateTableCommandBuilder(SqlCreateTableCommand& command):
        _command { command }
    {
    }

    // Adds a new column to the table.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& Column(SqlColumnDeclaration column);

    // Creates a new nullable column.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& Column(std::string columnName, SqlColumnTypeDefinition columnType);

    // Creates a new column that is non-nullable.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& RequiredColumn(std::string columnName,
                                                                 SqlColumnTypeDefinition columnType);

    // Creates a new primary key column.
    // Primary keys are always non-nullable.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& PrimaryKey(std::string columnName,
                                                             SqlColumnTypeDefinition columnType);

    /// Creates a new identity column, i.e. an auto incremented primary key.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& Identity(
        std::string columnName, SqlColumnTypeDefinition columnType = SqlColumnTypeDefinitions::Bigint {});

    // Makes the last declared column non-nullable.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& NotNull();

    // Enables the UNIQUE constraint on the last declared column.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& Unique();

    // Sets the default value of the last declared column to the given SQL expression.
    PAPERWEIGHT_API SqlCreateTableCommandBuilder& Default(std::string value);

  private:
    SqlColumnDeclaration& LastColumn();

    SqlCreateTableCommand& _command;
};

/// @brief Builder for the operations of an ALTER TABLE command.
///
/// Index names are scoped by the table prefix and made legal for the dialect,
/// so that dropping an index by name matches the index created under that name.
class [[nodiscard]] SqlAlterTableCommandBuilder final
{
  public:
    SqlAlterTableCommandBuilder(SqlAlterTableCommand& command, SqlDialect const& dialect, std::string_view tablePrefix):
        _command { command },
        _dialect { dialect },
        _tablePrefix { tablePrefix }
    {
    }

    // Adds a new column to the table that is non-nullable.
    PAPERWEIGHT_API SqlAlterTableCommandBuilder& AddColumn(std::string columnName,
                                                           SqlColumnTypeDefinition columnType);

    // Adds a new column to the table that is nullable.
    PAPERWEIGHT_API SqlAlterTableCommandBuilder& AddColumnAsNullable(std::string columnName,
                                                                     SqlColumnTypeDefinition columnType);

    // Alters the column to have a new non-nullable type.
    PAPERWEIGHT_API SqlAlterTableCommandBuilder& AlterColumn(std::string columnName,
                                                             SqlColumnTypeDefinition columnType);

    // Alters the column to have a new nullable type.
    PAPERWEIGHT_API SqlAlterTableCommandBuilder& AlterColumnAsNullable(std::string columnName,
                                                                       SqlColumnTypeDefinition columnType);

    PAPERWEIGHT_API SqlAlterTableCommandBuilder& RenameColumn(std::string oldColumnName, std::string newColumnName);

    PAPERWEIGHT_API SqlAlterTableCommandBuilder& DropColumn(std::string columnName);

    // Sets the default value of an existing column to the given SQL expression.
    PAPERWEIGHT_API SqlAlterTableCommandBuilder& AddDefault(std::string columnName, std::string value);

    /// Creates an index named @p indexName spanning the given columns, in order.
    PAPERWEIGHT_API SqlAlterTableCommandBuilder& CreateIndex(std::string_view indexName,
                                                             std::vector<std::string> columns);

    PAPERWEIGHT_API SqlAlterTableCommandBuilder& CreateIndex(std::string_view indexName,
                                                             std::initializer_list<std::string_view> columns);

    PAPERWEIGHT_API SqlAlterTableCommandBuilder& CreateUniqueIndex(std::string_view indexName,
                                                                   std::initializer_list<std::string_view> columns);

    PAPERWEIGHT_API SqlAlterTableCommandBuilder& DropIndex(std::string_view indexName);

  private:
    [[nodiscard]] std::string IndexName(std::string_view indexName) const;

    SqlAlterTableCommand& _command;
    SqlDialect const& _dialect;
    std::string_view _tablePrefix;
};
