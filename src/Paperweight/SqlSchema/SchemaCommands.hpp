// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../SqlColumnTypeDefinitions.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

/// Declares a single column of a table to be created.
struct SqlColumnDeclaration
{
    std::string name;
    SqlColumnTypeDefinition type;
    bool required { false };
    bool primaryKey { false };
    // Identity columns are auto incremented by the database and always are the (sole) primary key.
    bool identity { false };
    bool unique { false };
    // Raw SQL expression used as the column default, e.g. "0" or "'none'".
    std::optional<std::string> defaultValue {};
};

struct SqlCreateTableCommand
{
    std::string tableName;
    std::vector<SqlColumnDeclaration> columns;
};

namespace SqlAlterTableCommands
{

struct AddColumn
{
    std::string columnName;
    SqlColumnTypeDefinition columnType;
    bool nullable = true;
};

struct DropColumn
{
    std::string columnName;
};

struct AlterColumn
{
    std::string columnName;
    SqlColumnTypeDefinition columnType;
    bool nullable = true;
};

struct RenameColumn
{
    std::string oldColumnName;
    std::string newColumnName;
};

struct AddDefault
{
    std::string columnName;
    std::string value;
};

struct CreateIndex
{
    std::string indexName;
    std::vector<std::string> columns;
    bool unique = false;
};

struct DropIndex
{
    std::string indexName;
};

} // namespace SqlAlterTableCommands

using SqlAlterTableOperation = std::variant<SqlAlterTableCommands::AddColumn,
                                            SqlAlterTableCommands::DropColumn,
                                            SqlAlterTableCommands::AlterColumn,
                                            SqlAlterTableCommands::RenameColumn,
                                            SqlAlterTableCommands::AddDefault,
                                            SqlAlterTableCommands::CreateIndex,
                                            SqlAlterTableCommands::DropIndex>;

struct SqlAlterTableCommand
{
    std::string tableName;
    std::vector<SqlAlterTableOperation> operations;
};

struct SqlDropTableCommand
{
    std::string tableName;
};

struct SqlCreateForeignKeyCommand
{
    std::string name;
    std::string sourceTable;
    std::vector<std::string> sourceColumns;
    std::string destinationTable;
    std::vector<std::string> destinationColumns;
};

struct SqlDropForeignKeyCommand
{
    std::string sourceTable;
    std::string name;
};

struct SqlCreateSchemaCommand
{
    std::string schemaName;
};

// clang-format off
using SqlSchemaCommand = std::variant<
    SqlCreateTableCommand,
    SqlAlterTableCommand,
    SqlDropTableCommand,
    SqlCreateForeignKeyCommand,
    SqlDropForeignKeyCommand,
    SqlCreateSchemaCommand
>;
// clang-format on
