// SPDX-License-Identifier: Apache-2.0

#include "../SqlDialect.hpp"
#include "CommandBuilders.hpp"

#include <format>
#include <stdexcept>
#include <utility>

SqlColumnDeclaration& SqlCreateTableCommandBuilder::LastColumn()
{
    if (_command.columns.empty())
        throw std::logic_error(std::format("No column declared yet on table {}", _command.tableName));
    return _command.columns.back();
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::Column(SqlColumnDeclaration column)
{
    _command.columns.emplace_back(std::move(column));
    return *this;
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::Column(std::string columnName,
                                                                   SqlColumnTypeDefinition columnType)
{
    return Column(SqlColumnDeclaration {
        .name = std::move(columnName),
        .type = columnType,
    });
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::RequiredColumn(std::string columnName,
                                                                           SqlColumnTypeDefinition columnType)
{
    return Column(SqlColumnDeclaration {
        .name = std::move(columnName),
        .type = columnType,
        .required = true,
    });
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::PrimaryKey(std::string columnName,
                                                                       SqlColumnTypeDefinition columnType)
{
    return Column(SqlColumnDeclaration {
        .name = std::move(columnName),
        .type = columnType,
        .required = true,
        .primaryKey = true,
    });
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::Identity(std::string columnName,
                                                                     SqlColumnTypeDefinition columnType)
{
    return Column(SqlColumnDeclaration {
        .name = std::move(columnName),
        .type = columnType,
        .required = true,
        .primaryKey = true,
        .identity = true,
    });
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::NotNull()
{
    LastColumn().required = true;
    return *this;
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::Unique()
{
    LastColumn().unique = true;
    return *this;
}

SqlCreateTableCommandBuilder& SqlCreateTableCommandBuilder::Default(std::string value)
{
    LastColumn().defaultValue = std::move(value);
    return *this;
}

std::string SqlAlterTableCommandBuilder::IndexName(std::string_view indexName) const
{
    return _dialect.FormatIndexName(std::format("{}{}", _tablePrefix, indexName));
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::AddColumn(std::string columnName,
                                                                    SqlColumnTypeDefinition columnType)
{
    _command.operations.emplace_back(SqlAlterTableCommands::AddColumn {
        .columnName = std::move(columnName),
        .columnType = columnType,
        .nullable = false,
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::AddColumnAsNullable(std::string columnName,
                                                                              SqlColumnTypeDefinition columnType)
{
    _command.operations.emplace_back(SqlAlterTableCommands::AddColumn {
        .columnName = std::move(columnName),
        .columnType = columnType,
        .nullable = true,
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::AlterColumn(std::string columnName,
                                                                      SqlColumnTypeDefinition columnType)
{
    _command.operations.emplace_back(SqlAlterTableCommands::AlterColumn {
        .columnName = std::move(columnName),
        .columnType = columnType,
        .nullable = false,
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::AlterColumnAsNullable(std::string columnName,
                                                                                SqlColumnTypeDefinition columnType)
{
    _command.operations.emplace_back(SqlAlterTableCommands::AlterColumn {
        .columnName = std::move(columnName),
        .columnType = columnType,
        .nullable = true,
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::RenameColumn(std::string oldColumnName,
                                                                       std::string newColumnName)
{
    _command.operations.emplace_back(SqlAlterTableCommands::RenameColumn {
        .oldColumnName = std::move(oldColumnName),
        .newColumnName = std::move(newColumnName),
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::DropColumn(std::string columnName)
{
    _command.operations.emplace_back(SqlAlterTableCommands::DropColumn {
        .columnName = std::move(columnName),
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::AddDefault(std::string columnName, std::string value)
{
    _command.operations.emplace_back(SqlAlterTableCommands::AddDefault {
        .columnName = std::move(columnName),
        .value = std::move(value),
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::CreateIndex(std::string_view indexName,
                                                                      std::vector<std::string> columns)
{
    _command.operations.emplace_back(SqlAlterTableCommands::CreateIndex {
        .indexName = IndexName(indexName),
        .columns = std::move(columns),
        .unique = false,
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::CreateIndex(std::string_view indexName,
                                                                      std::initializer_list<std::string_view> columns)
{
    return CreateIndex(indexName, std::vector<std::string>(columns.begin(), columns.end()));
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::CreateUniqueIndex(
    std::string_view indexName, std::initializer_list<std::string_view> columns)
{
    _command.operations.emplace_back(SqlAlterTableCommands::CreateIndex {
        .indexName = IndexName(indexName),
        .columns = std::vector<std::string>(columns.begin(), columns.end()),
        .unique = true,
    });
    return *this;
}

SqlAlterTableCommandBuilder& SqlAlterTableCommandBuilder::DropIndex(std::string_view indexName)
{
    _command.operations.emplace_back(SqlAlterTableCommands::DropIndex {
        .indexName = IndexName(indexName),
    });
    return *this;
}
