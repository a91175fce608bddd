// SPDX-License-Identifier: Apache-2.0

#include "../SqlDialect.hpp"
#include "../Utils.hpp"
#include "CommandInterpreter.hpp"

std::vector<std::string> SqlCommandInterpreter::CreateSql(SqlSchemaCommand const& command) const
{
    return std::visit(
        detail::overloaded {
            [&](SqlCreateTableCommand const& actualCommand) { return _dialect->CreateTable(_schema, actualCommand); },
            [&](SqlAlterTableCommand const& actualCommand) { return _dialect->AlterTable(_schema, actualCommand); },
            [&](SqlDropTableCommand const& actualCommand) { return _dialect->DropTable(_schema, actualCommand); },
            [&](SqlCreateForeignKeyCommand const& actualCommand) {
                return _dialect->CreateForeignKey(_schema, actualCommand);
            },
            [&](SqlDropForeignKeyCommand const& actualCommand) {
                return _dialect->DropForeignKey(_schema, actualCommand);
            },
            [&](SqlCreateSchemaCommand const& actualCommand) { return _dialect->CreateSchema(actualCommand); },
        },
        command);
}
