// SPDX-License-Identifier: Apache-2.0

#include "SqlDialect.hpp"
#include "SqlLogger.hpp"
#include "SqlSchemaBuilder.hpp"
#include "SqlStatement.hpp"
#include "SqlTransaction.hpp"
#include "Utils.hpp"

#include <exception>
#include <format>
#include <stdexcept>
#include <type_traits>
#include <utility>

using namespace std::string_view_literals;

namespace
{

SqlSchemaError ToSchemaError(std::exception const& error, SqlSchemaErrorKind kind)
{
    if (auto const* sqlException = dynamic_cast<SqlException const*>(&error))
        kind = sqlException->IsDuplicateObject() ? SqlSchemaErrorKind::DuplicateObject : SqlSchemaErrorKind::Execution;
    else if (dynamic_cast<std::invalid_argument const*>(&error))
        kind = SqlSchemaErrorKind::NameResolution;

    return SqlSchemaError {
        .kind = kind,
        .message = error.what(),
        .cause = std::current_exception(),
    };
}

// Invokes the callable, turning a thrown exception into an error value of the given kind.
template <typename Callable>
auto Attempt(SqlSchemaErrorKind kind, Callable&& callable)
    -> std::expected<std::invoke_result_t<Callable>, SqlSchemaError>
{
    try
    {
        if constexpr (std::is_void_v<std::invoke_result_t<Callable>>)
        {
            std::forward<Callable>(callable)();
            return {};
        }
        else
            return std::forward<Callable>(callable)();
    }
    catch (std::exception const& error)
    {
        return std::unexpected(ToSchemaError(error, kind));
    }
}

} // namespace

void SqlTransactionExecutor::Execute(std::string_view sql)
{
    auto stmt = SqlStatement { _transaction->Connection() };
    stmt.ExecuteDirect(sql);
}

namespace SqlIndexNaming
{

std::string MapIndexForeignKey(std::string_view indexName, std::string_view collection)
{
    return std::format("FK_{}{}", collection, indexName);
}

std::string MapIndexDocumentIdIndex(std::string_view indexTable)
{
    return std::format("IDX_FK_{}", indexTable);
}

std::string BridgeTable(std::string_view indexTable, std::string_view documentTable)
{
    return std::format("{}_{}", indexTable, documentTable);
}

std::string BridgeIndexColumn(std::string_view indexName)
{
    return std::format("{}Id", indexName);
}

std::string BridgeIndexForeignKey(std::string_view bridgeTable)
{
    return std::format("FK_{}_Id", bridgeTable);
}

std::string BridgeDocumentForeignKey(std::string_view bridgeTable)
{
    return std::format("FK_{}_DocumentId", bridgeTable);
}

std::string BridgeIndex(std::string_view bridgeTable)
{
    return std::format("IDX_FK_{}", bridgeTable);
}

} // namespace SqlIndexNaming

SqlSchemaBuilder::SqlSchemaBuilder(SqlStoreConfiguration configuration,
                                   SqlSchemaExecutor& executor,
                                   bool throwOnError):
    _configuration { std::move(configuration) },
    _interpreter { _configuration.CommandInterpreter() },
    _executor { &executor },
    _throwOnError { throwOnError }
{
    if (!_configuration.tableNameConvention)
        throw std::invalid_argument("No table name convention configured");
}

std::string SqlSchemaBuilder::Prefix(std::string_view name) const
{
    return std::format("{}{}", _configuration.tablePrefix, name);
}

SqlSchemaBuilder& SqlSchemaBuilder::Finish(StepResult const& result)
{
    if (result)
        return *this;

    auto const& error = result.error();
    if (_throwOnError)
        error.Rethrow();

    SqlLogger::GetLogger().OnSchemaError(error);
    return *this;
}

auto SqlSchemaBuilder::Execute(std::vector<std::string> const& statements) -> StepResult
{
    for (auto const& statement: statements)
    {
        if (detail::IsBlank(statement))
            continue;

        SqlLogger::GetLogger().OnSchemaStatement(statement);

        if (auto result = Attempt(SqlSchemaErrorKind::Execution, [&] { _executor->Execute(statement); }); !result)
            return result;
    }
    return {};
}

auto SqlSchemaBuilder::Run(SqlSchemaCommand const& command) -> StepResult
{
    auto statements = Attempt(SqlSchemaErrorKind::Interpreter, [&] { return _interpreter.CreateSql(command); });
    if (!statements)
        return std::unexpected(std::move(statements.error()));

    return Execute(*statements);
}

// {{{ plain DDL

auto SqlSchemaBuilder::TryCreateTable(std::string_view name, CreateTableConfigurator const& configure) -> StepResult
{
    auto command = SqlCreateTableCommand { .tableName = Prefix(name), .columns = {} };

    return Attempt(SqlSchemaErrorKind::Interpreter,
                   [&] {
                       auto builder = SqlCreateTableCommandBuilder { command };
                       configure(builder);
                   })
        .and_then([&] { return Run(command); });
}

auto SqlSchemaBuilder::TryAlterTable(std::string_view name, AlterTableConfigurator const& configure) -> StepResult
{
    auto command = SqlAlterTableCommand { .tableName = Prefix(name), .operations = {} };

    return Attempt(SqlSchemaErrorKind::Interpreter,
                   [&] {
                       auto builder =
                           SqlAlterTableCommandBuilder { command, _configuration.Dialect(), _configuration.tablePrefix };
                       configure(builder);
                   })
        .and_then([&] { return Run(command); });
}

auto SqlSchemaBuilder::TryDropTable(std::string_view name) -> StepResult
{
    return Run(SqlDropTableCommand { .tableName = Prefix(name) });
}

auto SqlSchemaBuilder::TryCreateForeignKey(std::string_view name,
                                           std::string_view sourceTable,
                                           std::vector<std::string> sourceColumns,
                                           std::string_view destinationTable,
                                           std::vector<std::string> destinationColumns) -> StepResult
{
    return Run(SqlCreateForeignKeyCommand {
        .name = _configuration.Dialect().FormatKeyName(Prefix(name)),
        .sourceTable = Prefix(sourceTable),
        .sourceColumns = std::move(sourceColumns),
        .destinationTable = Prefix(destinationTable),
        .destinationColumns = std::move(destinationColumns),
    });
}

auto SqlSchemaBuilder::TryDropForeignKey(std::string_view sourceTable, std::string_view name) -> StepResult
{
    return Run(SqlDropForeignKeyCommand {
        .sourceTable = Prefix(sourceTable),
        .name = _configuration.Dialect().FormatKeyName(Prefix(name)),
    });
}

SqlSchemaBuilder& SqlSchemaBuilder::CreateTable(std::string_view name, CreateTableConfigurator const& configure)
{
    return Finish(TryCreateTable(name, configure));
}

SqlSchemaBuilder& SqlSchemaBuilder::AlterTable(std::string_view name, AlterTableConfigurator const& configure)
{
    return Finish(TryAlterTable(name, configure));
}

SqlSchemaBuilder& SqlSchemaBuilder::DropTable(std::string_view name)
{
    return Finish(TryDropTable(name));
}

SqlSchemaBuilder& SqlSchemaBuilder::CreateForeignKey(std::string_view name,
                                                     std::string_view sourceTable,
                                                     std::vector<std::string> sourceColumns,
                                                     std::string_view destinationTable,
                                                     std::vector<std::string> destinationColumns)
{
    return Finish(TryCreateForeignKey(
        name, sourceTable, std::move(sourceColumns), destinationTable, std::move(destinationColumns)));
}

SqlSchemaBuilder& SqlSchemaBuilder::DropForeignKey(std::string_view sourceTable, std::string_view name)
{
    return Finish(TryDropForeignKey(sourceTable, name));
}

SqlSchemaBuilder& SqlSchemaBuilder::CreateSchema(std::string_view schemaName)
{
    return Finish(Run(SqlCreateSchemaCommand { .schemaName = std::string(schemaName) }));
}

// }}}

// {{{ index tables

auto SqlSchemaBuilder::TryCreateMapIndexTable(std::string_view indexName,
                                              CreateTableConfigurator const& configure,
                                              std::string_view collection) -> StepResult
{
    auto const& convention = *_configuration.tableNameConvention;

    auto const indexTable = Attempt(SqlSchemaErrorKind::NameResolution,
                                    [&] { return convention.GetIndexTable(indexName, collection); });
    if (!indexTable)
        return std::unexpected(indexTable.error());

    auto const documentTable =
        Attempt(SqlSchemaErrorKind::NameResolution, [&] { return convention.GetDocumentTable(collection); });
    if (!documentTable)
        return std::unexpected(documentTable.error());

    auto const identityType = _configuration.IdentityColumnType();

    return TryCreateTable(*indexTable,
                          [&](SqlCreateTableCommandBuilder& table) {
                              table.Identity("Id", identityType).Column("DocumentId", identityType);
                              configure(table);
                          })
        .and_then([&] {
            return TryCreateForeignKey(SqlIndexNaming::MapIndexForeignKey(indexName, collection),
                                       *indexTable,
                                       { "DocumentId" },
                                       *documentTable,
                                       { "Id" });
        })
        .and_then([&] {
            return TryAlterTable(*indexTable, [&](SqlAlterTableCommandBuilder& table) {
                table.CreateIndex(SqlIndexNaming::MapIndexDocumentIdIndex(*indexTable), { "DocumentId" });
            });
        });
}

auto SqlSchemaBuilder::TryCreateReduceIndexTable(std::string_view indexName,
                                                 CreateTableConfigurator const& configure,
                                                 std::string_view collection) -> StepResult
{
    auto const& convention = *_configuration.tableNameConvention;

    auto const indexTable = Attempt(SqlSchemaErrorKind::NameResolution,
                                    [&] { return convention.GetIndexTable(indexName, collection); });
    if (!indexTable)
        return std::unexpected(indexTable.error());

    auto const documentTable =
        Attempt(SqlSchemaErrorKind::NameResolution, [&] { return convention.GetDocumentTable(collection); });
    if (!documentTable)
        return std::unexpected(documentTable.error());

    auto const identityType = _configuration.IdentityColumnType();
    auto const bridgeTable = SqlIndexNaming::BridgeTable(*indexTable, *documentTable);
    auto const bridgeIndexColumn = SqlIndexNaming::BridgeIndexColumn(indexName);

    return TryCreateTable(*indexTable,
                          [&](SqlCreateTableCommandBuilder& table) {
                              table.Identity("Id", identityType);
                              configure(table);
                          })
        .and_then([&] {
            return TryCreateTable(bridgeTable, [&](SqlCreateTableCommandBuilder& table) {
                table.RequiredColumn(bridgeIndexColumn, identityType).RequiredColumn("DocumentId", identityType);
            });
        })
        .and_then([&] {
            return TryCreateForeignKey(SqlIndexNaming::BridgeIndexForeignKey(bridgeTable),
                                       bridgeTable,
                                       { bridgeIndexColumn },
                                       *indexTable,
                                       { "Id" });
        })
        .and_then([&] {
            return TryCreateForeignKey(SqlIndexNaming::BridgeDocumentForeignKey(bridgeTable),
                                       bridgeTable,
                                       { "DocumentId" },
                                       *documentTable,
                                       { "Id" });
        })
        .and_then([&] {
            return TryAlterTable(bridgeTable, [&](SqlAlterTableCommandBuilder& table) {
                table.CreateIndex(SqlIndexNaming::BridgeIndex(bridgeTable), { bridgeIndexColumn, "DocumentId"sv });
            });
        });
}

auto SqlSchemaBuilder::TryDropMapIndexTable(std::string_view indexName, std::string_view collection) -> StepResult
{
    auto const indexTable = Attempt(SqlSchemaErrorKind::NameResolution, [&] {
        return _configuration.tableNameConvention->GetIndexTable(indexName, collection);
    });
    if (!indexTable)
        return std::unexpected(indexTable.error());

    // Without cascading, the table cannot be dropped while it is still constrained.
    if (_configuration.Dialect().CascadeConstraintsString().empty())
    {
        if (auto result = TryDropForeignKey(*indexTable, SqlIndexNaming::MapIndexForeignKey(indexName, collection));
            !result)
            return result;
    }

    return TryDropTable(*indexTable);
}

auto SqlSchemaBuilder::TryDropReduceIndexTable(std::string_view indexName, std::string_view collection) -> StepResult
{
    auto const& convention = *_configuration.tableNameConvention;

    auto const indexTable = Attempt(SqlSchemaErrorKind::NameResolution,
                                    [&] { return convention.GetIndexTable(indexName, collection); });
    if (!indexTable)
        return std::unexpected(indexTable.error());

    auto const documentTable =
        Attempt(SqlSchemaErrorKind::NameResolution, [&] { return convention.GetDocumentTable(collection); });
    if (!documentTable)
        return std::unexpected(documentTable.error());

    auto const bridgeTable = SqlIndexNaming::BridgeTable(*indexTable, *documentTable);

    auto result = StepResult {};
    if (_configuration.Dialect().CascadeConstraintsString().empty())
    {
        result = TryDropForeignKey(bridgeTable, SqlIndexNaming::BridgeIndexForeignKey(bridgeTable)).and_then([&] {
            return TryDropForeignKey(bridgeTable, SqlIndexNaming::BridgeDocumentForeignKey(bridgeTable));
        });
    }

    return result.and_then([&] { return TryDropTable(bridgeTable); }).and_then([&] {
        return TryDropTable(*indexTable);
    });
}

auto SqlSchemaBuilder::TryAlterIndexTable(std::string_view indexName,
                                          AlterTableConfigurator const& configure,
                                          std::string_view collection) -> StepResult
{
    auto const indexTable = Attempt(SqlSchemaErrorKind::NameResolution, [&] {
        return _configuration.tableNameConvention->GetIndexTable(indexName, collection);
    });
    if (!indexTable)
        return std::unexpected(indexTable.error());

    return TryAlterTable(*indexTable, configure);
}

SqlSchemaBuilder& SqlSchemaBuilder::CreateMapIndexTable(std::string_view indexName,
                                                        CreateTableConfigurator const& configure,
                                                        std::string_view collection)
{
    return Finish(TryCreateMapIndexTable(indexName, configure, collection));
}

SqlSchemaBuilder& SqlSchemaBuilder::CreateReduceIndexTable(std::string_view indexName,
                                                           CreateTableConfigurator const& configure,
                                                           std::string_view collection)
{
    return Finish(TryCreateReduceIndexTable(indexName, configure, collection));
}

SqlSchemaBuilder& SqlSchemaBuilder::DropMapIndexTable(std::string_view indexName, std::string_view collection)
{
    return Finish(TryDropMapIndexTable(indexName, collection));
}

SqlSchemaBuilder& SqlSchemaBuilder::DropReduceIndexTable(std::string_view indexName, std::string_view collection)
{
    return Finish(TryDropReduceIndexTable(indexName, collection));
}

SqlSchemaBuilder& SqlSchemaBuilder::AlterIndexTable(std::string_view indexName,
                                                    AlterTableConfigurator const& configure,
                                                    std::string_view collection)
{
    return Finish(TryAlterIndexTable(indexName, configure, collection));
}

// }}}
