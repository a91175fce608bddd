// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlError.hpp"
#include "SqlSchema/CommandBuilders.hpp"
#include "SqlSchema/CommandInterpreter.hpp"
#include "SqlStoreConfiguration.hpp"
#include "Utils.hpp"

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

class SqlTransaction;

/// Receives the SQL statements the schema builder emits.
class PAPERWEIGHT_API SqlSchemaExecutor
{
  public:
    SqlSchemaExecutor() = default;
    SqlSchemaExecutor(SqlSchemaExecutor&&) = default;
    SqlSchemaExecutor(SqlSchemaExecutor const&) = default;
    SqlSchemaExecutor& operator=(SqlSchemaExecutor&&) = default;
    SqlSchemaExecutor& operator=(SqlSchemaExecutor const&) = default;
    virtual ~SqlSchemaExecutor() = default;

    /// Executes a single statement, throwing on failure.
    virtual void Execute(std::string_view sql) = 0;
};

/// Executes schema statements on the connection of an open transaction.
class PAPERWEIGHT_API SqlTransactionExecutor final: public SqlSchemaExecutor
{
  public:
    explicit SqlTransactionExecutor(SqlTransaction& transaction) noexcept:
        _transaction { &transaction }
    {
    }

    void Execute(std::string_view sql) override;

  private:
    SqlTransaction* _transaction;
};

/// Names of the tables, constraints and indexes backing map and reduce indexes.
///
/// All names are unprefixed. The schema builder prepends the table prefix when emitting them.
namespace SqlIndexNaming
{

/// Name of the foreign key from a map index table to its document table.
[[nodiscard]] PAPERWEIGHT_API std::string MapIndexForeignKey(std::string_view indexName, std::string_view collection);

/// Name of the index on the DocumentId column of a map index table.
[[nodiscard]] PAPERWEIGHT_API std::string MapIndexDocumentIdIndex(std::string_view indexTable);

/// Name of the table linking the rows of a reduce index table to documents.
[[nodiscard]] PAPERWEIGHT_API std::string BridgeTable(std::string_view indexTable, std::string_view documentTable);

/// Name of the bridge table column referencing the reduce index table.
[[nodiscard]] PAPERWEIGHT_API std::string BridgeIndexColumn(std::string_view indexName);

/// Name of the foreign key from the bridge table to the reduce index table.
[[nodiscard]] PAPERWEIGHT_API std::string BridgeIndexForeignKey(std::string_view bridgeTable);

/// Name of the foreign key from the bridge table to the document table.
[[nodiscard]] PAPERWEIGHT_API std::string BridgeDocumentForeignKey(std::string_view bridgeTable);

/// Name of the index spanning both columns of the bridge table.
[[nodiscard]] PAPERWEIGHT_API std::string BridgeIndex(std::string_view bridgeTable);

} // namespace SqlIndexNaming

/// @brief Creates, alters and drops the tables of a document store.
///
/// Besides plain DDL, the schema builder knows how index tables are laid out:
/// a map index table holds one row per indexed document and references it by @c DocumentId,
/// a reduce index table holds aggregated rows that are linked to documents through a bridge table.
///
/// Table, constraint and index names are prefixed with the configured table prefix.
/// Statements are executed one by one, in order, through the given executor.
///
/// When a step fails, the operation stops there. Statements already executed are not undone,
/// that is up to the surrounding transaction. The failure is rethrown if the builder was created
/// with @c throwOnError set, and reported to SqlLogger::OnSchemaError() and discarded otherwise.
///
/// @code
/// auto transaction = SqlTransaction { connection };
/// auto executor = SqlTransactionExecutor { transaction };
/// SqlSchemaBuilder { SqlStoreConfiguration::ForConnection(connection, "yx_"), executor }
///     .CreateMapIndexTable<PersonByName>([](auto& table) { table.Column("Name", SqlColumnTypeDefinitions::Varchar { 255 }); });
/// @endcode
class [[nodiscard]] PAPERWEIGHT_API SqlSchemaBuilder final
{
  public:
    using CreateTableConfigurator = std::function<void(SqlCreateTableCommandBuilder&)>;
    using AlterTableConfigurator = std::function<void(SqlAlterTableCommandBuilder&)>;

    SqlSchemaBuilder(SqlStoreConfiguration configuration, SqlSchemaExecutor& executor, bool throwOnError = true);

    [[nodiscard]] SqlStoreConfiguration const& Configuration() const noexcept
    {
        return _configuration;
    }

    [[nodiscard]] bool ThrowOnError() const noexcept
    {
        return _throwOnError;
    }

    SqlSchemaBuilder& CreateTable(std::string_view name, CreateTableConfigurator const& configure);
    SqlSchemaBuilder& AlterTable(std::string_view name, AlterTableConfigurator const& configure);
    SqlSchemaBuilder& DropTable(std::string_view name);

    SqlSchemaBuilder& CreateForeignKey(std::string_view name,
                                       std::string_view sourceTable,
                                       std::vector<std::string> sourceColumns,
                                       std::string_view destinationTable,
                                       std::vector<std::string> destinationColumns);

    SqlSchemaBuilder& DropForeignKey(std::string_view sourceTable, std::string_view name);

    SqlSchemaBuilder& CreateSchema(std::string_view schemaName);

    /// Creates the table of a map index with the columns @c Id and @c DocumentId,
    /// followed by the columns declared by @p configure.
    SqlSchemaBuilder& CreateMapIndexTable(std::string_view indexName,
                                          CreateTableConfigurator const& configure,
                                          std::string_view collection = {});

    /// Creates the table of a reduce index with the column @c Id, followed by the columns declared by @p configure,
    /// and the bridge table linking it to the document table.
    SqlSchemaBuilder& CreateReduceIndexTable(std::string_view indexName,
                                             CreateTableConfigurator const& configure,
                                             std::string_view collection = {});

    SqlSchemaBuilder& DropMapIndexTable(std::string_view indexName, std::string_view collection = {});
    SqlSchemaBuilder& DropReduceIndexTable(std::string_view indexName, std::string_view collection = {});

    SqlSchemaBuilder& AlterIndexTable(std::string_view indexName,
                                      AlterTableConfigurator const& configure,
                                      std::string_view collection = {});

    template <typename IndexType>
    SqlSchemaBuilder& CreateMapIndexTable(CreateTableConfigurator const& configure, std::string_view collection = {})
    {
        return CreateMapIndexTable(SqlIndexTypeName<IndexType>, configure, collection);
    }

    template <typename IndexType>
    SqlSchemaBuilder& CreateReduceIndexTable(CreateTableConfigurator const& configure,
                                             std::string_view collection = {})
    {
        return CreateReduceIndexTable(SqlIndexTypeName<IndexType>, configure, collection);
    }

    template <typename IndexType>
    SqlSchemaBuilder& DropMapIndexTable(std::string_view collection = {})
    {
        return DropMapIndexTable(SqlIndexTypeName<IndexType>, collection);
    }

    template <typename IndexType>
    SqlSchemaBuilder& DropReduceIndexTable(std::string_view collection = {})
    {
        return DropReduceIndexTable(SqlIndexTypeName<IndexType>, collection);
    }

    template <typename IndexType>
    SqlSchemaBuilder& AlterIndexTable(AlterTableConfigurator const& configure, std::string_view collection = {})
    {
        return AlterIndexTable(SqlIndexTypeName<IndexType>, configure, collection);
    }

  private:
    using StepResult = std::expected<void, SqlSchemaError>;

    [[nodiscard]] std::string Prefix(std::string_view name) const;

    [[nodiscard]] StepResult Run(SqlSchemaCommand const& command);
    [[nodiscard]] StepResult Execute(std::vector<std::string> const& statements);

    [[nodiscard]] StepResult TryCreateTable(std::string_view name, CreateTableConfigurator const& configure);
    [[nodiscard]] StepResult TryAlterTable(std::string_view name, AlterTableConfigurator const& configure);
    [[nodiscard]] StepResult TryDropTable(std::string_view name);
    [[nodiscard]] StepResult TryCreateForeignKey(std::string_view name,
                                                 std::string_view sourceTable,
                                                 std::vector<std::string> sourceColumns,
                                                 std::string_view destinationTable,
                                                 std::vector<std::string> destinationColumns);
    [[nodiscard]] StepResult TryDropForeignKey(std::string_view sourceTable, std::string_view name);
    [[nodiscard]] StepResult TryCreateMapIndexTable(std::string_view indexName,
                                                    CreateTableConfigurator const& configure,
                                                    std::string_view collection);
    [[nodiscard]] StepResult TryCreateReduceIndexTable(std::string_view indexName,
                                                       CreateTableConfigurator const& configure,
                                                       std::string_view collection);
    [[nodiscard]] StepResult TryDropMapIndexTable(std::string_view indexName, std::string_view collection);
    [[nodiscard]] StepResult TryDropReduceIndexTable(std::string_view indexName, std::string_view collection);
    [[nodiscard]] StepResult TryAlterIndexTable(std::string_view indexName,
                                                AlterTableConfigurator const& configure,
                                                std::string_view collection);

    SqlSchemaBuilder& Finish(StepResult const& result);

    SqlStoreConfiguration _configuration;
    SqlCommandInterpreter _interpreter;
    SqlSchemaExecutor* _executor;
    bool _throwOnError;
};
