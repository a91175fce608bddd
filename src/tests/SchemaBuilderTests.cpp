// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"

#include <Paperweight/SqlBuilder.hpp>
#include <Paperweight/SqlConnection.hpp>
#include <Paperweight/SqlDialect.hpp>
#include <Paperweight/SqlSchemaBuilder.hpp>
#include <Paperweight/SqlStatement.hpp>
#include <Paperweight/SqlStoreConfiguration.hpp>
#include <Paperweight/SqlTransaction.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace std::string_view_literals;
using namespace SqlColumnTypeDefinitions;
using Catch::Matchers::ContainsSubstring;

namespace Models
{

struct PersonByName
{
};

struct DailyArticleCount
{
    static constexpr std::string_view IndexName = "ArticlesByDay";
};

} // namespace Models

namespace
{

auto const AddNameColumn = [](SqlCreateTableCommandBuilder& table) {
    table.Column("Name", Varchar { 255 });
};

auto const AddCountColumn = [](SqlCreateTableCommandBuilder& table) {
    table.Column("Count", Integer {});
};

bool TableExists(SqlConnection& connection, SqlStoreConfiguration const& configuration, std::string_view table)
{
    auto const logger = ScopedSqlNullLogger {};
    auto query = configuration.CreateSqlBuilder();
    query.Select().Selector("COUNT(*)").Table(table);
    auto stmt = SqlStatement { connection };
    try
    {
        stmt.ExecuteDirect(query.ToSqlString());
        return true;
    }
    catch (SqlException const&)
    {
        return false;
    }
}

std::vector<std::string> Normalized(std::vector<std::string> statements)
{
    for (auto& statement: statements)
        statement = NormalizeText(statement);
    return statements;
}

} // namespace

TEST_CASE("SqlIndexNaming", "[SqlSchemaBuilder]")
{
    CHECK(SqlIndexNaming::MapIndexForeignKey("PersonByName", "") == "FK_PersonByName");
    CHECK(SqlIndexNaming::MapIndexForeignKey("PersonByName", "Blog") == "FK_BlogPersonByName");
    CHECK(SqlIndexNaming::MapIndexDocumentIdIndex("Blog_PersonByName") == "IDX_FK_Blog_PersonByName");
    CHECK(SqlIndexNaming::BridgeTable("ArticlesByDay", "Document") == "ArticlesByDay_Document");
    CHECK(SqlIndexNaming::BridgeIndexColumn("ArticlesByDay") == "ArticlesByDayId");
    CHECK(SqlIndexNaming::BridgeIndexForeignKey("ArticlesByDay_Document") == "FK_ArticlesByDay_Document_Id");
    CHECK(SqlIndexNaming::BridgeDocumentForeignKey("ArticlesByDay_Document")
          == "FK_ArticlesByDay_Document_DocumentId");
    CHECK(SqlIndexNaming::BridgeIndex("ArticlesByDay_Document") == "IDX_FK_ArticlesByDay_Document");

    // deterministic
    CHECK(SqlIndexNaming::BridgeTable("A", "B") == SqlIndexNaming::BridgeTable("A", "B"));
}

TEST_CASE("SqlIndexTypeName", "[SqlSchemaBuilder]")
{
    CHECK(SqlIndexTypeName<Models::PersonByName> == "PersonByName");
    CHECK(SqlIndexTypeName<Models::DailyArticleCount> == "ArticlesByDay");
}

TEST_CASE("SqlDefaultTableNameConvention", "[SqlSchemaBuilder]")
{
    auto const convention = SqlDefaultTableNameConvention {};
    CHECK(convention.GetDocumentTable("") == "Document");
    CHECK(convention.GetDocumentTable("Blog") == "Blog_Document");
    CHECK(convention.GetIndexTable("PersonByName", "") == "PersonByName");
    CHECK(convention.GetIndexTable("PersonByName", "Blog") == "Blog_PersonByName");
    CHECK_THROWS_AS(convention.GetIndexTable("", "Blog"), std::invalid_argument);
}

TEST_CASE("SqlSchemaBuilder.CreateTable", "[SqlSchemaBuilder]")
{
    auto logger = ScopedSqlRecordingLogger {};
    auto executor = RecordingSchemaExecutor {};
    auto builder = SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::SQLITE, "yx_"), executor };

    auto& result = builder.CreateTable("Document", [](SqlCreateTableCommandBuilder& table) {
        table.Identity("Id").RequiredColumn("Type", Varchar { 255 }).Column("Content", Text {});
    });

    CHECK(&result == &builder);
    CHECK(Normalized(executor.statements)
          == std::vector<std::string> {
              R"(CREATE TABLE "yx_Document" ( "Id" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT, "Type" VARCHAR(255) NOT NULL, "Content" TEXT );)",
          });

    // every executed statement is traced beforehand
    CHECK(logger.schemaStatements == executor.statements);
}

TEST_CASE("SqlSchemaBuilder.AlterTable", "[SqlSchemaBuilder]")
{
    auto executor = RecordingSchemaExecutor {};
    SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_"), executor }.AlterTable(
        "Document", [](SqlAlterTableCommandBuilder& table) {
            table.AddColumnAsNullable("Version", Integer {}).CreateIndex("IDX_Version", { "Version" });
        });

    CHECK(executor.statements
          == std::vector<std::string> {
              "ALTER TABLE [yx_Document] ADD [Version] INTEGER NULL;",
              "CREATE INDEX [yx_IDX_Version] ON [yx_Document] ([Version]);",
          });
}

TEST_CASE("SqlSchemaBuilder.DropTable", "[SqlSchemaBuilder]")
{
    auto executor = RecordingSchemaExecutor {};
    SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::POSTGRESQL, "yx_"), executor }
        .DropTable("Document")
        .DropTable("Identifiers");

    CHECK(executor.statements
          == std::vector<std::string> {
              R"(DROP TABLE "yx_Document" CASCADE;)",
              R"(DROP TABLE "yx_Identifiers" CASCADE;)",
          });
}

TEST_CASE("SqlSchemaBuilder.ForeignKeys", "[SqlSchemaBuilder]")
{
    SECTION("names are prefixed and made legal")
    {
        auto executor = RecordingSchemaExecutor {};
        auto const longName = std::string(100, 'k');
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::POSTGRESQL, "yx_"), executor }
            .CreateForeignKey(longName, "Article", { "AuthorId" }, "Author", { "Id" })
            .DropForeignKey("Article", "FK_Article_Author");

        auto const truncated = ("yx_" + longName).substr(0, 63);
        CHECK(executor.statements
              == std::vector<std::string> {
                  std::format(R"(ALTER TABLE "yx_Article" ADD CONSTRAINT "{}" FOREIGN KEY ("AuthorId") REFERENCES "yx_Author" ("Id");)",
                              truncated),
                  R"(ALTER TABLE "yx_Article" DROP CONSTRAINT "yx_FK_Article_Author";)",
              });
    }

    SECTION("SQLite emits nothing")
    {
        auto logger = ScopedSqlRecordingLogger {};
        auto executor = RecordingSchemaExecutor {};
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::SQLITE, "yx_"), executor }
            .CreateForeignKey("FK_Article_Author", "Article", { "AuthorId" }, "Author", { "Id" })
            .DropForeignKey("Article", "FK_Article_Author");

        CHECK(executor.statements.empty());
        CHECK(logger.schemaStatements.empty());
        CHECK(logger.schemaErrors.empty());
    }
}

TEST_CASE("SqlSchemaBuilder.CreateSchema", "[SqlSchemaBuilder]")
{
    auto executor = RecordingSchemaExecutor {};
    SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL), executor }.CreateSchema("store");
    CHECK(executor.statements == std::vector<std::string> { "CREATE SCHEMA [store];" });
}

TEST_CASE("SqlSchemaBuilder.CreateMapIndexTable", "[SqlSchemaBuilder]")
{
    auto executor = RecordingSchemaExecutor {};
    auto builder =
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_"), executor };

    SECTION("default collection")
    {
        builder.CreateMapIndexTable<Models::PersonByName>(AddNameColumn);

        CHECK(Normalized(executor.statements)
              == std::vector<std::string> {
                  "CREATE TABLE [yx_PersonByName] ( [Id] BIGINT NOT NULL IDENTITY(1,1) PRIMARY KEY, [DocumentId] BIGINT, [Name] VARCHAR(255) );",
                  "ALTER TABLE [yx_PersonByName] ADD CONSTRAINT [yx_FK_PersonByName] FOREIGN KEY ([DocumentId]) REFERENCES [yx_Document] ([Id]);",
                  "CREATE INDEX [yx_IDX_FK_PersonByName] ON [yx_PersonByName] ([DocumentId]);",
              });
    }

    SECTION("named collection")
    {
        builder.CreateMapIndexTable("PersonByName", AddNameColumn, "Blog");

        CHECK(Normalized(executor.statements)
              == std::vector<std::string> {
                  "CREATE TABLE [yx_Blog_PersonByName] ( [Id] BIGINT NOT NULL IDENTITY(1,1) PRIMARY KEY, [DocumentId] BIGINT, [Name] VARCHAR(255) );",
                  "ALTER TABLE [yx_Blog_PersonByName] ADD CONSTRAINT [yx_FK_BlogPersonByName] FOREIGN KEY ([DocumentId]) REFERENCES [yx_Blog_Document] ([Id]);",
                  "CREATE INDEX [yx_IDX_FK_Blog_PersonByName] ON [yx_Blog_PersonByName] ([DocumentId]);",
              });
    }
}

TEST_CASE("SqlSchemaBuilder.CreateMapIndexTable.Int32Identity", "[SqlSchemaBuilder]")
{
    auto configuration = SqlStoreConfiguration::ForServer(SqlServerType::SQLITE);
    configuration.identityColumnSize = SqlIdentityColumnSize::Int32;

    auto executor = RecordingSchemaExecutor {};
    SqlSchemaBuilder { std::move(configuration), executor }.CreateMapIndexTable("PersonByName", AddNameColumn);

    CHECK(Normalized(executor.statements)
          == std::vector<std::string> {
              R"(CREATE TABLE "PersonByName" ( "Id" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT, "DocumentId" INTEGER, "Name" VARCHAR(255) );)",
              R"(CREATE INDEX "IDX_FK_PersonByName" ON "PersonByName" ("DocumentId");)",
          });
}

TEST_CASE("SqlSchemaBuilder.CreateReduceIndexTable", "[SqlSchemaBuilder]")
{
    auto executor = RecordingSchemaExecutor {};
    SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_"), executor }
        .CreateReduceIndexTable<Models::DailyArticleCount>(AddCountColumn);

    CHECK(Normalized(executor.statements)
          == std::vector<std::string> {
              "CREATE TABLE [yx_ArticlesByDay] ( [Id] BIGINT NOT NULL IDENTITY(1,1) PRIMARY KEY, [Count] INTEGER );",
              "CREATE TABLE [yx_ArticlesByDay_Document] ( [ArticlesByDayId] BIGINT NOT NULL, [DocumentId] BIGINT NOT NULL );",
              "ALTER TABLE [yx_ArticlesByDay_Document] ADD CONSTRAINT [yx_FK_ArticlesByDay_Document_Id] FOREIGN KEY ([ArticlesByDayId]) REFERENCES [yx_ArticlesByDay] ([Id]);",
              "ALTER TABLE [yx_ArticlesByDay_Document] ADD CONSTRAINT [yx_FK_ArticlesByDay_Document_DocumentId] FOREIGN KEY ([DocumentId]) REFERENCES [yx_Document] ([Id]);",
              "CREATE INDEX [yx_IDX_FK_ArticlesByDay_Document] ON [yx_ArticlesByDay_Document] ([ArticlesByDayId], [DocumentId]);",
          });
}

TEST_CASE("SqlSchemaBuilder.DropMapIndexTable", "[SqlSchemaBuilder]")
{
    SECTION("without cascading, the foreign key is dropped first")
    {
        auto executor = RecordingSchemaExecutor {};
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_"), executor }
            .DropMapIndexTable<Models::PersonByName>("Blog");

        CHECK(executor.statements
              == std::vector<std::string> {
                  "ALTER TABLE [yx_Blog_PersonByName] DROP CONSTRAINT [yx_FK_BlogPersonByName];",
                  "DROP TABLE [yx_Blog_PersonByName];",
              });
    }

    SECTION("with cascading")
    {
        auto executor = RecordingSchemaExecutor {};
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::POSTGRESQL, "yx_"), executor }
            .DropMapIndexTable<Models::PersonByName>();

        CHECK(executor.statements == std::vector<std::string> { R"(DROP TABLE "yx_PersonByName" CASCADE;)" });
    }

    SECTION("MySQL drops the foreign key by name before the table")
    {
        auto const configuration = SqlStoreConfiguration::ForServer(SqlServerType::MYSQL, "yx_");
        REQUIRE(configuration.dialect->CascadeConstraintsString().empty());

        auto executor = RecordingSchemaExecutor {};
        SqlSchemaBuilder { configuration, executor }.DropMapIndexTable<Models::PersonByName>();

        CHECK(executor.statements
              == std::vector<std::string> {
                  "ALTER TABLE `yx_PersonByName` DROP FOREIGN KEY `yx_FK_PersonByName`;",
                  "DROP TABLE `yx_PersonByName`;",
              });
    }
}

TEST_CASE("SqlSchemaBuilder.DropReduceIndexTable", "[SqlSchemaBuilder]")
{
    SECTION("without cascading, the foreign keys are dropped first")
    {
        auto executor = RecordingSchemaExecutor {};
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_"), executor }
            .DropReduceIndexTable<Models::DailyArticleCount>();

        CHECK(executor.statements
              == std::vector<std::string> {
                  "ALTER TABLE [yx_ArticlesByDay_Document] DROP CONSTRAINT [yx_FK_ArticlesByDay_Document_Id];",
                  "ALTER TABLE [yx_ArticlesByDay_Document] DROP CONSTRAINT [yx_FK_ArticlesByDay_Document_DocumentId];",
                  "DROP TABLE [yx_ArticlesByDay_Document];",
                  "DROP TABLE [yx_ArticlesByDay];",
              });
    }

    SECTION("with cascading")
    {
        auto executor = RecordingSchemaExecutor {};
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::POSTGRESQL, "yx_"), executor }
            .DropReduceIndexTable("ArticlesByDay", "Blog");

        CHECK(executor.statements
              == std::vector<std::string> {
                  R"(DROP TABLE "yx_Blog_ArticlesByDay_Blog_Document" CASCADE;)",
                  R"(DROP TABLE "yx_Blog_ArticlesByDay" CASCADE;)",
              });
    }
}

TEST_CASE("SqlSchemaBuilder.AlterIndexTable", "[SqlSchemaBuilder]")
{
    auto executor = RecordingSchemaExecutor {};
    SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_"), executor }
        .AlterIndexTable<Models::PersonByName>(
            [](SqlAlterTableCommandBuilder& table) { table.AddColumn("Age", Integer {}); }, "Blog");

    CHECK(executor.statements
          == std::vector<std::string> { "ALTER TABLE [yx_Blog_PersonByName] ADD [Age] INTEGER NOT NULL;" });
}

TEST_CASE("SqlSchemaBuilder.IndexTablesTwice", "[SqlSchemaBuilder]")
{
    auto logger = ScopedSqlRecordingLogger {};
    auto executor = RecordingSchemaExecutor {};
    auto builder =
        SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_"), executor, false };

    SECTION("map index")
    {
        builder.CreateMapIndexTable<Models::PersonByName>(AddNameColumn);
        REQUIRE(executor.statements.size() == 3);

        // The table now exists, so the repeated call stops before adding a second foreign key or index.
        executor.failOn = "CREATE TABLE [yx_PersonByName]";
        CHECK_NOTHROW(builder.CreateMapIndexTable<Models::PersonByName>(AddNameColumn));

        CHECK(executor.statements.size() == 3);
        REQUIRE(logger.schemaErrors.size() == 1);
        CHECK(logger.schemaErrors.front().kind == SqlSchemaErrorKind::DuplicateObject);
    }

    SECTION("reduce index")
    {
        builder.CreateReduceIndexTable<Models::DailyArticleCount>(AddCountColumn);
        REQUIRE(executor.statements.size() == 5);

        executor.failOn = "CREATE TABLE [yx_ArticlesByDay]";
        CHECK_NOTHROW(builder.CreateReduceIndexTable<Models::DailyArticleCount>(AddCountColumn));

        CHECK(executor.statements.size() == 5);
        REQUIRE(logger.schemaErrors.size() == 1);
        CHECK(logger.schemaErrors.front().kind == SqlSchemaErrorKind::DuplicateObject);
    }
}

TEST_CASE("SqlSchemaBuilder.Errors", "[SqlSchemaBuilder]")
{
    auto logger = ScopedSqlRecordingLogger {};
    auto executor = RecordingSchemaExecutor {};
    auto const configuration = SqlStoreConfiguration::ForServer(SqlServerType::MICROSOFT_SQL, "yx_");

    SECTION("execution failures are rethrown unchanged")
    {
        executor.failOn = "CREATE TABLE [yx_PersonByName]";
        auto builder = SqlSchemaBuilder { configuration, executor };
        CHECK_THROWS_AS(builder.CreateMapIndexTable("PersonByName", AddNameColumn), SqlException);
        CHECK(executor.statements.empty());
    }

    SECTION("failures are discarded if requested")
    {
        executor.failOn = "CREATE TABLE [yx_PersonByName]";
        auto builder = SqlSchemaBuilder { configuration, executor, false };
        CHECK_NOTHROW(builder.CreateMapIndexTable("PersonByName", AddNameColumn));

        // the operation stops at the failing step
        CHECK(executor.statements.empty());
        REQUIRE(logger.schemaErrors.size() == 1);
        CHECK(logger.schemaErrors.front().kind == SqlSchemaErrorKind::DuplicateObject);

        // and the builder remains usable
        builder.DropTable("Other");
        CHECK(executor.statements == std::vector<std::string> { "DROP TABLE [yx_Other];" });
    }

    SECTION("a failing step aborts the remaining steps")
    {
        executor.failOn = "FOREIGN KEY";
        auto builder = SqlSchemaBuilder { configuration, executor, false };
        builder.CreateReduceIndexTable("ArticlesByDay", AddCountColumn);

        // both tables were created, neither foreign key nor index
        CHECK(executor.statements.size() == 2);
        REQUIRE(logger.schemaErrors.size() == 1);
        CHECK(logger.schemaErrors.front().kind == SqlSchemaErrorKind::DuplicateObject);
    }

    SECTION("name resolution failures")
    {
        auto builder = SqlSchemaBuilder { configuration, executor };
        CHECK_THROWS_AS(builder.CreateMapIndexTable("", AddNameColumn), std::invalid_argument);
        CHECK_THROWS_AS(builder.DropReduceIndexTable(""), std::invalid_argument);

        auto lenient = SqlSchemaBuilder { configuration, executor, false };
        lenient.AlterIndexTable("", [](SqlAlterTableCommandBuilder& table) { table.DropColumn("Name"); });
        REQUIRE(logger.schemaErrors.size() == 1);
        CHECK(logger.schemaErrors.front().kind == SqlSchemaErrorKind::NameResolution);
        CHECK(executor.statements.empty());
    }

    SECTION("interpreter failures")
    {
        auto builder = SqlSchemaBuilder { SqlStoreConfiguration::ForServer(SqlServerType::SQLITE), executor };
        CHECK_THROWS_AS(builder.AlterTable("Document",
                                           [](SqlAlterTableCommandBuilder& table) {
                                               table.AddColumnAsNullable("Version", Integer {})
                                                   .AlterColumn("Type", Varchar { 50 });
                                           }),
                        std::runtime_error);

        // nothing of the command is executed if it cannot be expressed as a whole
        CHECK(executor.statements.empty());
    }

    SECTION("failures of the configuration callback")
    {
        auto builder = SqlSchemaBuilder { configuration, executor };
        CHECK_THROWS_AS(
            builder.CreateTable("Document", [](SqlCreateTableCommandBuilder& table) { table.Unique(); }),
            std::logic_error);
        CHECK(executor.statements.empty());
    }
}

TEST_CASE_METHOD(SqlTestFixture, "SqlSchemaBuilder.Database", "[SqlSchemaBuilder]")
{
    auto connection = SqlConnection {};
    REQUIRE(connection.IsAlive());

    DropTablesIfExist(connection, { "it_PersonByName", "it_Document" });

    auto const configuration = SqlStoreConfiguration::ForConnection(connection, "it_");
    {
        auto transaction = SqlTransaction { connection };
        auto executor = SqlTransactionExecutor { transaction };

        SqlSchemaBuilder { configuration, executor }
            .CreateTable("Document",
                         [](SqlCreateTableCommandBuilder& table) {
                             table.Identity("Id").RequiredColumn("Type", Varchar { 255 });
                         })
            .CreateMapIndexTable<Models::PersonByName>(AddNameColumn);

        transaction.Commit();
    }

    auto query = configuration.CreateSqlBuilder();
    auto stmt = SqlStatement { connection };

    stmt.ExecuteDirect(std::format("INSERT INTO {} ({}) VALUES ('Person')",
                                   query.FormatTable("Document"),
                                   connection.Dialect().QuoteForColumnName("Type")));

    query.Select().Selector("COUNT(*)").Table("Document").AndAlso("Type = 'Person'");
    stmt.ExecuteDirect(query.ToSqlString());
    REQUIRE(stmt.FetchRow());
    CHECK(stmt.GetColumn<int64_t>(1) == 1);
    stmt.CloseCursor();

    auto indexQuery = configuration.CreateSqlBuilder();
    indexQuery.Select().Selector("COUNT(*)").Table("PersonByName");
    stmt.ExecuteDirect(indexQuery.ToSqlString());
    REQUIRE(stmt.FetchRow());
    CHECK(stmt.GetColumn<int64_t>(1) == 0);
    stmt.CloseCursor();

    {
        auto transaction = SqlTransaction { connection };
        auto executor = SqlTransactionExecutor { transaction };
        SqlSchemaBuilder { configuration, executor }.DropMapIndexTable<Models::PersonByName>().DropTable("Document");
        transaction.Commit();
    }
}

TEST_CASE_METHOD(SqlTestFixture, "SqlSchemaBuilder.Database.DuplicateTable", "[SqlSchemaBuilder]")
{
    auto connection = SqlConnection {};
    REQUIRE(connection.IsAlive());

    // A failed statement aborts the whole transaction on some servers, so this is only checked on SQLite.
    if (connection.ServerType() != SqlServerType::SQLITE)
        SKIP("Only checked on SQLite");

    auto logger = ScopedSqlRecordingLogger {};
    auto transaction = SqlTransaction { connection, SqlTransactionMode::ROLLBACK };
    auto executor = SqlTransactionExecutor { transaction };
    auto const createTable = [](SqlCreateTableCommandBuilder& table) {
        table.Identity("Id");
    };

    SqlSchemaBuilder { SqlStoreConfiguration::ForConnection(connection, "dup_"), executor, false }
        .CreateTable("Document", createTable)
        .CreateTable("Document", createTable);

    REQUIRE(logger.schemaErrors.size() == 1);
    CHECK(logger.schemaErrors.front().kind == SqlSchemaErrorKind::DuplicateObject);
    CHECK_THAT(logger.schemaErrors.front().message, ContainsSubstring("already exists"));

    auto strictBuilder = SqlSchemaBuilder { SqlStoreConfiguration::ForConnection(connection, "dup_"), executor };
    CHECK_THROWS_AS(strictBuilder.CreateTable("Document", createTable), SqlException);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlSchemaBuilder.Database.IndexTablesTwice", "[SqlSchemaBuilder]")
{
    auto connection = SqlConnection {};
    REQUIRE(connection.IsAlive());

    // A failed statement aborts the whole transaction on some servers, so this is only checked on SQLite.
    if (connection.ServerType() != SqlServerType::SQLITE)
        SKIP("Only checked on SQLite");

    DropTablesIfExist(connection,
                      { "twice_ArticlesByDay_Document", "twice_ArticlesByDay", "twice_PersonByName", "twice_Document" });

    auto logger = ScopedSqlRecordingLogger {};
    auto transaction = SqlTransaction { connection, SqlTransactionMode::ROLLBACK };
    auto executor = SqlTransactionExecutor { transaction };
    auto const configuration = SqlStoreConfiguration::ForConnection(connection, "twice_");
    auto builder = SqlSchemaBuilder { configuration, executor, false };

    builder.CreateTable("Document", [](SqlCreateTableCommandBuilder& table) { table.Identity("Id"); })
        .CreateMapIndexTable<Models::PersonByName>(AddNameColumn)
        .CreateReduceIndexTable<Models::DailyArticleCount>(AddCountColumn);
    REQUIRE(logger.schemaErrors.empty());

    auto const statementCount = logger.schemaStatements.size();

    CHECK_NOTHROW(builder.CreateMapIndexTable<Models::PersonByName>(AddNameColumn)
                      .CreateReduceIndexTable<Models::DailyArticleCount>(AddCountColumn));

    // each repeated operation stops at its failing CREATE TABLE
    CHECK(logger.schemaStatements.size() == statementCount + 2);
    REQUIRE(logger.schemaErrors.size() == 2);
    CHECK(logger.schemaErrors[0].kind == SqlSchemaErrorKind::DuplicateObject);
    CHECK(logger.schemaErrors[1].kind == SqlSchemaErrorKind::DuplicateObject);

    // the bridge table is still intact and usable
    auto query = configuration.CreateSqlBuilder();
    query.Select().Selector("COUNT(*)").Table("ArticlesByDay_Document");
    auto stmt = SqlStatement { transaction.Connection() };
    stmt.ExecuteDirect(query.ToSqlString());
    REQUIRE(stmt.FetchRow());
    CHECK(stmt.GetColumn<int64_t>(1) == 0);
}

TEST_CASE_METHOD(SqlTestFixture, "SqlSchemaBuilder.Database.ReduceIndexTable", "[SqlSchemaBuilder]")
{
    auto connection = SqlConnection {};
    REQUIRE(connection.IsAlive());

    DropTablesIfExist(connection, { "rd_ArticlesByDay_Document", "rd_ArticlesByDay", "rd_Document" });

    auto const configuration = SqlStoreConfiguration::ForConnection(connection, "rd_");
    {
        auto transaction = SqlTransaction { connection };
        auto executor = SqlTransactionExecutor { transaction };
        SqlSchemaBuilder { configuration, executor }
            .CreateTable("Document", [](SqlCreateTableCommandBuilder& table) { table.Identity("Id"); })
            .CreateReduceIndexTable<Models::DailyArticleCount>(AddCountColumn);
        transaction.Commit();
    }

    CHECK(TableExists(connection, configuration, "ArticlesByDay"));
    CHECK(TableExists(connection, configuration, "ArticlesByDay_Document"));

    auto expected = RecordingSchemaExecutor {};
    SqlSchemaBuilder { configuration, expected }.DropReduceIndexTable<Models::DailyArticleCount>();

    auto logger = ScopedSqlRecordingLogger {};
    {
        auto transaction = SqlTransaction { connection };
        auto executor = SqlTransactionExecutor { transaction };
        SqlSchemaBuilder { configuration, executor }.DropReduceIndexTable<Models::DailyArticleCount>();
        transaction.Commit();
    }

    // foreign keys (where they exist) first, then the bridge table, then the index table
    CHECK(logger.schemaStatements == expected.statements);
    if (connection.ServerType() == SqlServerType::SQLITE)
        CHECK(logger.schemaStatements
              == std::vector<std::string> {
                  R"(DROP TABLE "rd_ArticlesByDay_Document";)",
                  R"(DROP TABLE "rd_ArticlesByDay";)",
              });

    CHECK_FALSE(TableExists(connection, configuration, "ArticlesByDay_Document"));
    CHECK_FALSE(TableExists(connection, configuration, "ArticlesByDay"));

    DropTablesIfExist(connection, { "rd_Document" });
}
