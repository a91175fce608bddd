// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"

#include <string>
#include <string_view>

/// Resolves the (unprefixed) names of the tables a collection of documents is stored in.
class PAPERWEIGHT_API SqlTableNameConvention
{
  public:
    SqlTableNameConvention() = default;
    SqlTableNameConvention(SqlTableNameConvention&&) = default;
    SqlTableNameConvention(SqlTableNameConvention const&) = default;
    SqlTableNameConvention& operator=(SqlTableNameConvention&&) = default;
    SqlTableNameConvention& operator=(SqlTableNameConvention const&) = default;
    virtual ~SqlTableNameConvention() = default;

    /// Retrieves the name of the table holding the documents of the given collection.
    ///
    /// An empty @p collection denotes the default collection.
    [[nodiscard]] virtual std::string GetDocumentTable(std::string_view collection) const = 0;

    /// Retrieves the name of the table holding the index @p indexName of the given collection.
    [[nodiscard]] virtual std::string GetIndexTable(std::string_view indexName, std::string_view collection) const = 0;
};

/// Names tables @c Document and @c IndexName for the default collection,
/// and @c Collection_Document and @c Collection_IndexName otherwise.
class PAPERWEIGHT_API SqlDefaultTableNameConvention final: public SqlTableNameConvention
{
  public:
    static constexpr std::string_view DocumentTable = "Document";

    [[nodiscard]] std::string GetDocumentTable(std::string_view collection) const override;

    /// @throws std::invalid_argument if @p indexName is empty.
    [[nodiscard]] std::string GetIndexTable(std::string_view indexName, std::string_view collection) const override;
};
