// SPDX-License-Identifier: Apache-2.0

#include "SqlTableNameConvention.hpp"

#include <format>
#include <stdexcept>

std::string SqlDefaultTableNameConvention::GetDocumentTable(std::string_view collection) const
{
    if (collection.empty())
        return std::string(DocumentTable);

    return std::format("{}_{}", collection, DocumentTable);
}

std::string SqlDefaultTableNameConvention::GetIndexTable(std::string_view indexName, std::string_view collection) const
{
    if (indexName.empty())
        throw std::invalid_argument("Cannot resolve the table of an index without a name");

    if (collection.empty())
        return std::string(indexName);

    return std::format("{}_{}", collection, indexName);
}
