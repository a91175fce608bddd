// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "../Api.hpp"
#include "SchemaCommands.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

class SqlDialect;

/// Translates schema commands into SQL statements of one dialect.
///
/// A command may yield no statement at all, if the dialect cannot apply it to an existing table.
/// Commands the dialect cannot express raise a std::runtime_error.
class [[nodiscard]] PAPERWEIGHT_API SqlCommandInterpreter final
{
  public:
    SqlCommandInterpreter(SqlDialect const& dialect, std::string schema):
        _dialect { &dialect },
        _schema { std::move(schema) }
    {
    }

    [[nodiscard]] std::vector<std::string> CreateSql(SqlSchemaCommand const& command) const;

    [[nodiscard]] SqlDialect const& Dialect() const noexcept
    {
        return *_dialect;
    }

    [[nodiscard]] std::string_view Schema() const noexcept
    {
        return _schema;
    }

  private:
    SqlDialect const* _dialect;
    std::string _schema;
};
