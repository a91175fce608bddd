// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "SqlVariant.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class SqlDialect;

/// @brief Incrementally builds the text of a SELECT statement.
///
/// Every clause is kept as a list of raw SQL fragments that are concatenated verbatim when rendering,
/// so callers are responsible for spacing and commas within the fragments they add.
/// Clauses are always rendered in the order
/// SELECT, FROM, JOIN, WHERE, GROUP BY, HAVING, ORDER BY, trailing fragments,
/// no matter in which order they were populated. Empty clauses are omitted.
///
/// A builder is not meant to be shared between threads. Use Clone() to derive independent variants of a query.
///
/// @code
/// auto builder = SqlBuilder { "yx_", SqlDialect::SqlServer() };
/// builder.Table("Document").Select().Selector("*").AndAlso("Type = 'Blog'");
/// builder.ToSqlString(); // SELECT * FROM [yx_Document] WHERE Type = 'Blog'
/// @endcode
class [[nodiscard]] SqlBuilder final
{
  public:
    /// Size the render buffer is reserved for.
    static constexpr std::size_t LargeBufferSize = 20'000;

    PAPERWEIGHT_API SqlBuilder(std::string tablePrefix, SqlDialect const& dialect);

    SqlBuilder(SqlBuilder&&) noexcept = default;
    SqlBuilder& operator=(SqlBuilder&&) noexcept = default;
    SqlBuilder& operator=(SqlBuilder const&) = delete;
    ~SqlBuilder() = default;

    /// Creates an independent copy of this builder sharing only the dialect.
    [[nodiscard]] PAPERWEIGHT_API SqlBuilder Clone() const;

    /// The statement kind, or an empty string if Select() was not called yet.
    [[nodiscard]] std::string_view Clause() const noexcept
    {
        return _clause;
    }

    [[nodiscard]] std::string_view TablePrefix() const noexcept
    {
        return _tablePrefix;
    }

    [[nodiscard]] SqlDialect const& Dialect() const noexcept
    {
        return *_dialect;
    }

    /// Replaces the FROM clause with the given (prefixed) table.
    PAPERWEIGHT_API SqlBuilder& Table(std::string_view table, std::string_view alias = {}, std::string_view schema = {});

    /// Appends a raw fragment to the FROM clause, e.g. a sub query.
    PAPERWEIGHT_API SqlBuilder& From(std::string_view from);

    /// Joins @p table on @p onTable.@p onColumn = @p toTable.@p toColumn.
    ///
    /// A side whose table name equals its alias is referred to by the quoted alias,
    /// any other side by its prefixed and quoted table name. A non-empty @p toAlias always
    /// names the right hand side.
    PAPERWEIGHT_API SqlBuilder& InnerJoin(std::string_view table,
                                          std::string_view onTable,
                                          std::string_view onColumn,
                                          std::string_view toTable,
                                          std::string_view toColumn,
                                          std::string_view schema = {},
                                          std::string_view alias = {},
                                          std::string_view toAlias = {});

    [[nodiscard]] bool HasJoin() const noexcept
    {
        return !_join.empty();
    }

    /// Marks the statement as SELECT. Nothing is rendered before this is called.
    PAPERWEIGHT_API SqlBuilder& Select();

    /// Replaces the projection by the given fragment.
    PAPERWEIGHT_API SqlBuilder& Selector(std::string_view selector);

    /// Replaces the projection by a single formatted column.
    PAPERWEIGHT_API SqlBuilder& Selector(std::string_view table,
                                         std::string_view column,
                                         std::string_view schema = {});

    /// Appends a fragment to the projection.
    PAPERWEIGHT_API SqlBuilder& AddSelector(std::string_view select);

    /// Prepends a fragment to the projection.
    PAPERWEIGHT_API SqlBuilder& InsertSelector(std::string_view select);

    /// The projection as rendered, i.e. all fragments concatenated.
    [[nodiscard]] PAPERWEIGHT_API std::string GetSelector() const;

    [[nodiscard]] std::vector<std::string> const& GetSelectors() const noexcept
    {
        return _select;
    }

    [[nodiscard]] std::vector<std::string> const& GetOrders() const noexcept
    {
        return _order;
    }

    /// Selects distinct rows only.
    ///
    /// If the statement is ordered and the dialect supports it, rows are made distinct
    /// on the first order expression (DISTINCT ON).
    PAPERWEIGHT_API SqlBuilder& Distinct();

    [[nodiscard]] bool IsDistinct() const noexcept
    {
        return _distinct;
    }

    /// Skips the given number of rows. The value is raw SQL, e.g. a literal or a parameter.
    PAPERWEIGHT_API SqlBuilder& Skip(std::string_view skip);

    /// Returns at most the given number of rows. The value is raw SQL, e.g. a literal or a parameter.
    PAPERWEIGHT_API SqlBuilder& Take(std::string_view take);

    [[nodiscard]] bool HasPaging() const noexcept
    {
        return _skip.has_value() || _count.has_value();
    }

    // Where clause. Connectives are only inserted between conditions and blank conditions are ignored.
    PAPERWEIGHT_API SqlBuilder& AndAlso(std::string_view where);
    PAPERWEIGHT_API SqlBuilder& WhereAnd(std::string_view where);
    PAPERWEIGHT_API SqlBuilder& WhereOr(std::string_view where);

    PAPERWEIGHT_API SqlBuilder& GroupBy(std::string_view groupBy);
    PAPERWEIGHT_API SqlBuilder& Having(std::string_view having);

    /// Clears both the GROUP BY and the HAVING clause.
    PAPERWEIGHT_API SqlBuilder& ClearGroupBy();

    [[nodiscard]] bool HasOrder() const noexcept
    {
        return !_order.empty();
    }

    // OrderBy* replace the current order, ThenOrderBy* extend it.
    PAPERWEIGHT_API SqlBuilder& OrderBy(std::string_view orderBy);
    PAPERWEIGHT_API SqlBuilder& OrderByDescending(std::string_view orderBy);
    PAPERWEIGHT_API SqlBuilder& OrderByRandom();
    PAPERWEIGHT_API SqlBuilder& ThenOrderBy(std::string_view orderBy);
    PAPERWEIGHT_API SqlBuilder& ThenOrderByDescending(std::string_view orderBy);
    PAPERWEIGHT_API SqlBuilder& ThenOrderByRandom();
    PAPERWEIGHT_API SqlBuilder& ClearOrder();

    /// Appends a raw fragment after the ORDER BY clause.
    PAPERWEIGHT_API SqlBuilder& Trail(std::string_view segment);
    PAPERWEIGHT_API SqlBuilder& ClearTrail();

    /// Formats a column reference. The wildcard column is never quoted.
    ///
    /// @param isAlias If true, @p table is an alias and therefore neither prefixed nor schema qualified.
    [[nodiscard]] PAPERWEIGHT_API std::string FormatColumn(std::string_view table,
                                                           std::string_view column,
                                                           std::string_view schema = {},
                                                           bool isAlias = false) const;

    /// Formats a table reference, i.e. the prefixed table name quoted for the dialect.
    [[nodiscard]] PAPERWEIGHT_API std::string FormatTable(std::string_view table, std::string_view schema = {}) const;

    /// The values bound to the named parameters used in the statement.
    [[nodiscard]] std::map<std::string, SqlVariant>& Parameters() noexcept
    {
        return _parameters;
    }

    [[nodiscard]] std::map<std::string, SqlVariant> const& Parameters() const noexcept
    {
        return _parameters;
    }

    /// Renders the statement.
    ///
    /// @returns the SQL text, or an empty string if the statement kind was never set.
    [[nodiscard]] PAPERWEIGHT_API std::string ToSqlString() const;

  private:
    SqlBuilder(SqlBuilder const&) = default;

    void AppendWhere(std::string_view connective, std::string_view where);
    void RenderTo(std::string& output) const;

    SqlDialect const* _dialect;
    std::string _tablePrefix;

    std::string _clause;
    std::vector<std::string> _select;
    std::vector<std::string> _from;
    std::vector<std::string> _join;
    std::vector<std::string> _where;
    std::vector<std::string> _group;
    std::vector<std::string> _having;
    std::vector<std::string> _order;
    std::vector<std::string> _trail;
    bool _distinct = false;
    std::optional<std::string> _skip;
    std::optional<std::string> _count;

    std::map<std::string, SqlVariant> _parameters;
};
