// SPDX-License-Identifier: Apache-2.0

#include "SqlBuilder.hpp"
#include "SqlDialect.hpp"
#include "Utils.hpp"

#include <format>
#include <utility>

namespace
{

void AppendAll(std::string& output, std::vector<std::string> const& segments)
{
    for (auto const& segment: segments)
        output += segment;
}

// Reused across renders on the same thread, so that large statements do not reallocate each time.
std::string& RenderBuffer()
{
    thread_local std::string buffer = [] {
        std::string result;
        result.reserve(SqlBuilder::LargeBufferSize);
        return result;
    }();
    return buffer;
}

} // namespace

SqlBuilder::SqlBuilder(std::string tablePrefix, SqlDialect const& dialect):
    _dialect { &dialect },
    _tablePrefix { std::move(tablePrefix) }
{
}

SqlBuilder SqlBuilder::Clone() const
{
    return SqlBuilder { *this };
}

SqlBuilder& SqlBuilder::Table(std::string_view table, std::string_view alias, std::string_view schema)
{
    _from.clear();
    _from.emplace_back(FormatTable(table, schema));

    if (!alias.empty())
    {
        _from.emplace_back(" AS ");
        _from.emplace_back(_dialect->QuoteForAliasName(alias));
    }

    return *this;
}

SqlBuilder& SqlBuilder::From(std::string_view from)
{
    _from.emplace_back(from);
    return *this;
}

SqlBuilder& SqlBuilder::InnerJoin(std::string_view table,
                                  std::string_view onTable,
                                  std::string_view onColumn,
                                  std::string_view toTable,
                                  std::string_view toColumn,
                                  std::string_view schema,
                                  std::string_view alias,
                                  std::string_view toAlias)
{
    auto const onReference =
        onTable == alias ? _dialect->QuoteForAliasName(onTable) : FormatTable(onTable, schema);

    auto const toReference = !toAlias.empty() ? _dialect->QuoteForAliasName(toAlias) : FormatTable(toTable, schema);

    _join.emplace_back(" INNER JOIN ");
    _join.emplace_back(FormatTable(table, schema));

    if (!alias.empty())
    {
        _join.emplace_back(" AS ");
        _join.emplace_back(_dialect->QuoteForAliasName(alias));
    }

    _join.emplace_back(" ON ");
    _join.emplace_back(std::format("{}.{}", onReference, _dialect->QuoteForColumnName(onColumn)));
    _join.emplace_back(" = ");
    _join.emplace_back(std::format("{}.{}", toReference, _dialect->QuoteForColumnName(toColumn)));

    return *this;
}

SqlBuilder& SqlBuilder::Select()
{
    _clause = "SELECT";
    return *this;
}

SqlBuilder& SqlBuilder::Selector(std::string_view selector)
{
    _select.clear();
    _select.emplace_back(selector);
    return *this;
}

SqlBuilder& SqlBuilder::Selector(std::string_view table, std::string_view column, std::string_view schema)
{
    return Selector(FormatColumn(table, column, schema));
}

SqlBuilder& SqlBuilder::AddSelector(std::string_view select)
{
    _select.emplace_back(select);
    return *this;
}

SqlBuilder& SqlBuilder::InsertSelector(std::string_view select)
{
    _select.emplace(_select.begin(), select);
    return *this;
}

std::string SqlBuilder::GetSelector() const
{
    if (_select.size() == 1)
        return _select.front();

    std::string result;
    AppendAll(result, _select);
    return result;
}

SqlBuilder& SqlBuilder::Distinct()
{
    _distinct = true;
    return *this;
}

SqlBuilder& SqlBuilder::Skip(std::string_view skip)
{
    _skip = std::string(skip);
    return *this;
}

SqlBuilder& SqlBuilder::Take(std::string_view take)
{
    _count = std::string(take);
    return *this;
}

void SqlBuilder::AppendWhere(std::string_view connective, std::string_view where)
{
    if (detail::IsBlank(where))
        return;

    if (!_where.empty())
        _where.emplace_back(connective);

    _where.emplace_back(where);
}

SqlBuilder& SqlBuilder::AndAlso(std::string_view where)
{
    AppendWhere(" AND ", where);
    return *this;
}

SqlBuilder& SqlBuilder::WhereAnd(std::string_view where)
{
    AppendWhere(" AND ", where);
    return *this;
}

SqlBuilder& SqlBuilder::WhereOr(std::string_view where)
{
    AppendWhere(" OR ", where);
    return *this;
}

SqlBuilder& SqlBuilder::GroupBy(std::string_view groupBy)
{
    _group.emplace_back(groupBy);
    return *this;
}

SqlBuilder& SqlBuilder::Having(std::string_view having)
{
    _having.emplace_back(having);
    return *this;
}

SqlBuilder& SqlBuilder::ClearGroupBy()
{
    _group.clear();
    _having.clear();
    return *this;
}

SqlBuilder& SqlBuilder::OrderBy(std::string_view orderBy)
{
    _order.clear();
    _order.emplace_back(orderBy);
    return *this;
}

SqlBuilder& SqlBuilder::OrderByDescending(std::string_view orderBy)
{
    _order.clear();
    _order.emplace_back(orderBy);
    _order.emplace_back(" DESC");
    return *this;
}

SqlBuilder& SqlBuilder::OrderByRandom()
{
    _order.clear();
    _order.emplace_back(_dialect->RandomOrderByClause());
    return *this;
}

SqlBuilder& SqlBuilder::ThenOrderBy(std::string_view orderBy)
{
    if (HasOrder())
        _order.emplace_back(", ");

    _order.emplace_back(orderBy);
    return *this;
}

SqlBuilder& SqlBuilder::ThenOrderByDescending(std::string_view orderBy)
{
    if (HasOrder())
        _order.emplace_back(", ");

    _order.emplace_back(orderBy);
    _order.emplace_back(" DESC");
    return *this;
}

SqlBuilder& SqlBuilder::ThenOrderByRandom()
{
    if (HasOrder())
        _order.emplace_back(", ");

    _order.emplace_back(_dialect->RandomOrderByClause());
    return *this;
}

SqlBuilder& SqlBuilder::ClearOrder()
{
    _order.clear();
    return *this;
}

SqlBuilder& SqlBuilder::Trail(std::string_view segment)
{
    _trail.emplace_back(segment);
    return *this;
}

SqlBuilder& SqlBuilder::ClearTrail()
{
    _trail.clear();
    return *this;
}

std::string SqlBuilder::FormatColumn(std::string_view table,
                                     std::string_view column,
                                     std::string_view schema,
                                     bool isAlias) const
{
    auto const quotedColumn = column == "*" ? std::string(column) : _dialect->QuoteForColumnName(column);

    if (isAlias)
        return std::format("{}.{}", _dialect->QuoteForAliasName(table), quotedColumn);

    return std::format("{}.{}", FormatTable(table, schema), quotedColumn);
}

std::string SqlBuilder::FormatTable(std::string_view table, std::string_view schema) const
{
    return _dialect->QuoteForTableName(std::format("{}{}", _tablePrefix, table), schema);
}

std::string SqlBuilder::ToSqlString() const
{
    if (_clause != "SELECT")
        return {};

    if (HasPaging())
    {
        // Paging may rewrite the projection, order and trail, so it is applied to a copy
        // in order to keep rendering free of side effects. A dialect may render the copy while paging,
        // so the shared buffer is only claimed afterwards.
        auto paged = SqlBuilder { *this };
        paged._skip.reset();
        paged._count.reset();
        _dialect->Page(paged, _skip.value_or(std::string {}), _count.value_or(std::string {}));

        auto& buffer = RenderBuffer();
        buffer.clear();
        paged.RenderTo(buffer);
        return buffer;
    }

    auto& buffer = RenderBuffer();
    buffer.clear();
    RenderTo(buffer);
    return buffer;
}

void SqlBuilder::RenderTo(std::string& output) const
{
    output += "SELECT ";

    if (_distinct)
    {
        output += "DISTINCT ";

        if (HasOrder() && _dialect->SupportsDistinctOn())
        {
            output += "ON(";
            output += _order.front();
            output += ") ";
        }
    }

    AppendAll(output, _select);

    if (!_from.empty())
    {
        output += " FROM ";
        AppendAll(output, _from);
    }

    AppendAll(output, _join);

    if (!_where.empty())
    {
        output += " WHERE ";
        AppendAll(output, _where);
    }

    if (!_group.empty())
    {
        output += " GROUP BY ";
        AppendAll(output, _group);
    }

    if (!_having.empty())
    {
        output += " HAVING ";
        AppendAll(output, _having);
    }

    if (HasOrder())
    {
        output += " ORDER BY ";
        AppendAll(output, _order);
    }

    AppendAll(output, _trail);
}
