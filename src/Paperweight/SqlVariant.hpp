// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "Api.hpp"
#include "Utils.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <variant>

/// Represents the SQL NULL value.
struct SqlNullType
{
    constexpr auto operator<=>(SqlNullType const&) const noexcept = default;
};

static constexpr inline auto SqlNullValue = SqlNullType {};

/// A value bound to a named query parameter.
struct SqlVariant
{
    using InnerType = std::variant<SqlNullType, bool, int64_t, double, std::string>;

    InnerType value;

    SqlVariant() = default;
    SqlVariant(SqlVariant const&) = default;
    SqlVariant(SqlVariant&&) noexcept = default;
    SqlVariant& operator=(SqlVariant const&) = default;
    SqlVariant& operator=(SqlVariant&&) noexcept = default;
    ~SqlVariant() = default;

    PAPERWEIGHT_FORCE_INLINE SqlVariant(SqlNullType /*null*/) noexcept:
        value { SqlNullValue }
    {
    }

    PAPERWEIGHT_FORCE_INLINE SqlVariant(bool other) noexcept:
        value { other }
    {
    }

    template <typename T>
        requires(std::integral<T> && !std::same_as<T, bool>)
    PAPERWEIGHT_FORCE_INLINE SqlVariant(T other) noexcept:
        value { static_cast<int64_t>(other) }
    {
    }

    PAPERWEIGHT_FORCE_INLINE SqlVariant(double other) noexcept:
        value { other }
    {
    }

    PAPERWEIGHT_FORCE_INLINE SqlVariant(std::string other) noexcept:
        value { std::move(other) }
    {
    }

    PAPERWEIGHT_FORCE_INLINE SqlVariant(std::string_view other):
        value { std::string(other) }
    {
    }

    PAPERWEIGHT_FORCE_INLINE SqlVariant(char const* other):
        value { std::string(other) }
    {
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
        return std::holds_alternative<SqlNullType>(value);
    }

    bool operator==(SqlVariant const& other) const noexcept = default;

    /// Renders the value in a human readable form, e.g. for logging.
    [[nodiscard]] std::string ToString() const
    {
        return std::visit(detail::overloaded {
                              [](SqlNullType) { return std::string("NULL"); },
                              [](bool v) { return std::string(v ? "true" : "false"); },
                              [](int64_t v) { return std::to_string(v); },
                              [](double v) { return std::format("{}", v); },
                              [](std::string const& v) { return std::format("'{}'", v); },
                          },
                          value);
    }
};

template <>
struct std::formatter<SqlVariant>: formatter<std::string>
{
    auto format(SqlVariant const& value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(value.ToString(), ctx);
    }
};
