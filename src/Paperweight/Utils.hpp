// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>

#include <reflection-cpp/reflection.hpp>

namespace detail
{

template <class... Ts>
struct overloaded: Ts... // NOLINT(readability-identifier-naming)
{
    using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename T, typename... Comps>
concept OneOf = (std::same_as<T, Comps> || ...);

template <typename T>
constexpr auto AlwaysFalse = std::false_type::value;

// Strips any namespace or enclosing class qualification from a reflected type name.
constexpr std::string_view UnqualifiedTypeName(std::string_view name) noexcept
{
    if (auto const pos = name.rfind("::"); pos != std::string_view::npos)
        name.remove_prefix(pos + 2);
    return name;
}

// True when the text holds nothing but whitespace.
inline bool IsBlank(std::string_view text) noexcept
{
    return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

template <typename Index>
struct IndexTypeName
{
    static constexpr std::string_view Value = []() {
        if constexpr (requires { Index::IndexName; })
            return std::string_view { Index::IndexName };
        else
            return UnqualifiedTypeName(Reflection::TypeName<Index>);
    }();
};

} // namespace detail

/// The identifier an index type is registered under.
///
/// This is @c Index::IndexName when the type declares one, and its unqualified type name otherwise.
template <typename Index>
constexpr std::string_view SqlIndexTypeName = detail::IndexTypeName<Index>::Value;
