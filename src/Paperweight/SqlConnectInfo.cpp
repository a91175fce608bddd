// SPDX-License-Identifier: Apache-2.0

#include "SqlConnectInfo.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

namespace
{

bool IsPasswordKey(std::string_view key) noexcept
{
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.front())))
        key.remove_prefix(1);
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.back())))
        key.remove_suffix(1);

    return std::ranges::equal(key, std::string_view { "PWD" }, [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) == b;
    });
}

} // namespace

std::string SqlConnectionString::Sanitized() const
{
    return SanitizePwd(value);
}

std::string SqlConnectionString::SanitizePwd(std::string_view input)
{
    std::string result;
    result.reserve(input.size());

    bool first = true;
    for (auto const attribute: input | std::views::split(';'))
    {
        auto const pair = std::string_view(attribute.begin(), attribute.end());
        if (!std::exchange(first, false))
            result += ';';

        auto const separator = pair.find('=');
        if (separator != std::string_view::npos && IsPasswordKey(pair.substr(0, separator)))
            result += "Pwd=***";
        else
            result += pair;
    }

    return result;
}
