// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <stdexcept>

#include "spell/util/string.hpp"

namespace spell::util
{
    namespace
    {
        constexpr std::string_view whitespaces = " \r\n\t\f\v";
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string();
        out.reserve(str.size());
        std::transform(
            str.cbegin(),
            str.cend(),
            std::back_inserter(out),
            [](char c) { return to_lower(c); }
        );
        return out;
    }

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    auto starts_with(std::string_view str, std::string_view::value_type c) -> bool
    {
        return (!str.empty()) && (str.front() == c);
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return str.size() >= suffix.size()
               && str.compare(str.size() - suffix.size(), std::string_view::npos, suffix) == 0;
    }

    auto ends_with(std::string_view str, std::string_view::value_type c) -> bool
    {
        return (!str.empty()) && (str.back() == c);
    }

    auto contains(std::string_view str, std::string_view sub_str) -> bool
    {
        return str.find(sub_str) != std::string_view::npos;
    }

    auto contains(std::string_view str, char c) -> bool
    {
        return str.find(c) != std::string_view::npos;
    }

    auto remove_prefix(std::string_view str, std::string_view prefix) -> std::string_view
    {
        if (starts_with(str, prefix))
        {
            return str.substr(prefix.size());
        }
        return str;
    }

    auto remove_suffix(std::string_view str, std::string_view suffix) -> std::string_view
    {
        if (ends_with(str, suffix))
        {
            return str.substr(0, str.size() - suffix.size());
        }
        return str;
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        const auto start = input.find_first_not_of(whitespaces);
        return start == std::string_view::npos ? std::string_view() : input.substr(start);
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        const auto end = input.find_last_not_of(whitespaces);
        return end == std::string_view::npos ? std::string_view() : input.substr(0, end + 1);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return rstrip(lstrip(input));
    }

    auto strip(std::string_view input, char c) -> std::string_view
    {
        const auto start = input.find_first_not_of(c);
        if (start == std::string_view::npos)
        {
            return {};
        }
        const auto end = input.find_last_not_of(c);
        return input.substr(start, end + 1 - start);
    }

    auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>
    {
        if (const auto pos = str.find(sep); pos != std::string_view::npos)
        {
            return { str.substr(0, pos), str.substr(pos + 1) };
        }
        return { str, std::nullopt };
    }

    auto split(std::string_view input, std::string_view sep, std::size_t max_split)
        -> std::vector<std::string>
    {
        if (sep.size() < 1)
        {
            throw std::invalid_argument("Separator must have size greater than 0");
        }

        std::vector<std::string> result;

        const std::size_t len = input.size();
        const std::size_t n = sep.size();
        std::size_t i = 0;
        std::size_t j = 0;

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                {
                    break;
                }
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    auto split(std::string_view input, char sep, std::size_t max_split) -> std::vector<std::string>
    {
        const auto sep_arr = std::array<char, 2>{ sep, '\0' };
        return split(input, std::string_view(sep_arr.data(), 1), max_split);
    }

    void replace_all(std::string& data, std::string_view search, std::string_view replace)
    {
        if (search.empty())
        {
            return;
        }
        std::size_t pos = data.find(search);
        while (pos != std::string::npos)
        {
            data.replace(pos, search.size(), replace);
            pos = data.find(search, pos + replace.size());
        }
    }
}
