// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_UTIL_STRING_HPP
#define SPELL_UTIL_STRING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace spell::util
{
    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto starts_with(std::string_view str, std::string_view::value_type c) -> bool;

    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view::value_type c) -> bool;

    /**
     * Check if the string ends with any of the given suffixes.
     */
    template <typename StrRange>
    [[nodiscard]] auto ends_with_any(std::string_view str, const StrRange& suffixes) -> bool;

    [[nodiscard]] auto contains(std::string_view str, std::string_view sub_str) -> bool;
    [[nodiscard]] auto contains(std::string_view str, char c) -> bool;

    [[nodiscard]] auto remove_prefix(std::string_view str, std::string_view prefix)
        -> std::string_view;
    [[nodiscard]] auto remove_suffix(std::string_view str, std::string_view suffix)
        -> std::string_view;

    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, char c) -> std::string_view;

    [[nodiscard]] auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>;

    [[nodiscard]] auto
    split(std::string_view input, std::string_view sep, std::size_t max_split = SIZE_MAX)
        -> std::vector<std::string>;
    [[nodiscard]] auto split(std::string_view input, char sep, std::size_t max_split = SIZE_MAX)
        -> std::vector<std::string>;

    template <typename Range>
    [[nodiscard]] auto join(std::string_view sep, const Range& container) -> std::string;

    void replace_all(std::string& data, std::string_view search, std::string_view replace);

    template <typename... Args>
    [[nodiscard]] auto concat(const Args&... args) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    template <typename StrRange>
    auto ends_with_any(std::string_view str, const StrRange& suffixes) -> bool
    {
        for (const auto& suffix : suffixes)
        {
            if (ends_with(str, suffix))
            {
                return true;
            }
        }
        return false;
    }

    template <typename Range>
    auto join(std::string_view sep, const Range& container) -> std::string
    {
        auto out = std::string();
        bool first = true;
        for (const auto& elem : container)
        {
            if (!first)
            {
                out += sep;
            }
            out += elem;
            first = false;
        }
        return out;
    }

    namespace detail
    {
        inline auto length(const char* s) -> std::size_t
        {
            return std::char_traits<char>::length(s);
        }

        inline auto length(std::string_view s) -> std::size_t
        {
            return s.size();
        }

        inline auto length(const std::string& s) -> std::size_t
        {
            return s.size();
        }

        inline auto length(char) -> std::size_t
        {
            return 1;
        }
    }

    template <typename... Args>
    auto concat(const Args&... args) -> std::string
    {
        std::string result;
        result.reserve((detail::length(args) + ...));
        ((result += args), ...);
        return result;
    }
}
#endif
