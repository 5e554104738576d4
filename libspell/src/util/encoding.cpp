// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "spell/util/encoding.hpp"

namespace spell::util
{
    auto nibble_to_hex(std::byte b) noexcept -> char
    {
        constexpr auto hex_chars = std::string_view("0123456789abcdef");
        return hex_chars[static_cast<std::size_t>(b & std::byte{ 0x0F })];
    }

    void bytes_to_hex_to(const std::byte* first, const std::byte* last, char* out) noexcept
    {
        // The output may overlap the second half of the input
        for (; first != last; ++first)
        {
            const auto b = *first;
            *out++ = nibble_to_hex(b >> 4);
            *out++ = nibble_to_hex(b);
        }
    }

    auto bytes_to_hex_str(const std::byte* first, const std::byte* last) -> std::string
    {
        auto out = std::string(static_cast<std::size_t>(last - first) * 2, '0');
        bytes_to_hex_to(first, last, out.data());
        return out;
    }

    auto is_hex_str(std::string_view str) noexcept -> bool
    {
        return std::all_of(
            str.cbegin(),
            str.cend(),
            [](char c)
            { return ('0' <= c && c <= '9') || ('a' <= c && c <= 'f') || ('A' <= c && c <= 'F'); }
        );
    }
}
