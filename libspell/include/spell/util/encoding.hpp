// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_UTIL_ENCODING_HPP
#define SPELL_UTIL_ENCODING_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace spell::util
{
    /**
     * Convert the lower four bits of a byte to its hexadecimal character.
     */
    [[nodiscard]] auto nibble_to_hex(std::byte b) noexcept -> char;

    /**
     * Write the hexadecimal representation of a byte range.
     *
     * The output must be able to hold twice as many characters as there are bytes.
     */
    void bytes_to_hex_to(const std::byte* first, const std::byte* last, char* out) noexcept;

    [[nodiscard]] auto bytes_to_hex_str(const std::byte* first, const std::byte* last)
        -> std::string;

    /**
     * Whether the string is only made of hexadecimal characters, in any case.
     */
    [[nodiscard]] auto is_hex_str(std::string_view str) noexcept -> bool;
}
#endif
