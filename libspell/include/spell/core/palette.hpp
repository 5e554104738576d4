// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_PALETTE_HPP
#define SPELL_CORE_PALETTE_HPP

#include <fmt/color.h>

namespace spell
{
    struct Palette
    {
        /** A step of a command is starting. */
        fmt::text_style info;
        /** A step or command completed. */
        fmt::text_style success;
        /** Something unexpected that does not stop the command. */
        fmt::text_style warning;
        /** The command is failing. */
        fmt::text_style failure;
        /** Reference to some input from the user, such as a package name. */
        fmt::text_style user;
        /** Secondary information, such as a path. */
        fmt::text_style shown;

        /** A Palette with no colors at all. */
        static constexpr auto no_color() -> Palette;
        /** A Palette with terminal 4 bit colors. */
        static constexpr auto terminal() -> Palette;
    };

    /*******************************
     *  Implementation of Palette  *
     *******************************/

    inline constexpr auto Palette::no_color() -> Palette
    {
        return {};
    }

    inline constexpr auto Palette::terminal() -> Palette
    {
        return {
            /* .info= */ fmt::fg(fmt::terminal_color::cyan),
            /* .success= */ fmt::fg(fmt::terminal_color::green),
            /* .warning= */ fmt::fg(fmt::terminal_color::yellow),
            /* .failure= */ fmt::fg(fmt::terminal_color::red),
            /* .user= */ fmt::fg(fmt::terminal_color::blue) | fmt::emphasis::bold,
            /* .shown= */ fmt::fg(fmt::terminal_color::bright_black),
        };
    }

}
#endif
