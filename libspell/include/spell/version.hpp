// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBSPELL_VERSION_HPP
#define LIBSPELL_VERSION_HPP

#include <array>
#include <string>

#define LIBSPELL_VERSION_MAJOR 0
#define LIBSPELL_VERSION_MINOR 3
#define LIBSPELL_VERSION_PATCH 0

#define LIBSPELL_VERSION_STRING "0.3.0"
#define LIBSPELL_VERSION                                                                           \
    (LIBSPELL_VERSION_MAJOR * 10000 + LIBSPELL_VERSION_MINOR * 100 + LIBSPELL_VERSION_PATCH)

namespace spell
{
    std::string version();

    std::array<int, 3> version_arr();
}

#endif
