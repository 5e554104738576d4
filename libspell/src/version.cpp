// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "spell/version.hpp"

namespace spell
{
    std::string version()
    {
        return LIBSPELL_VERSION_STRING;
    }

    std::array<int, 3> version_arr()
    {
        return { LIBSPELL_VERSION_MAJOR, LIBSPELL_VERSION_MINOR, LIBSPELL_VERSION_PATCH };
    }
}
