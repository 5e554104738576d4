// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_FS_FILESYSTEM_HPP
#define SPELL_FS_FILESYSTEM_HPP

#include <filesystem>

namespace spell
{
    // Paths handled by spell are always native POSIX paths.
    namespace fs = std::filesystem;
}

#endif
