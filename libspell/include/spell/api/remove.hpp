// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_REMOVE_HPP
#define SPELL_API_REMOVE_HPP

#include <string>
#include <vector>

namespace spell
{
    class Configuration;

    /**
     * Uninstall packages, refusing those other installed packages need unless forced.
     */
    void remove(Configuration& config, const std::vector<std::string>& names, bool force);
}

#endif
