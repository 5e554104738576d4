// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_INFO_HPP
#define SPELL_API_INFO_HPP

#include <string>

#include "spell/core/recipe.hpp"

namespace spell
{
    class Configuration;
    class PackageRegistry;

    /**
     * Print the recipe of a package and its installed version, if any.
     */
    void info(Configuration& config, const std::string& name);

    namespace detail
    {
        void print_info(
            const recipe_map& recipes,
            const PackageRegistry& registry,
            const std::string& name,
            bool json
        );
    }
}

#endif
