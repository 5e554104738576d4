// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_REPOQUERY_HPP
#define SPELL_API_REPOQUERY_HPP

#include <string>
#include <vector>

#include "spell/core/recipe.hpp"

namespace spell
{
    class Configuration;

    /**
     * Print the names of the recipes matching an ECMAScript regular expression.
     */
    void search(Configuration& config, const std::string& pattern);

    namespace detail
    {
        /**
         * Sorted names of the recipes containing a match of the pattern.
         *
         * @throw spell_error with ``incorrect_usage`` code on an invalid pattern.
         */
        [[nodiscard]] auto search_recipes(const recipe_map& recipes, const std::string& pattern)
            -> std::vector<std::string>;
    }
}

#endif
