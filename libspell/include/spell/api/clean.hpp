// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_CLEAN_HPP
#define SPELL_API_CLEAN_HPP

#include <optional>
#include <string>
#include <vector>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    class Configuration;

    /**
     * Remove build workspaces: all of them, or those of one package.
     */
    void clean(Configuration& config, bool all, const std::optional<std::string>& name);

    namespace detail
    {
        /**
         * Remove the whole work directory, or the ``<name>-<version>`` workspaces in it
         * for the given versions.
         *
         * @return The removed directories.
         */
        auto clean_work_dir(
            const fs::path& work_dir,
            bool all,
            const std::optional<std::string>& name,
            const std::vector<std::string>& versions = {}
        ) -> std::vector<fs::path>;
    }
}

#endif
