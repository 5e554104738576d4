// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_UNINSTALL_HPP
#define SPELL_CORE_UNINSTALL_HPP

#include <string>
#include <vector>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    class PackageRegistry;

    /**
     * Installed packages recording ``name`` as a runtime dependency, sorted.
     *
     * Only the registry is consulted, so the answer reflects the dependencies each package had
     * when it was installed.
     */
    [[nodiscard]] auto reverse_dependencies(const PackageRegistry& registry, const std::string& name)
        -> std::vector<std::string>;

    /**
     * Installed packages that no installed package needs at runtime, sorted.
     */
    [[nodiscard]] auto find_orphans(const PackageRegistry& registry) -> std::vector<std::string>;

    /**
     * Order in which recorded files are deleted: deepest paths first, stable otherwise.
     */
    [[nodiscard]] auto removal_order(const std::vector<std::string>& files) -> std::vector<fs::path>;

    /**
     * Remove the files of an installed package and then its registry entry.
     *
     * Failures to delete single files are reported as warnings. Directories left empty are
     * removed up to, but excluding, ``install_root``.
     *
     * @return ``false`` with a warning if the package is not installed.
     * @throw spell_error with ``blocked_by_dependents`` code, and the sorted dependents as
     *        payload, when other installed packages need it and ``force`` is not set.
     */
    bool uninstall(
        PackageRegistry& registry,
        const std::string& name,
        bool force,
        const fs::path& install_root = "/"
    );
}

#endif
