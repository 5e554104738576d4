// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_LIST_HPP
#define SPELL_API_LIST_HPP

namespace spell
{
    class Configuration;
    class PackageRegistry;

    /** Print the installed packages as ``name version``, sorted by name. */
    void list(Configuration& config);

    /** Print the installed packages no other installed package needs at runtime. */
    void orphans(Configuration& config);

    namespace detail
    {
        void print_installed(const PackageRegistry& registry, bool json);
        void print_orphans(const PackageRegistry& registry, bool json);
    }
}

#endif
