// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_CAPABILITIES_HPP
#define SPELL_CORE_CAPABILITIES_HPP

#include <optional>
#include <string>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    class Context;

    /**
     * The side effects the build pipeline delegates to the outside world.
     *
     * Every operation either succeeds or throws a ``spell_error``.
     */
    class BuildCapabilities
    {
    public:

        virtual ~BuildCapabilities() = default;

        /** Download a URL to a file. */
        virtual void fetch_url(const std::string& url, const fs::path& destination) = 0;

        /** Shallow clone of a repository, at a branch or tag when one is given. */
        virtual void
        clone(const std::string& url, const std::optional<std::string>& ref, const fs::path& destination)
            = 0;

        virtual void extract(const fs::path& archive, const fs::path& destination) = 0;

        /** Apply a unified diff with ``-p1`` inside a source tree. */
        virtual void
        apply_patch(const fs::path& patch, const fs::path& source_root, const fs::path& log) = 0;

        /**
         * Copy one staged entry to its live location, overwriting it.
         *
         * Symbolic links are copied as links.
         */
        virtual void install_entry(const fs::path& staged, const fs::path& target) = 0;
    };

    /**
     * Capabilities backed by libcurl, git, libarchive and patch.
     */
    class SystemCapabilities : public BuildCapabilities
    {
    public:

        explicit SystemCapabilities(const Context& context);

        void fetch_url(const std::string& url, const fs::path& destination) override;
        void clone(
            const std::string& url,
            const std::optional<std::string>& ref,
            const fs::path& destination
        ) override;
        void extract(const fs::path& archive, const fs::path& destination) override;
        void apply_patch(const fs::path& patch, const fs::path& source_root, const fs::path& log) override;
        void install_entry(const fs::path& staged, const fs::path& target) override;

    private:

        const Context& m_context;
    };
}

#endif
