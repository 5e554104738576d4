// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_PIPELINE_HPP
#define SPELL_CORE_PIPELINE_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "spell/core/recipe.hpp"
#include "spell/fs/filesystem.hpp"

namespace spell
{
    class BuildCapabilities;
    class Context;
    class PackageRegistry;

    /**
     * Directories owned by the build of one ``name-version``.
     */
    struct Workspace
    {
        fs::path root;
        /** Fetched and extracted sources. */
        fs::path src;
        fs::path build;
        /** Staging directory receiving the installed files. */
        fs::path destdir;
        /** Per step logs, shared by every version of the package. */
        fs::path logs;

        [[nodiscard]] static auto of(const Context& context, const Recipe& recipe) -> Workspace;
    };

    /**
     * The unique non hidden sub-directory of the sources, or the sources directory itself.
     */
    [[nodiscard]] auto select_build_root(const fs::path& src_dir) -> fs::path;

    /** Lower case hexadecimal digest of a file. */
    [[nodiscard]] auto file_digest(const fs::path& file, hash_algorithm algo) -> std::string;

    /**
     * @throw spell_error with ``hash_mismatch`` code when the file digest differs.
     */
    void verify_hash(const fs::path& file, const HashSpec& expected);

    /** Where the package artifact of a recipe is written. */
    [[nodiscard]] auto artifact_path(const Context& context, const Recipe& recipe) -> fs::path;

    /**
     * Variables added to the host environment of build and install steps.
     */
    [[nodiscard]] auto
    build_environment(const Context& context, const Recipe& recipe, const Workspace& ws, const fs::path& build_root)
        -> std::map<std::string, std::string>;

    /**
     * Runs the staged build of one recipe.
     *
     * Stages run in order, the first failure throws and skips the remaining ones:
     * workspace reset, fetch, build root selection, patches, build, stage install,
     * packaging, copy into the install root and finally the registry update.
     */
    class Pipeline
    {
    public:

        Pipeline(const Context& context, PackageRegistry& registry, BuildCapabilities& capabilities);

        /**
         * Build a recipe, and install it when asked.
         *
         * Without ``install``, the pipeline stops after the build steps.
         */
        void execute(const Recipe& recipe, bool install);

    private:

        const Context& m_context;
        PackageRegistry& m_registry;
        BuildCapabilities& m_capabilities;

        void fetch_sources(const Recipe& recipe, const Workspace& ws);
        void apply_patches(const Recipe& recipe, const Workspace& ws, const fs::path& build_root);
        void run_steps(
            const Recipe::command_list& steps,
            std::string_view kind,
            const Workspace& ws,
            const fs::path& build_root,
            const std::map<std::string, std::string>& env,
            bool privileged
        );
        auto commit_install(const Workspace& ws) -> std::vector<std::string>;
    };
}

#endif
