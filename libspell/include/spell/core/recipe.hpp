// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_RECIPE_HPP
#define SPELL_CORE_RECIPE_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "spell/core/error_handling.hpp"
#include "spell/fs/filesystem.hpp"

namespace spell
{
    using variable_map = std::map<std::string, std::string>;

    /**
     * Substitute every ``${KEY}`` of the string with its value in the environment.
     *
     * This is a single pass: substituted values are not expanded again, and references to keys
     * absent from the environment are left verbatim for the shell to resolve later.
     */
    [[nodiscard]] auto expand_vars(std::string_view str, const variable_map& env) -> std::string;

    enum class hash_algorithm
    {
        sha256,
        sha512,
        md5
    };

    /**
     * A content digest declared in a recipe as ``<algorithm>:<hexdigest>``.
     */
    struct HashSpec
    {
        hash_algorithm algorithm = hash_algorithm::sha256;
        /** Lower case hexadecimal digest. */
        std::string digest;

        [[nodiscard]] static auto parse(std::string_view str) -> expected_t<HashSpec>;

        [[nodiscard]] auto str() const -> std::string;

        auto operator==(const HashSpec&) const -> bool = default;
    };

    [[nodiscard]] auto algorithm_name(hash_algorithm algo) -> std::string_view;

    /** A file downloaded by URL. */
    struct CurlSource
    {
        std::string url;
        std::optional<HashSpec> hash;
        /** Name of the downloaded file, the last segment of the URL path by default. */
        std::optional<std::string> filename;

        [[nodiscard]] auto file_name() const -> std::string;

        auto operator==(const CurlSource&) const -> bool = default;
    };

    /** A git repository cloned at a reference. */
    struct GitSource
    {
        std::string url;
        std::optional<std::string> ref;
        /** Clone directory, the repository name by default. */
        std::optional<std::string> dir;

        [[nodiscard]] auto dir_name() const -> std::string;

        auto operator==(const GitSource&) const -> bool = default;
    };

    using SourceDescriptor = std::variant<CurlSource, GitSource>;

    struct PatchUrl
    {
        std::string url;

        auto operator==(const PatchUrl&) const -> bool = default;
    };

    /** All the ``*.patch`` files of a directory, in lexicographic order. */
    struct PatchDir
    {
        fs::path dir;

        auto operator==(const PatchDir&) const -> bool = default;
    };

    struct PatchFile
    {
        fs::path path;

        auto operator==(const PatchFile&) const -> bool = default;
    };

    using PatchDescriptor = std::variant<PatchUrl, PatchDir, PatchFile>;

    /**
     * Declarative description of how to fetch, patch, build and install one package version.
     *
     * Recipes are immutable once loaded and every string they hold has already been through
     * variable expansion.
     */
    class Recipe
    {
    public:

        using name_list = std::vector<std::string>;
        using command_list = std::vector<std::string>;

        /**
         * Load a recipe file, expanding variables against the process environment.
         *
         * @throw spell_error with ``recipe_parse`` code on malformed documents.
         */
        [[nodiscard]] static auto load(const fs::path& path) -> Recipe;

        /**
         * Load a recipe file, expanding variables against the given base environment.
         */
        [[nodiscard]] static auto load(const fs::path& path, const variable_map& base_env)
            -> Recipe;

        /**
         * Parse a recipe document.
         *
         * @param origin File the document comes from, relative patch paths are resolved
         *        against its directory.
         */
        [[nodiscard]] static auto
        parse(std::string_view document, const fs::path& origin, const variable_map& base_env)
            -> Recipe;

        [[nodiscard]] auto name() const -> const std::string&;
        [[nodiscard]] auto version() const -> const std::string&;
        /** The ``name-version`` identifier of the unit of work. */
        [[nodiscard]] auto full_name() const -> std::string;
        [[nodiscard]] auto variables() const -> const variable_map&;
        [[nodiscard]] auto sources() const -> const std::vector<SourceDescriptor>&;
        [[nodiscard]] auto patches() const -> const std::vector<PatchDescriptor>&;
        [[nodiscard]] auto build_steps() const -> const command_list&;
        [[nodiscard]] auto install_steps() const -> const command_list&;
        [[nodiscard]] auto runtime_deps() const -> const name_list&;
        [[nodiscard]] auto build_deps() const -> const name_list&;
        [[nodiscard]] auto provides() const -> const name_list&;
        [[nodiscard]] auto path() const -> const fs::path&;

        /** Runtime then build dependencies, without duplicates, in declaration order. */
        [[nodiscard]] auto all_deps() const -> name_list;

    private:

        std::string m_name;
        std::string m_version;
        variable_map m_variables;
        std::vector<SourceDescriptor> m_sources;
        std::vector<PatchDescriptor> m_patches;
        command_list m_build;
        command_list m_install;
        name_list m_runtime_deps;
        name_list m_build_deps;
        name_list m_provides;
        fs::path m_path;

        Recipe() = default;
    };

    using recipe_map = std::map<std::string, Recipe>;

    /**
     * Load every ``*.yml`` and ``*.yaml`` file found recursively under the directory.
     *
     * A missing directory gives an empty set. When two files declare the same name, the one
     * coming later in path order wins.
     */
    [[nodiscard]] auto load_all_recipes(const fs::path& recipes_dir) -> recipe_map;

    [[nodiscard]] auto load_all_recipes(const fs::path& recipes_dir, const variable_map& base_env)
        -> recipe_map;
}

#endif
