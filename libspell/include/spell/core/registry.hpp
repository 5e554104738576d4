// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_REGISTRY_HPP
#define SPELL_CORE_REGISTRY_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    class Recipe;

    /**
     * What is recorded about one installed package.
     *
     * Dependencies and provides are a snapshot of the recipe at install time.
     */
    struct PackageRecord
    {
        using name_list = std::vector<std::string>;

        std::string name;
        std::string version;
        /** Absolute paths written in the live root, in install order. */
        std::vector<std::string> files;
        name_list runtime_deps;
        name_list build_deps;
        name_list provides;

        [[nodiscard]] static auto from_recipe(const Recipe& recipe, std::vector<std::string> files)
            -> PackageRecord;

        auto operator==(const PackageRecord&) const -> bool = default;
    };

    void to_json(nlohmann::json& j, const PackageRecord& rec);
    void from_json(const nlohmann::json& j, PackageRecord& rec);

    /**
     * Source of truth for what is installed.
     *
     * ``put`` and ``remove`` are the commit points of install and uninstall: once they return,
     * the change is durable.
     */
    class PackageRegistry
    {
    public:

        using record_map = std::map<std::string, PackageRecord>;

        virtual ~PackageRegistry() = default;

        [[nodiscard]] virtual auto get(const std::string& name) const
            -> std::optional<PackageRecord>
            = 0;
        virtual void put(const PackageRecord& record) = 0;
        /** Remove the record, returning whether one existed. */
        virtual bool remove(const std::string& name) = 0;
        [[nodiscard]] virtual auto all() const -> record_map = 0;

        [[nodiscard]] auto contains(const std::string& name) const -> bool;
    };

    /**
     * Registry persisted as a single JSON document ``{"installed": {<name>: record}}``.
     *
     * The document is read lazily on first access. Each mutation rewrites the whole document
     * to a temporary file in the same directory, syncs it to disk and renames it over the
     * previous one.
     */
    class JsonFileRegistry : public PackageRegistry
    {
    public:

        explicit JsonFileRegistry(fs::path path);

        auto get(const std::string& name) const -> std::optional<PackageRecord> override;
        void put(const PackageRecord& record) override;
        bool remove(const std::string& name) override;
        auto all() const -> record_map override;

        [[nodiscard]] auto path() const -> const fs::path&;

    private:

        fs::path m_path;
        mutable std::optional<record_map> m_records;

        auto records() const -> const record_map&;
        void persist(const record_map& records) const;
    };

    /**
     * Registry living in memory only.
     */
    class InMemoryRegistry : public PackageRegistry
    {
    public:

        InMemoryRegistry() = default;
        explicit InMemoryRegistry(record_map records);

        auto get(const std::string& name) const -> std::optional<PackageRecord> override;
        void put(const PackageRecord& record) override;
        bool remove(const std::string& name) override;
        auto all() const -> record_map override;

    private:

        record_map m_records;
    };

    namespace detail
    {
        /**
         * Replace ``path`` with ``content`` through a synced temporary file and a rename,
         * then sync the parent directory.
         *
         * No temporary file is left behind on failure.
         */
        void write_durably(const fs::path& path, std::string_view content);
    }
}

#endif
