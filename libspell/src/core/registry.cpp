// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/recipe.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/util.hpp"
#include "spell/util/cfile.hpp"

namespace spell
{
    /*****************
     * PackageRecord *
     *****************/

    auto PackageRecord::from_recipe(const Recipe& recipe, std::vector<std::string> files)
        -> PackageRecord
    {
        return {
            /* .name= */ recipe.name(),
            /* .version= */ recipe.version(),
            /* .files= */ std::move(files),
            /* .runtime_deps= */ recipe.runtime_deps(),
            /* .build_deps= */ recipe.build_deps(),
            /* .provides= */ recipe.provides(),
        };
    }

    void to_json(nlohmann::json& j, const PackageRecord& rec)
    {
        j["name"] = rec.name;
        j["version"] = rec.version;
        j["files"] = rec.files;
        j["runtime_deps"] = rec.runtime_deps;
        j["build_deps"] = rec.build_deps;
        j["provides"] = rec.provides;
    }

    void from_json(const nlohmann::json& j, PackageRecord& rec)
    {
        rec.name = j.at("name").get<std::string>();
        rec.version = j.at("version").get<std::string>();
        rec.files = j.value("files", std::vector<std::string>());
        rec.runtime_deps = j.value("runtime_deps", PackageRecord::name_list());
        rec.build_deps = j.value("build_deps", PackageRecord::name_list());
        rec.provides = j.value("provides", PackageRecord::name_list());
    }

    /*******************
     * PackageRegistry *
     *******************/

    auto PackageRegistry::contains(const std::string& name) const -> bool
    {
        return get(name).has_value();
    }

    /********************
     * JsonFileRegistry *
     ********************/

    JsonFileRegistry::JsonFileRegistry(fs::path path)
        : m_path(std::move(path))
    {
    }

    auto JsonFileRegistry::path() const -> const fs::path&
    {
        return m_path;
    }

    auto JsonFileRegistry::records() const -> const record_map&
    {
        if (m_records.has_value())
        {
            return m_records.value();
        }

        auto records = record_map();
        std::error_code ec;
        if (fs::exists(m_path, ec))
        {
            try
            {
                const auto j = nlohmann::json::parse(read_contents(m_path));
                for (const auto& [name, value] : j.at("installed").items())
                {
                    auto rec = value.get<PackageRecord>();
                    records.insert_or_assign(name, std::move(rec));
                }
            }
            catch (const nlohmann::json::exception& ex)
            {
                throw spell_error(
                    fmt::format("Corrupted registry '{}': {}", m_path.string(), ex.what()),
                    spell_error_code::registry_failure
                );
            }
            catch (const std::runtime_error& ex)
            {
                throw spell_error(
                    fmt::format("Could not read registry '{}': {}", m_path.string(), ex.what()),
                    spell_error_code::registry_failure
                );
            }
        }
        LOG_DEBUG << "Loaded " << records.size() << " installed package(s) from " << m_path;
        m_records = std::move(records);
        return m_records.value();
    }

    void JsonFileRegistry::persist(const record_map& records) const
    {
        auto j = nlohmann::json::object();
        j["installed"] = nlohmann::json::object();
        for (const auto& [name, rec] : records)
        {
            j["installed"][name] = rec;
        }
        detail::write_durably(m_path, j.dump(2));
    }

    auto JsonFileRegistry::get(const std::string& name) const -> std::optional<PackageRecord>
    {
        const auto& recs = records();
        if (auto it = recs.find(name); it != recs.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void JsonFileRegistry::put(const PackageRecord& record)
    {
        // Read again from storage, mutations never patch a cached document
        m_records.reset();
        auto updated = records();
        updated.insert_or_assign(record.name, record);
        persist(updated);
        m_records = std::move(updated);
    }

    bool JsonFileRegistry::remove(const std::string& name)
    {
        m_records.reset();
        auto updated = records();
        if (updated.erase(name) == 0)
        {
            return false;
        }
        persist(updated);
        m_records = std::move(updated);
        return true;
    }

    auto JsonFileRegistry::all() const -> record_map
    {
        return records();
    }

    /********************
     * InMemoryRegistry *
     ********************/

    InMemoryRegistry::InMemoryRegistry(record_map records)
        : m_records(std::move(records))
    {
    }

    auto InMemoryRegistry::get(const std::string& name) const -> std::optional<PackageRecord>
    {
        if (auto it = m_records.find(name); it != m_records.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void InMemoryRegistry::put(const PackageRecord& record)
    {
        m_records.insert_or_assign(record.name, record);
    }

    bool InMemoryRegistry::remove(const std::string& name)
    {
        return m_records.erase(name) > 0;
    }

    auto InMemoryRegistry::all() const -> record_map
    {
        return m_records;
    }

    namespace detail
    {
        void write_durably(const fs::path& path, std::string_view content)
        {
            const auto fail = [&](std::string_view what, const std::error_code& ec)
            {
                return spell_error(
                    fmt::format("Could not {} registry '{}': {}", what, path.string(), ec.message()),
                    spell_error_code::registry_failure
                );
            };

            const auto dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec)
            {
                throw fail("create directory of", ec);
            }

            // Same directory so that the rename is atomic
            auto tmp_path = path;
            tmp_path += ".tmp";
            {
                auto file = util::CFile::try_open(tmp_path, "wb");
                if (!file)
                {
                    throw fail("open temporary file for", file.error());
                }
                const auto result = file->try_write(content)
                                        .and_then([&] { return file->try_sync(); })
                                        .and_then([&] { return file->try_close(); });
                if (!result)
                {
                    fs::remove(tmp_path, ec);
                    throw fail("write", result.error());
                }
            }

            fs::rename(tmp_path, path, ec);
            if (ec)
            {
                const auto rename_ec = ec;
                fs::remove(tmp_path, ec);
                throw fail("replace", rename_ec);
            }

            // The rename itself only survives a power loss once the directory is synced
            auto dir_file = util::CFile::try_open(dir, "r");
            if (!dir_file)
            {
                throw fail("open directory of", dir_file.error());
            }
            const auto synced = dir_file->try_sync().and_then([&] { return dir_file->try_close(); });
            if (!synced)
            {
                throw fail("sync directory of", synced.error());
            }
        }
    }
}
