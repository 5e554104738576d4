// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <iterator>
#include <set>

#include <fmt/format.h>

#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/uninstall.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    namespace
    {
        auto depth(const fs::path& path) -> std::size_t
        {
            return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
        }

        bool path_has_prefix(const fs::path& path, const fs::path& prefix)
        {
            auto pair = std::mismatch(path.begin(), path.end(), prefix.begin(), prefix.end());
            return pair.second == prefix.end();
        }

        void remove_empty_ancestors(const fs::path& path, const fs::path& install_root)
        {
            auto root = fs::absolute(install_root).lexically_normal();
            if (!root.has_filename() && root != root.root_path())
            {
                root = root.parent_path();
            }
            auto dir = path.parent_path();
            std::error_code ec;
            while (!dir.empty() && dir != root && dir != dir.root_path() && path_has_prefix(dir, root))
            {
                if (!fs::is_directory(fs::symlink_status(dir, ec)) || !fs::is_empty(dir, ec))
                {
                    return;
                }
                if (!fs::remove(dir, ec) || ec)
                {
                    return;
                }
                LOG_TRACE << "Removed empty directory " << dir;
                dir = dir.parent_path();
            }
        }
    }

    auto reverse_dependencies(const PackageRegistry& registry, const std::string& name)
        -> std::vector<std::string>
    {
        std::vector<std::string> out;
        for (const auto& [pkg, record] : registry.all())
        {
            if (pkg == name)
            {
                continue;
            }
            const auto& deps = record.runtime_deps;
            if (std::find(deps.cbegin(), deps.cend(), name) != deps.cend())
            {
                out.push_back(pkg);
            }
        }
        // Registry keys are ordered, so is the output
        return out;
    }

    auto find_orphans(const PackageRegistry& registry) -> std::vector<std::string>
    {
        const auto installed = registry.all();
        std::set<std::string> required;
        for (const auto& [pkg, record] : installed)
        {
            required.insert(record.runtime_deps.cbegin(), record.runtime_deps.cend());
        }

        std::vector<std::string> out;
        for (const auto& [pkg, record] : installed)
        {
            if (required.count(pkg) == 0)
            {
                out.push_back(pkg);
            }
        }
        return out;
    }

    auto removal_order(const std::vector<std::string>& files) -> std::vector<fs::path>
    {
        auto out = std::vector<fs::path>(files.cbegin(), files.cend());
        std::stable_sort(
            out.begin(),
            out.end(),
            [](const fs::path& a, const fs::path& b) { return depth(a) > depth(b); }
        );
        return out;
    }

    bool
    uninstall(PackageRegistry& registry, const std::string& name, bool force, const fs::path& install_root)
    {
        auto& console = Console::instance();

        const auto record = registry.get(name);
        if (!record.has_value())
        {
            console.report(message_kind::warning, fmt::format("{} is not installed", name));
            return false;
        }

        const auto dependents = reverse_dependencies(registry, name);
        if (!dependents.empty())
        {
            if (!force)
            {
                throw spell_error(
                    fmt::format(
                        "Cannot remove {}: required by {}. Use --force to remove it anyway.",
                        name,
                        util::join(", ", dependents)
                    ),
                    spell_error_code::blocked_by_dependents,
                    std::vector<std::string>(dependents)
                );
            }
            LOG_WARNING << "Forcing removal of " << name << " required by "
                        << util::join(", ", dependents);
        }

        console.report(message_kind::info, fmt::format("Removing {}", name));
        for (const auto& path : removal_order(record->files))
        {
            std::error_code ec;
            const auto status = fs::symlink_status(path, ec);
            if (fs::is_regular_file(status) || fs::is_symlink(status))
            {
                fs::remove(path, ec);
                if (ec)
                {
                    console.report(
                        message_kind::warning,
                        fmt::format("Failed to remove {}: {}", path.string(), ec.message())
                    );
                    continue;
                }
            }
            else if (fs::exists(status))
            {
                LOG_DEBUG << "Leaving " << path << " in place, it is not a file";
            }
            remove_empty_ancestors(path, install_root);
        }

        registry.remove(name);
        console.report(message_kind::success, fmt::format("Removed {}", name));
        return true;
    }
}
