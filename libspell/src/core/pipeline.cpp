// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <optional>
#include <variant>

#include <fmt/format.h>

#include "spell/core/capabilities.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/package_handling.hpp"
#include "spell/core/pipeline.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/subprocess.hpp"
#include "spell/core/thread_utils.hpp"
#include "spell/core/util.hpp"
#include "spell/util/cryptography.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    namespace
    {
        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        auto url_file_name(std::string_view url, std::string_view fallback) -> std::string
        {
            const auto path = std::get<0>(util::split_once(url, '?'));
            const auto pos = path.rfind('/');
            const auto name = pos == std::string_view::npos ? path : path.substr(pos + 1);
            return name.empty() ? std::string(fallback) : std::string(name);
        }
    }

    /*****************
     *   Workspace   *
     *****************/

    auto Workspace::of(const Context& context, const Recipe& recipe) -> Workspace
    {
        const auto root = context.paths.work_dir / recipe.full_name();
        return Workspace{ .root = root,
                          .src = root / "src",
                          .build = root / "build",
                          .destdir = root / "destdir",
                          .logs = context.paths.logs_dir / recipe.name() };
    }

    auto select_build_root(const fs::path& src_dir) -> fs::path
    {
        std::vector<fs::path> subdirs;
        for (const auto& entry : fs::directory_iterator(src_dir))
        {
            if (entry.is_directory() && !util::starts_with(entry.path().filename().string(), '.'))
            {
                subdirs.push_back(entry.path());
            }
        }
        return subdirs.size() == 1 ? subdirs.front() : src_dir;
    }

    auto file_digest(const fs::path& file, hash_algorithm algo) -> std::string
    {
        auto infile = open_ifstream(file);
        if (!infile)
        {
            throw spell_error(
                fmt::format("Could not open '{}' to compute its digest", file.string()),
                spell_error_code::fetch_failure
            );
        }
        switch (algo)
        {
            case hash_algorithm::sha256:
                return util::Sha256Hasher().file_hex_str(infile);
            case hash_algorithm::sha512:
                return util::Sha512Hasher().file_hex_str(infile);
            case hash_algorithm::md5:
                return util::Md5Hasher().file_hex_str(infile);
        }
        throw spell_error("Unknown hash algorithm", spell_error_code::internal_failure);
    }

    void verify_hash(const fs::path& file, const HashSpec& expected)
    {
        const auto got = file_digest(file, expected.algorithm);
        if (got != expected.digest)
        {
            throw spell_error(
                fmt::format(
                    "Hash mismatch for {}: expected {}, got {}:{}",
                    file.filename().string(),
                    expected.str(),
                    algorithm_name(expected.algorithm),
                    got
                ),
                spell_error_code::hash_mismatch
            );
        }
        LOG_DEBUG << "Verified " << expected.str() << " for " << file;
    }

    auto artifact_path(const Context& context, const Recipe& recipe) -> fs::path
    {
        return context.paths.pkgs_dir / (recipe.full_name() + ".tar.zst");
    }

    auto build_environment(
        const Context& context,
        const Recipe& recipe,
        const Workspace& ws,
        const fs::path& build_root
    ) -> std::map<std::string, std::string>
    {
        return {
            { "DESTDIR", ws.destdir.string() },
            { "PREFIX", context.build_params.prefix },
            { "PKG_CONFIG_PATH", context.build_params.pkg_config_path },
            { "SPELL_NAME", recipe.name() },
            { "SPELL_VERSION", recipe.version() },
            { "SPELL_SRCDIR", build_root.string() },
        };
    }

    /****************
     *   Pipeline   *
     ****************/

    Pipeline::Pipeline(const Context& context, PackageRegistry& registry, BuildCapabilities& capabilities)
        : m_context(context)
        , m_registry(registry)
        , m_capabilities(capabilities)
    {
    }

    void Pipeline::execute(const Recipe& recipe, bool install)
    {
        auto& console = Console::instance();
        const auto ws = Workspace::of(m_context, recipe);

        console.report(message_kind::info, fmt::format("Preparing build of {}", recipe.full_name()));
        if (fs::exists(ws.root))
        {
            LOG_INFO << "Cleaning previous workspace " << ws.root;
        }
        reset_directory(ws.root);
        fs::create_directories(ws.src);
        fs::create_directories(ws.logs);

        fetch_sources(recipe, ws);
        interruption_point();

        const auto build_root = select_build_root(ws.src);
        LOG_INFO << "Build root of " << recipe.full_name() << " is " << build_root;

        apply_patches(recipe, ws, build_root);
        interruption_point();

        fs::create_directories(ws.build);
        const auto env = build_environment(m_context, recipe, ws, build_root);
        run_steps(recipe.build_steps(), "build", ws, build_root, env, false);
        console.report(message_kind::success, fmt::format("Built {}", recipe.full_name()));
        if (!install)
        {
            return;
        }

        fs::create_directories(ws.destdir);
        run_steps(recipe.install_steps(), "install", ws, build_root, env, true);

        const auto artifact = artifact_path(m_context, recipe);
        console.report(message_kind::info, fmt::format("Packaging {}", artifact.filename().string()));
        create_archive(ws.destdir, artifact, m_context.build_params.compression_level);
        interruption_point();

        console.report(
            message_kind::info,
            fmt::format("Installing {} into {}", recipe.full_name(), m_context.build_params.install_root.string())
        );
        auto files = commit_install(ws);

        m_registry.put(PackageRecord::from_recipe(recipe, std::move(files)));
        console.report(message_kind::success, fmt::format("Installed {}", recipe.full_name()));
    }

    void Pipeline::fetch_sources(const Recipe& recipe, const Workspace& ws)
    {
        for (const auto& source : recipe.sources())
        {
            interruption_point();
            std::visit(
                overloaded{
                    [&](const CurlSource& src)
                    {
                        const auto file_name = src.file_name();
                        const auto dest = ws.src / file_name;
                        m_capabilities.fetch_url(src.url, dest);
                        if (src.hash.has_value())
                        {
                            verify_hash(dest, src.hash.value());
                        }
                        if (is_archive_filename(file_name))
                        {
                            m_capabilities.extract(dest, ws.src);
                        }
                    },
                    [&](const GitSource& src)
                    { m_capabilities.clone(src.url, src.ref, ws.src / src.dir_name()); },
                },
                source
            );
        }
    }

    void Pipeline::apply_patches(const Recipe& recipe, const Workspace& ws, const fs::path& build_root)
    {
        // Scratch space for patches fetched by URL
        std::optional<TemporaryDirectory> scratch;
        std::size_t index = 0;

        auto apply = [&](const fs::path& patch)
        {
            const auto log = ws.logs / fmt::format("patch-{:02d}.log", index++);
            m_capabilities.apply_patch(patch, build_root, log);
        };

        for (const auto& descriptor : recipe.patches())
        {
            interruption_point();
            std::visit(
                overloaded{
                    [&](const PatchUrl& p)
                    {
                        if (!scratch.has_value())
                        {
                            scratch.emplace();
                        }
                        const auto dest = scratch->path()
                                          / fmt::format(
                                              "{:02d}-{}",
                                              index,
                                              url_file_name(p.url, "remote.patch")
                                          );
                        m_capabilities.fetch_url(p.url, dest);
                        apply(dest);
                    },
                    [&](const PatchDir& p)
                    {
                        if (!fs::is_directory(p.dir))
                        {
                            LOG_WARNING << "Patch directory " << p.dir << " does not exist";
                            return;
                        }
                        std::vector<fs::path> patches;
                        for (const auto& entry : fs::directory_iterator(p.dir))
                        {
                            if (entry.is_regular_file() && entry.path().extension() == ".patch")
                            {
                                patches.push_back(entry.path());
                            }
                        }
                        std::sort(patches.begin(), patches.end());
                        for (const auto& patch : patches)
                        {
                            apply(patch);
                        }
                    },
                    [&](const PatchFile& p) { apply(p.path); },
                },
                descriptor
            );
        }
    }

    void Pipeline::run_steps(
        const Recipe::command_list& steps,
        std::string_view kind,
        const Workspace& ws,
        const fs::path& build_root,
        const std::map<std::string, std::string>& env,
        bool privileged
    )
    {
        for (std::size_t i = 0; i < steps.size(); ++i)
        {
            CommandOptions options;
            options.working_directory = build_root;
            options.env_extra = env;
            options.log_path = ws.logs / fmt::format("{}-{:02d}.log", kind, i);
            options.description = fmt::format("{} [{}/{}] {}", kind, i + 1, steps.size(), steps[i]);
            LOG_INFO << "Running " << kind << " step " << i << ": " << steps[i];
            run_shell(m_context, steps[i], options, privileged);
        }
    }

    auto Pipeline::commit_install(const Workspace& ws) -> std::vector<std::string>
    {
        const auto& root = m_context.build_params.install_root;

        std::vector<fs::path> entries;
        for (const auto& entry : fs::recursive_directory_iterator(ws.destdir))
        {
            entries.push_back(entry.path());
        }
        std::sort(entries.begin(), entries.end());

        std::vector<std::string> files;
        for (const auto& staged : entries)
        {
            interruption_point();
            const auto target = fs::absolute(root / staged.lexically_relative(ws.destdir))
                                    .lexically_normal();
            const auto status = fs::symlink_status(staged);
            if (fs::is_directory(status))
            {
                fs::create_directories(target);
                continue;
            }
            fs::create_directories(target.parent_path());
            m_capabilities.install_entry(staged, target);
            LOG_TRACE << "Installed " << target;
            files.push_back(target.string());
        }
        return files;
    }
}
