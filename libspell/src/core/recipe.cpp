// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "spell/core/output.hpp"
#include "spell/core/recipe.hpp"
#include "spell/core/util.hpp"
#include "spell/util/encoding.hpp"
#include "spell/util/environment.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    /**********************
     * Variable expansion *
     **********************/

    auto expand_vars(std::string_view str, const variable_map& env) -> std::string
    {
        auto out = std::string();
        out.reserve(str.size());

        std::size_t pos = 0;
        while (pos < str.size())
        {
            const auto start = str.find("${", pos);
            if (start == std::string_view::npos)
            {
                break;
            }
            const auto end = str.find('}', start + 2);
            if (end == std::string_view::npos)
            {
                break;
            }
            out += str.substr(pos, start - pos);

            const auto key = std::string(str.substr(start + 2, end - start - 2));
            if (auto it = env.find(key); !key.empty() && it != env.end())
            {
                out += it->second;
            }
            else
            {
                out += str.substr(start, end - start + 1);
            }
            pos = end + 1;
        }
        out += str.substr(std::min(pos, str.size()));
        return out;
    }

    /************
     * HashSpec *
     ************/

    auto algorithm_name(hash_algorithm algo) -> std::string_view
    {
        switch (algo)
        {
            case hash_algorithm::sha256:
                return "sha256";
            case hash_algorithm::sha512:
                return "sha512";
            case hash_algorithm::md5:
                return "md5";
        }
        return "unknown";
    }

    namespace
    {
        auto expected_hex_size(hash_algorithm algo) -> std::size_t
        {
            switch (algo)
            {
                case hash_algorithm::sha256:
                    return 64;
                case hash_algorithm::sha512:
                    return 128;
                case hash_algorithm::md5:
                    return 32;
            }
            return 0;
        }
    }

    auto HashSpec::parse(std::string_view str) -> expected_t<HashSpec>
    {
        const auto [algo_str, digest] = util::split_once(util::strip(str), ':');
        if (!digest.has_value())
        {
            return make_unexpected(
                fmt::format(R"(Hash "{}" must have the form "<algorithm>:<hexdigest>")", str),
                spell_error_code::recipe_parse
            );
        }

        auto out = HashSpec{};
        const auto algo = util::to_lower(algo_str);
        if (algo == "sha256")
        {
            out.algorithm = hash_algorithm::sha256;
        }
        else if (algo == "sha512")
        {
            out.algorithm = hash_algorithm::sha512;
        }
        else if (algo == "md5")
        {
            out.algorithm = hash_algorithm::md5;
        }
        else
        {
            return make_unexpected(
                fmt::format(R"(Unknown hash algorithm "{}")", algo_str),
                spell_error_code::recipe_parse
            );
        }

        out.digest = util::to_lower(digest.value());
        if (!util::is_hex_str(out.digest) || out.digest.size() != expected_hex_size(out.algorithm))
        {
            return make_unexpected(
                fmt::format(R"(Invalid {} digest "{}")", algo, digest.value()),
                spell_error_code::recipe_parse
            );
        }
        return out;
    }

    auto HashSpec::str() const -> std::string
    {
        return util::concat(algorithm_name(algorithm), ":", digest);
    }

    /***********
     * Sources *
     ***********/

    namespace
    {
        // Last segment of the URL path, without query nor fragment
        auto url_basename(std::string_view url) -> std::string
        {
            if (const auto pos = url.find_first_of("?#"); pos != std::string_view::npos)
            {
                url = url.substr(0, pos);
            }
            url = util::rstrip(url);
            while (util::ends_with(url, '/'))
            {
                url.remove_suffix(1);
            }
            if (const auto pos = url.rfind('/'); pos != std::string_view::npos)
            {
                url = url.substr(pos + 1);
            }
            return std::string(url);
        }
    }

    auto CurlSource::file_name() const -> std::string
    {
        if (filename.has_value() && !filename->empty())
        {
            return filename.value();
        }
        return url_basename(url);
    }

    auto GitSource::dir_name() const -> std::string
    {
        if (dir.has_value() && !dir->empty())
        {
            return dir.value();
        }
        return std::string(util::remove_suffix(url_basename(url), ".git"));
    }

    /**********
     * Recipe *
     **********/

    namespace
    {
        [[noreturn]] void throw_parse_error(const fs::path& origin, std::string_view msg)
        {
            throw spell_error(
                fmt::format("Invalid recipe '{}': {}", origin.string(), msg),
                spell_error_code::recipe_parse
            );
        }

        auto expanded_scalar(
            const YAML::Node& node,
            std::string_view key,
            const variable_map& env,
            const fs::path& origin
        ) -> std::string
        {
            if (!node.IsScalar())
            {
                throw_parse_error(origin, fmt::format(R"("{}" must be a string)", key));
            }
            return expand_vars(node.as<std::string>(), env);
        }

        auto optional_scalar(
            const YAML::Node& map,
            std::string_view key,
            const variable_map& env,
            const fs::path& origin
        ) -> std::optional<std::string>
        {
            if (const auto& node = map[std::string(key)]; node && !node.IsNull())
            {
                return expanded_scalar(node, key, env, origin);
            }
            return std::nullopt;
        }

        auto expanded_list(
            const YAML::Node& root,
            std::string_view key,
            const variable_map& env,
            const fs::path& origin
        ) -> std::vector<std::string>
        {
            auto out = std::vector<std::string>();
            const auto& node = root[std::string(key)];
            if (!node || node.IsNull())
            {
                return out;
            }
            if (!node.IsSequence())
            {
                throw_parse_error(origin, fmt::format(R"("{}" must be a list of strings)", key));
            }
            for (const auto& item : node)
            {
                out.push_back(expanded_scalar(item, key, env, origin));
            }
            return out;
        }

        auto read_source(const YAML::Node& node, const variable_map& env, const fs::path& origin)
            -> SourceDescriptor
        {
            if (!node.IsMap())
            {
                throw_parse_error(origin, "every source must be a mapping");
            }
            auto url = optional_scalar(node, "url", env, origin);
            if (!url.has_value() || url->empty())
            {
                throw_parse_error(origin, R"(every source must have an "url")");
            }

            const auto type = optional_scalar(node, "type", env, origin).value_or("curl");
            if (type == "curl")
            {
                auto source = CurlSource{ std::move(url).value(), std::nullopt, std::nullopt };
                if (auto hash = optional_scalar(node, "hash", env, origin))
                {
                    auto parsed = HashSpec::parse(hash.value());
                    if (!parsed)
                    {
                        throw_parse_error(origin, parsed.error().what());
                    }
                    source.hash = std::move(parsed).value();
                }
                source.filename = optional_scalar(node, "filename", env, origin);
                return source;
            }
            if (type == "git")
            {
                return GitSource{
                    std::move(url).value(),
                    optional_scalar(node, "ref", env, origin),
                    optional_scalar(node, "dir", env, origin),
                };
            }
            throw_parse_error(origin, fmt::format(R"(unknown source type "{}")", type));
        }

        auto resolve_against(const fs::path& origin, const fs::path& p) -> fs::path
        {
            if (p.is_absolute() || origin.empty())
            {
                return p;
            }
            return origin.parent_path() / p;
        }

        auto read_patch(const YAML::Node& node, const variable_map& env, const fs::path& origin)
            -> PatchDescriptor
        {
            if (node.IsScalar())
            {
                return PatchFile{ resolve_against(origin, expanded_scalar(node, "patches", env, origin)) };
            }
            if (node.IsMap())
            {
                if (auto url = optional_scalar(node, "url", env, origin))
                {
                    return PatchUrl{ std::move(url).value() };
                }
                if (auto dir = optional_scalar(node, "dir", env, origin))
                {
                    return PatchDir{ resolve_against(origin, dir.value()) };
                }
            }
            throw_parse_error(origin, R"(a patch must be a path, an "url" or a "dir")");
        }
    }

    auto Recipe::load(const fs::path& path) -> Recipe
    {
        return load(path, util::get_env_map());
    }

    auto Recipe::load(const fs::path& path, const variable_map& base_env) -> Recipe
    {
        std::string document;
        try
        {
            document = read_contents(path);
        }
        catch (const std::runtime_error& ex)
        {
            throw_parse_error(path, ex.what());
        }
        return parse(document, path, base_env);
    }

    auto Recipe::parse(std::string_view document, const fs::path& origin, const variable_map& base_env)
        -> Recipe
    {
        YAML::Node root;
        try
        {
            root = YAML::Load(std::string(document));
        }
        catch (const YAML::Exception& ex)
        {
            throw_parse_error(origin, ex.what());
        }
        if (!root.IsMap())
        {
            throw_parse_error(origin, "document must be a mapping");
        }

        auto out = Recipe();
        out.m_path = origin;

        try
        {
            const auto& name_node = root["name"];
            const auto& version_node = root["version"];
            if (!name_node || !name_node.IsScalar() || name_node.as<std::string>().empty())
            {
                throw_parse_error(origin, R"(missing required "name")");
            }
            if (!version_node || !version_node.IsScalar() || version_node.as<std::string>().empty())
            {
                throw_parse_error(origin, R"(missing required "version")");
            }

            // Later sources override earlier ones: process environment, built-ins, vars block
            auto env = base_env;
            env["name"] = name_node.as<std::string>();
            env["version"] = version_node.as<std::string>();
            const auto& vars_node = root["vars"];
            if (vars_node && !vars_node.IsNull())
            {
                if (!vars_node.IsMap())
                {
                    throw_parse_error(origin, R"("vars" must be a mapping)");
                }
                for (const auto& kv : vars_node)
                {
                    env[kv.first.as<std::string>()] = kv.second.as<std::string>();
                }
            }

            // Identity comes from the document, "name" and "version" vars only feed expansion
            out.m_name = expand_vars(name_node.as<std::string>(), env);
            out.m_version = expand_vars(version_node.as<std::string>(), env);
            out.m_variables["name"] = out.m_name;
            out.m_variables["version"] = out.m_version;
            if (vars_node && vars_node.IsMap())
            {
                for (const auto& kv : vars_node)
                {
                    out.m_variables[kv.first.as<std::string>()] = expand_vars(
                        kv.second.as<std::string>(),
                        env
                    );
                }
            }

            if (const auto& source_node = root["source"]; source_node && !source_node.IsNull())
            {
                if (!source_node.IsSequence())
                {
                    throw_parse_error(origin, R"("source" must be a list)");
                }
                for (const auto& node : source_node)
                {
                    out.m_sources.push_back(read_source(node, env, origin));
                }
            }

            if (const auto& patches_node = root["patches"]; patches_node && !patches_node.IsNull())
            {
                if (!patches_node.IsSequence())
                {
                    throw_parse_error(origin, R"("patches" must be a list)");
                }
                for (const auto& node : patches_node)
                {
                    out.m_patches.push_back(read_patch(node, env, origin));
                }
            }

            out.m_build = expanded_list(root, "build", env, origin);
            out.m_install = expanded_list(root, "install", env, origin);
            out.m_runtime_deps = expanded_list(root, "runtime_deps", env, origin);
            out.m_build_deps = expanded_list(root, "build_deps", env, origin);
            out.m_provides = expanded_list(root, "provides", env, origin);
        }
        catch (const YAML::Exception& ex)
        {
            throw_parse_error(origin, ex.what());
        }

        return out;
    }

    auto Recipe::name() const -> const std::string&
    {
        return m_name;
    }

    auto Recipe::version() const -> const std::string&
    {
        return m_version;
    }

    auto Recipe::full_name() const -> std::string
    {
        return util::concat(m_name, "-", m_version);
    }

    auto Recipe::variables() const -> const variable_map&
    {
        return m_variables;
    }

    auto Recipe::sources() const -> const std::vector<SourceDescriptor>&
    {
        return m_sources;
    }

    auto Recipe::patches() const -> const std::vector<PatchDescriptor>&
    {
        return m_patches;
    }

    auto Recipe::build_steps() const -> const command_list&
    {
        return m_build;
    }

    auto Recipe::install_steps() const -> const command_list&
    {
        return m_install;
    }

    auto Recipe::runtime_deps() const -> const name_list&
    {
        return m_runtime_deps;
    }

    auto Recipe::build_deps() const -> const name_list&
    {
        return m_build_deps;
    }

    auto Recipe::provides() const -> const name_list&
    {
        return m_provides;
    }

    auto Recipe::path() const -> const fs::path&
    {
        return m_path;
    }

    auto Recipe::all_deps() const -> name_list
    {
        auto out = m_runtime_deps;
        for (const auto& dep : m_build_deps)
        {
            if (std::find(out.cbegin(), out.cend(), dep) == out.cend())
            {
                out.push_back(dep);
            }
        }
        return out;
    }

    /********************
     * Recipe discovery *
     ********************/

    auto load_all_recipes(const fs::path& recipes_dir) -> recipe_map
    {
        return load_all_recipes(recipes_dir, util::get_env_map());
    }

    auto load_all_recipes(const fs::path& recipes_dir, const variable_map& base_env) -> recipe_map
    {
        auto recipes = recipe_map();
        std::error_code ec;
        if (!fs::is_directory(recipes_dir, ec))
        {
            LOG_WARNING << "Recipes directory not found: " << recipes_dir;
            return recipes;
        }

        auto files = std::vector<fs::path>();
        for (const auto& entry : fs::recursive_directory_iterator(recipes_dir))
        {
            const auto ext = entry.path().extension();
            if (entry.is_regular_file() && (ext == ".yml" || ext == ".yaml"))
            {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files)
        {
            auto recipe = Recipe::load(file, base_env);
            LOG_DEBUG << "Loaded recipe " << recipe.full_name() << " from " << file;
            if (auto it = recipes.find(recipe.name()); it != recipes.end())
            {
                LOG_WARNING << "Recipe '" << recipe.name() << "' from " << file
                            << " replaces the one from " << it->second.path();
                it->second = std::move(recipe);
            }
            else
            {
                auto name = recipe.name();
                recipes.emplace(std::move(name), std::move(recipe));
            }
        }
        return recipes;
    }
}
