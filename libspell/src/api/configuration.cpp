// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <sstream>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "spell/api/configuration.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    namespace
    {
        auto env_value(const util::environment_map& env, const std::string& key)
            -> std::optional<std::string>
        {
            if (auto it = env.find(key); it != env.end() && !it->second.empty())
            {
                return it->second;
            }
            return std::nullopt;
        }

        auto home_dir(const util::environment_map& env) -> fs::path
        {
            if (auto home = env_value(env, "HOME"))
            {
                return home.value();
            }
            return util::user_home_dir();
        }

        auto data_dir(const util::environment_map& env) -> fs::path
        {
            if (auto xdg = env_value(env, "XDG_DATA_HOME"))
            {
                return xdg.value();
            }
            return home_dir(env) / ".local" / "share";
        }

        auto config_dir(const util::environment_map& env) -> fs::path
        {
            if (auto xdg = env_value(env, "XDG_CONFIG_HOME"))
            {
                return xdg.value();
            }
            return home_dir(env) / ".config";
        }

        auto expand_home(std::string_view path) -> fs::path
        {
            if (path == "~")
            {
                return util::user_home_dir();
            }
            if (util::starts_with(path, "~/"))
            {
                return fs::path(util::user_home_dir()) / path.substr(2);
            }
            return path;
        }
    }

    /********************
     *   Configurable   *
     ********************/

    Configurable::Configurable(
        std::string name,
        std::string description,
        std::optional<std::string> env_var,
        bool rc_configurable
    )
        : m_name(std::move(name))
        , m_description(std::move(description))
        , m_env_var(std::move(env_var))
        , m_rc_configurable(rc_configurable)
    {
    }

    auto Configurable::name() const -> const std::string&
    {
        return m_name;
    }

    auto Configurable::description() const -> const std::string&
    {
        return m_description;
    }

    auto Configurable::env_var() const -> const std::optional<std::string>&
    {
        return m_env_var;
    }

    auto Configurable::rc_configurable() const -> bool
    {
        return m_rc_configurable;
    }

    auto Configurable::get_cli_config() -> std::optional<std::string>&
    {
        return m_cli_value;
    }

    void Configurable::set_cli_value(std::string value)
    {
        m_cli_value = std::move(value);
    }

    void Configurable::set_env_value(std::string value)
    {
        m_env_value = std::move(value);
    }

    void Configurable::set_rc_value(std::string value, const fs::path& rc_file)
    {
        m_rc_value = std::move(value);
        m_rc_source = rc_file;
    }

    void Configurable::set_default_value(std::string value)
    {
        m_default_value = std::move(value);
    }

    void Configurable::clear_values()
    {
        m_env_value.reset();
        m_rc_value.reset();
        m_rc_source.clear();
        m_default_value.reset();
    }

    auto Configurable::configured() const -> bool
    {
        return m_cli_value || m_env_value || m_rc_value || m_default_value;
    }

    auto Configurable::value() const -> const std::string&
    {
        for (const auto* val : { &m_cli_value, &m_env_value, &m_rc_value, &m_default_value })
        {
            if (val->has_value())
            {
                return val->value();
            }
        }
        throw spell_error(
            fmt::format("Configurable '{}' has no value", m_name),
            spell_error_code::internal_failure
        );
    }

    auto Configurable::source() const -> std::string
    {
        if (m_cli_value)
        {
            return "cli";
        }
        if (m_env_value)
        {
            return fmt::format("env {}", m_env_var.value_or(""));
        }
        if (m_rc_value)
        {
            return m_rc_source.string();
        }
        return "default";
    }

    auto Configurable::as_bool() const -> bool
    {
        const auto val = util::to_lower(util::strip(value()));
        if (val == "true" || val == "yes" || val == "on" || val == "1")
        {
            return true;
        }
        if (val == "false" || val == "no" || val == "off" || val == "0")
        {
            return false;
        }
        throw spell_error(
            fmt::format("Invalid boolean '{}' for '{}' (from {})", value(), m_name, source()),
            spell_error_code::incorrect_usage
        );
    }

    auto Configurable::as_int() const -> int
    {
        const auto& val = value();
        std::size_t pos = 0;
        int out = 0;
        try
        {
            out = std::stoi(val, &pos);
        }
        catch (const std::logic_error&)
        {
            pos = 0;
        }
        if (pos == 0 || pos != val.size())
        {
            throw spell_error(
                fmt::format("Invalid integer '{}' for '{}' (from {})", val, m_name, source()),
                spell_error_code::incorrect_usage
            );
        }
        return out;
    }

    auto Configurable::as_path() const -> fs::path
    {
        return expand_home(value());
    }

    /*********************
     *   Configuration   *
     *********************/

    Configuration::Configuration(Context& ctx)
        : m_context(ctx)
    {
        insert({ "home", "Base directory of spell data", "SPELL_HOME", false });
        insert({ "recipes_dir", "Directory holding the recipe files", "SPELL_RECIPES" });
        insert({ "work_dir", "Directory of the build workspaces", "SPELL_WORK" });
        insert({ "pkgs_dir", "Directory receiving the package artifacts", "SPELL_PKGS" });
        insert({ "logs_dir", "Directory of the build logs", "SPELL_LOGS" });
        insert({ "db_path", "Path of the installed packages database", "SPELL_DB" });
        insert({ "install_root", "Root directory packages are installed into", "SPELL_ROOT" });
        insert({ "prefix", "Value of PREFIX in build steps" });
        insert({ "pkg_config_path", "Value of PKG_CONFIG_PATH in build steps" });
        insert({ "use_fakeroot", "Run install steps under fakeroot when available" });
        insert({ "compression_level", "zstd compression level of package artifacts" });
        insert({ "verbosity", "Logging verbosity" });
        insert({ "quiet", "Only print errors", std::nullopt, false });
        insert({ "json", "Print results as JSON", std::nullopt, false });
        insert({ "no_color", "Disable colors and progress indicators", "NO_COLOR" });
    }

    void Configuration::insert(Configurable configurable)
    {
        auto name = configurable.name();
        m_names.push_back(name);
        m_config.emplace(std::move(name), std::move(configurable));
    }

    auto Configuration::at(const std::string& name) -> Configurable&
    {
        if (auto it = m_config.find(name); it != m_config.end())
        {
            return it->second;
        }
        throw spell_error(
            fmt::format("Unknown configurable '{}'", name),
            spell_error_code::incorrect_usage
        );
    }

    auto Configuration::at(const std::string& name) const -> const Configurable&
    {
        if (auto it = m_config.find(name); it != m_config.end())
        {
            return it->second;
        }
        throw spell_error(
            fmt::format("Unknown configurable '{}'", name),
            spell_error_code::incorrect_usage
        );
    }

    auto Configuration::names() const -> const std::vector<std::string>&
    {
        return m_names;
    }

    auto Configuration::is_loaded() const -> bool
    {
        return m_loaded;
    }

    auto Configuration::rc_files() const -> const std::vector<fs::path>&
    {
        return m_rc_files;
    }

    auto Configuration::context() -> Context&
    {
        return m_context;
    }

    auto Configuration::context() const -> const Context&
    {
        return m_context;
    }

    void Configuration::load()
    {
        load(util::get_env_map());
    }

    void Configuration::load(const util::environment_map& env)
    {
        m_rc_files.clear();
        for (auto& [name, configurable] : m_config)
        {
            configurable.clear_values();
            if (const auto& var = configurable.env_var(); var.has_value())
            {
                if (auto val = env_value(env, var.value()))
                {
                    // NO_COLOR is set to any value to take effect
                    configurable.set_env_value(name == "no_color" ? "true" : val.value());
                }
            }
        }

        auto& home = at("home");
        home.set_default_value((data_dir(env) / "spell").string());
        const auto home_path = home.as_path();

        for (const auto& rc_file : { config_dir(env) / "spell" / "spellrc", home_path / "spellrc" })
        {
            if (fs::is_regular_file(rc_file))
            {
                read_rc_file(rc_file);
            }
        }

        auto defaults = Context::PathParams();
        defaults.set_defaults_from_home(home_path);
        const auto build_defaults = Context::BuildParams();

        at("recipes_dir").set_default_value(defaults.recipes_dir.string());
        at("work_dir").set_default_value(defaults.work_dir.string());
        at("pkgs_dir").set_default_value(defaults.pkgs_dir.string());
        at("logs_dir").set_default_value(defaults.logs_dir.string());
        at("db_path").set_default_value(defaults.db_path.string());
        at("install_root").set_default_value(build_defaults.install_root.string());
        at("prefix").set_default_value(build_defaults.prefix);
        at("pkg_config_path").set_default_value(build_defaults.pkg_config_path);
        at("use_fakeroot").set_default_value(build_defaults.use_fakeroot ? "true" : "false");
        at("compression_level").set_default_value(std::to_string(build_defaults.compression_level));
        at("verbosity").set_default_value("0");
        at("quiet").set_default_value("false");
        at("json").set_default_value("false");
        at("no_color").set_default_value("false");

        apply_to_context();
        m_loaded = true;

        LOG_DEBUG << "Configuration loaded:\n" << dump();
    }

    void Configuration::read_rc_file(const fs::path& file)
    {
        YAML::Node config;
        try
        {
            config = YAML::LoadFile(file.string());
        }
        catch (const YAML::Exception& ex)
        {
            LOG_ERROR << fmt::format("Error in file {}, skipping: {}", file.string(), ex.what());
            return;
        }
        m_rc_files.push_back(file);

        if (config.IsNull())
        {
            return;
        }
        if (!config.IsMap())
        {
            LOG_ERROR << fmt::format("Configuration file {} is not a mapping, skipping", file.string());
            return;
        }

        for (const auto& entry : config)
        {
            const auto key = entry.first.as<std::string>();
            auto it = m_config.find(key);
            if (it == m_config.end() || !it->second.rc_configurable())
            {
                LOG_WARNING << fmt::format("Unknown key '{}' in {}, ignored", key, file.string());
                continue;
            }
            if (!entry.second.IsScalar())
            {
                LOG_WARNING << fmt::format("Key '{}' in {} is not a scalar, ignored", key, file.string());
                continue;
            }
            it->second.set_rc_value(entry.second.as<std::string>(), file);
        }
    }

    void Configuration::apply_to_context()
    {
        auto& paths = m_context.paths;
        paths.home = at("home").as_path();
        paths.recipes_dir = at("recipes_dir").as_path();
        paths.work_dir = at("work_dir").as_path();
        paths.pkgs_dir = at("pkgs_dir").as_path();
        paths.logs_dir = at("logs_dir").as_path();
        paths.db_path = at("db_path").as_path();

        auto& build = m_context.build_params;
        build.install_root = at("install_root").as_path();
        build.prefix = at("prefix").value();
        build.pkg_config_path = at("pkg_config_path").value();
        build.use_fakeroot = at("use_fakeroot").as_bool();
        build.compression_level = at("compression_level").as_int();

        auto& output = m_context.output_params;
        output.json = at("json").as_bool();
        output.quiet = at("quiet").as_bool();
        m_context.set_verbosity(output.quiet ? -1 : at("verbosity").as_int());

        m_context.set_no_color(at("no_color").as_bool());
    }

    auto Configuration::dump() const -> std::string
    {
        std::stringstream out;
        for (const auto& name : m_names)
        {
            const auto& configurable = at(name);
            if (configurable.configured())
            {
                out << fmt::format("  {}: {}  # {}\n", name, configurable.value(), configurable.source());
            }
        }
        return out.str();
    }

    void ensure_dirs(const Context& ctx)
    {
        const auto& paths = ctx.paths;
        for (const auto& dir : { paths.home, paths.recipes_dir, paths.work_dir, paths.pkgs_dir, paths.logs_dir })
        {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec)
            {
                throw spell_error(
                    fmt::format("Could not create directory '{}': {}", dir.string(), ec.message()),
                    spell_error_code::internal_failure
                );
            }
        }
    }
}
