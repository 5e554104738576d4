// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_CONFIGURATION_HPP
#define SPELL_API_CONFIGURATION_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spell/core/context.hpp"
#include "spell/fs/filesystem.hpp"
#include "spell/util/environment.hpp"

namespace spell
{
    /**
     * One configuration parameter, with the value given by each source.
     *
     * The value is taken from the command line, then the environment, then the rc files,
     * and finally the default.
     */
    class Configurable
    {
    public:

        Configurable(
            std::string name,
            std::string description,
            std::optional<std::string> env_var = std::nullopt,
            bool rc_configurable = true
        );

        [[nodiscard]] auto name() const -> const std::string&;
        [[nodiscard]] auto description() const -> const std::string&;
        [[nodiscard]] auto env_var() const -> const std::optional<std::string>&;
        [[nodiscard]] auto rc_configurable() const -> bool;

        /** Storage bound to the command line parser. */
        auto get_cli_config() -> std::optional<std::string>&;
        void set_cli_value(std::string value);
        void set_env_value(std::string value);
        void set_rc_value(std::string value, const fs::path& rc_file);
        void set_default_value(std::string value);
        void clear_values();

        /** Whether any source, the default included, gave a value. */
        [[nodiscard]] auto configured() const -> bool;
        [[nodiscard]] auto value() const -> const std::string&;
        /** ``cli``, ``env``, the rc file path or ``default``. */
        [[nodiscard]] auto source() const -> std::string;

        [[nodiscard]] auto as_bool() const -> bool;
        [[nodiscard]] auto as_int() const -> int;
        [[nodiscard]] auto as_path() const -> fs::path;

    private:

        std::string m_name;
        std::string m_description;
        std::optional<std::string> m_env_var;
        bool m_rc_configurable;

        std::optional<std::string> m_cli_value;
        std::optional<std::string> m_env_value;
        std::optional<std::string> m_rc_value;
        fs::path m_rc_source;
        std::optional<std::string> m_default_value;
    };

    /**
     * Computes the @ref Context from defaults, rc files, environment and command line.
     */
    class Configuration
    {
    public:

        explicit Configuration(Context& ctx);

        Configuration(const Configuration&) = delete;
        Configuration& operator=(const Configuration&) = delete;

        /**
         * @throw spell_error with ``incorrect_usage`` code for unknown names.
         */
        auto at(const std::string& name) -> Configurable&;
        [[nodiscard]] auto at(const std::string& name) const -> const Configurable&;

        /** Names of the parameters, in declaration order. */
        [[nodiscard]] auto names() const -> const std::vector<std::string>&;

        /** Compute the context from the process environment. */
        void load();

        /** Compute the context from the given environment. */
        void load(const util::environment_map& env);

        [[nodiscard]] auto is_loaded() const -> bool;

        /** Rc files actually read by the last @ref load, lowest priority first. */
        [[nodiscard]] auto rc_files() const -> const std::vector<fs::path>&;

        [[nodiscard]] auto context() -> Context&;
        [[nodiscard]] auto context() const -> const Context&;

        /** A ``key: value  # source`` listing of the computed parameters. */
        [[nodiscard]] auto dump() const -> std::string;

    private:

        Context& m_context;
        std::map<std::string, Configurable> m_config;
        std::vector<std::string> m_names;
        std::vector<fs::path> m_rc_files;
        bool m_loaded = false;

        void insert(Configurable configurable);
        void read_rc_file(const fs::path& file);
        void apply_to_context();
    };

    /**
     * Create the spell home, recipes, work, packages and logs directories when missing.
     */
    void ensure_dirs(const Context& ctx);
}

#endif
