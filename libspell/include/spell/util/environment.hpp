// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_UTIL_ENVIRONMENT_HPP
#define SPELL_UTIL_ENVIRONMENT_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "spell/fs/filesystem.hpp"

namespace spell::util
{
    /**
     * Return the value of the environment variable, or nothing if it is not set.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    /**
     * Like @ref get_env but an empty value is treated as unset.
     */
    [[nodiscard]] auto get_env_non_empty(const std::string& key) -> std::optional<std::string>;

    void set_env(const std::string& key, const std::string& value);

    void unset_env(const std::string& key);

    using environment_map = std::map<std::string, std::string>;

    /**
     * Return a copy of the process environment.
     */
    [[nodiscard]] auto get_env_map() -> environment_map;

    /**
     * Return the current user home directory.
     *
     * Uses ``HOME`` and falls back to the password database.
     */
    [[nodiscard]] auto user_home_dir() -> std::string;

    /** ``XDG_CONFIG_HOME`` or ``~/.config``. */
    [[nodiscard]] auto user_config_dir() -> std::string;

    /** ``XDG_DATA_HOME`` or ``~/.local/share``. */
    [[nodiscard]] auto user_data_dir() -> std::string;

    /**
     * Find an executable on the ``PATH``, returning an empty path if not found.
     */
    [[nodiscard]] auto which(std::string_view exe) -> fs::path;

    [[nodiscard]] auto which_in(std::string_view exe, std::string_view paths) -> fs::path;
}
#endif
