// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <fmt/format.h>
#include <pwd.h>
#include <unistd.h>

#include "spell/util/environment.hpp"
#include "spell/util/string.hpp"

extern "C"
{
    extern char** environ;  // Unix defined
}

namespace spell::util
{
    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        if (const char* val = std::getenv(key.c_str()))
        {
            return val;
        }
        return {};
    }

    auto get_env_non_empty(const std::string& key) -> std::optional<std::string>
    {
        if (auto val = get_env(key); val.has_value() && !val->empty())
        {
            return val;
        }
        return {};
    }

    void set_env(const std::string& key, const std::string& value)
    {
        const auto result = ::setenv(key.c_str(), value.c_str(), 1);
        if (result != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}" to "{}")", key, value)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        const auto res = ::unsetenv(key.c_str());
        if (res != 0)
        {
            throw std::runtime_error(fmt::format(R"(Could not unset environment variable "{}")", key));
        }
    }

    auto get_env_map() -> environment_map
    {
        auto env = environment_map();
        for (std::size_t i = 0; environ[i]; ++i)
        {
            const auto expr = std::string_view(environ[i]);
            const auto pos = expr.find('=');
            env.emplace(
                expr.substr(0, pos),
                (pos != expr.npos) ? std::string(expr.substr(pos + 1)) : ""
            );
        }
        return env;
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = get_env_non_empty("HOME"))
        {
            return maybe_home.value();
        }
        if (const auto* user = ::getpwuid(::getuid()))
        {
            return user->pw_dir;
        }
        throw std::runtime_error(
            "HOME not set and user home directory not found in the password database"
        );
    }

    auto user_config_dir() -> std::string
    {
        if (auto maybe_dir = get_env_non_empty("XDG_CONFIG_HOME"))
        {
            return maybe_dir.value();
        }
        return (fs::path(user_home_dir()) / ".config").string();
    }

    auto user_data_dir() -> std::string
    {
        if (auto maybe_dir = get_env_non_empty("XDG_DATA_HOME"))
        {
            return maybe_dir.value();
        }
        return (fs::path(user_home_dir()) / ".local" / "share").string();
    }

    namespace
    {
        auto which_in_one(std::string_view exe, const fs::path& dir) -> fs::path
        {
            std::error_code _ec;  // ignore
            if (dir.empty() || !fs::is_directory(dir, _ec))
            {
                return "";
            }
            auto candidate = dir / exe;
            if (fs::is_regular_file(candidate, _ec) && ::access(candidate.c_str(), X_OK) == 0)
            {
                return candidate;
            }
            return "";
        }
    }

    auto which_in(std::string_view exe, std::string_view paths) -> fs::path
    {
        auto elem = std::string_view();
        auto rest = std::optional<std::string_view>(paths);
        while (rest.has_value())
        {
            std::tie(elem, rest) = split_once(rest.value(), ':');
            if (auto p = which_in_one(exe, elem); !p.empty())
            {
                return p;
            }
        }
        return "";
    }

    auto which(std::string_view exe) -> fs::path
    {
        if (auto paths = get_env("PATH"))
        {
            if (auto p = which_in(exe, paths.value()); !p.empty())
            {
                return p;
            }
        }
        const auto n = ::confstr(_CS_PATH, nullptr, static_cast<std::size_t>(0));
        auto pathbuf = std::vector<char>(n, '\0');
        ::confstr(_CS_PATH, pathbuf.data(), n);
        return which_in(exe, std::string_view(pathbuf.data()));
    }
}
