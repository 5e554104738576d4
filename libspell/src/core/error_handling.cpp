// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "spell/core/error_handling.hpp"

namespace spell
{
    auto to_string(spell_error_code ec) -> std::string_view
    {
        switch (ec)
        {
            case spell_error_code::recipe_parse:
                return "recipe parse error";
            case spell_error_code::recipe_not_found:
                return "recipe not found";
            case spell_error_code::dependency_cycle:
                return "dependency cycle";
            case spell_error_code::hash_mismatch:
                return "hash mismatch";
            case spell_error_code::fetch_failure:
                return "fetch failure";
            case spell_error_code::archive_failure:
                return "archive failure";
            case spell_error_code::subprocess_failure:
                return "command failed";
            case spell_error_code::registry_failure:
                return "registry failure";
            case spell_error_code::not_installed:
                return "not installed";
            case spell_error_code::blocked_by_dependents:
                return "blocked by dependents";
            case spell_error_code::internal_failure:
                return "internal failure";
            case spell_error_code::user_interrupted:
                return "interrupted";
            case spell_error_code::incorrect_usage:
                return "incorrect usage";
            case spell_error_code::unknown:
                break;
        }
        return "unknown error";
    }

    spell_error::spell_error(const std::string& msg, spell_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    spell_error::spell_error(const char* msg, spell_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    spell_error::spell_error(const std::string& msg, spell_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
    }

    spell_error::spell_error(const char* msg, spell_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
    }

    spell_error_code spell_error::error_code() const noexcept
    {
        return m_error_code;
    }

    const std::any& spell_error::data() const noexcept
    {
        return m_data;
    }

    tl::unexpected<spell_error> make_unexpected(const char* msg, spell_error_code ec)
    {
        return tl::make_unexpected(spell_error(msg, ec));
    }

    tl::unexpected<spell_error> make_unexpected(const std::string& msg, spell_error_code ec)
    {
        return tl::make_unexpected(spell_error(msg, ec));
    }
}
