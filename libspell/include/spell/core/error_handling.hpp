// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_ERROR_HANDLING_HPP
#define SPELL_CORE_ERROR_HANDLING_HPP

#include <any>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    /*********************
     * Spell exceptions *
     *********************/

    enum class spell_error_code
    {
        unknown,
        recipe_parse,
        recipe_not_found,
        dependency_cycle,
        hash_mismatch,
        fetch_failure,
        archive_failure,
        subprocess_failure,
        registry_failure,
        not_installed,
        blocked_by_dependents,
        internal_failure,
        user_interrupted,
        incorrect_usage
    };

    /**
     * Name of the error kind, as displayed to the user.
     */
    auto to_string(spell_error_code ec) -> std::string_view;

    class spell_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        spell_error(const std::string& msg, spell_error_code ec);
        spell_error(const char* msg, spell_error_code ec);
        spell_error(const std::string& msg, spell_error_code ec, std::any&& data);
        spell_error(const char* msg, spell_error_code ec, std::any&& data);

        spell_error_code error_code() const noexcept;
        const std::any& data() const noexcept;

        /**
         * Access the payload if it holds a value of type ``T``, nullptr otherwise.
         */
        template <typename T>
        const T* data_as() const noexcept;

    private:

        spell_error_code m_error_code;
        std::any m_data;
    };

    /**
     * Payload of a ``subprocess_failure`` error.
     */
    struct SubprocessFailure
    {
        std::string command;
        int exit_code = 1;
        /** Captured output of the command, empty when it was not captured. */
        fs::path log;
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = spell_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<spell_error> make_unexpected(const char* msg, spell_error_code ec);
    tl::unexpected<spell_error> make_unexpected(const std::string& msg, spell_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    /**
     * Return the value or throw the error held by the expected.
     */
    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    template <class E>
    void extract(const tl::expected<void, E>& exp);

    /*****************************
     * Implementation of helpers *
     *****************************/

    template <typename T>
    const T* spell_error::data_as() const noexcept
    {
        return std::any_cast<T>(&m_data);
    }

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        if (!exp)
        {
            throw exp.error();
        }
        return exp.value();
    }

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp)
    {
        if (!exp)
        {
            throw exp.error();
        }
        return exp.value();
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        if (!exp)
        {
            throw std::move(exp).error();
        }
        return std::move(exp).value();
    }

    template <class E>
    void extract(const tl::expected<void, E>& exp)
    {
        if (!exp)
        {
            throw exp.error();
        }
    }
}

#endif
