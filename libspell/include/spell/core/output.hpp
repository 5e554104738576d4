// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_OUTPUT_HPP
#define SPELL_CORE_OUTPUT_HPP

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "spell/core/context.hpp"

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   spell::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(spell::log_level::trace)
#define LOG_DEBUG       LOG(spell::log_level::debug)
#define LOG_INFO        LOG(spell::log_level::info)
#define LOG_WARNING     LOG(spell::log_level::warn)
#define LOG_ERROR       LOG(spell::log_level::err)
#define LOG_CRITICAL    LOG(spell::log_level::critical)
// clang-format on

namespace spell
{
    /**
     * Kind of user facing message, each with its own marker.
     */
    enum class message_kind
    {
        info,
        success,
        warning,
        failure
    };

    class ConsoleStream : public std::stringstream
    {
    public:

        ConsoleStream() = default;
        ~ConsoleStream();
    };

    class ConsoleData;

    /**
     * User facing output on stdout, as opposed to the logs on stderr.
     *
     * A single instance is alive at a time, created by the entry point from its context.
     */
    class Console
    {
    public:

        Console(const Console&) = delete;
        Console& operator=(const Console&) = delete;

        Console(Console&&) = delete;
        Console& operator=(Console&&) = delete;

        static Console& instance();
        static bool is_available();
        static ConsoleStream stream();

        void print(std::string_view str, bool force_print = false);

        /**
         * Print a message prefixed with the marker of its kind: ``[*]``, ``[✓]``, ``[!]``
         * or ``[x]``.
         */
        void report(message_kind kind, std::string_view msg);

        /** Format a package name or other user input with the palette. */
        std::string user(std::string_view str) const;

        /** Write (nested) key/values into the JSON document printed on destruction. */
        void json_write(const nlohmann::json& j);

        void cancel_json_print();

        const Context& context() const;

        Console(const Context& context);
        ~Console();

    private:

        void json_print();

        std::unique_ptr<ConsoleData> p_data;

        static void set_singleton(Console& console);
        static void clear_singleton();
    };

    class MessageLogger
    {
    public:

        MessageLogger(log_level level);
        ~MessageLogger();

        std::stringstream& stream();

    private:

        log_level m_level;
        std::stringstream m_stream;

        static void emit(const std::string& msg, const log_level& level);
    };

    /**
     * Prefix every line of the string, the first one with ``first``.
     */
    std::string prepend(std::string_view p, std::string_view first, std::string_view rest);
}

#endif
