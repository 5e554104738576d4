// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <iostream>
#include <mutex>
#include <stdexcept>

#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "spell/core/output.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    std::string prepend(std::string_view p, std::string_view first, std::string_view rest)
    {
        auto out = std::string(first);
        for (const char c : p)
        {
            out += c;
            if (c == '\n')
            {
                out += rest;
            }
        }
        return out;
    }

    ConsoleStream::~ConsoleStream()
    {
        Console::instance().print(str());
    }

    /***********
     * Console *
     ***********/

    class ConsoleData
    {
    public:

        ConsoleData(const Context& ctx)
            : m_context(ctx)
        {
        }

        const Context& m_context;

        std::mutex m_mutex;

        nlohmann::json json_log;
        bool is_json_print_cancelled = false;
    };

    namespace
    {
        Console* main_console = nullptr;
    }

    void Console::set_singleton(Console& console)
    {
        if (main_console != nullptr)
        {
            throw std::logic_error("Console singleton already instantiated");
        }
        main_console = &console;
    }

    void Console::clear_singleton()
    {
        main_console = nullptr;
    }

    Console& Console::instance()
    {
        if (main_console == nullptr)
        {
            throw std::logic_error("Console not instantiated");
        }
        return *main_console;
    }

    bool Console::is_available()
    {
        return main_console != nullptr;
    }

    Console::Console(const Context& context)
        : p_data(new ConsoleData{ context })
    {
        set_singleton(*this);
    }

    Console::~Console()
    {
        if (!p_data->is_json_print_cancelled && !p_data->json_log.is_null())
        {
            this->json_print();
        }
        clear_singleton();
    }

    const Context& Console::context() const
    {
        return p_data->m_context;
    }

    ConsoleStream Console::stream()
    {
        return ConsoleStream();
    }

    void Console::cancel_json_print()
    {
        p_data->is_json_print_cancelled = true;
    }

    void Console::print(std::string_view str, bool force_print)
    {
        if (force_print || !(context().output_params.quiet || context().output_params.json))
        {
            const std::lock_guard<std::mutex> lock(p_data->m_mutex);
            std::cout << str << std::endl;
        }
    }

    void Console::report(message_kind kind, std::string_view msg)
    {
        const auto& palette = context().graphics_params.palette;
        std::string marker;
        switch (kind)
        {
            case message_kind::info:
                marker = fmt::format(palette.info, "[*]");
                break;
            case message_kind::success:
                marker = fmt::format(palette.success, "[✓]");
                break;
            case message_kind::warning:
                marker = fmt::format(palette.warning, "[!]");
                break;
            case message_kind::failure:
                marker = fmt::format(palette.failure, "[x]");
                break;
        }
        // Failures are shown even in quiet mode
        print(fmt::format("{} {}", marker, msg), kind == message_kind::failure);
    }

    std::string Console::user(std::string_view str) const
    {
        return fmt::format(context().graphics_params.palette.user, "{}", str);
    }

    void Console::json_print()
    {
        print(p_data->json_log.unflatten().dump(4), true);
    }

    // write all the key/value pairs of a JSON object into the current entry, which
    // is then a JSON object
    void Console::json_write(const nlohmann::json& j)
    {
        if (context().output_params.json)
        {
            nlohmann::json tmp = j.flatten();
            for (auto it = tmp.begin(); it != tmp.end(); ++it)
            {
                p_data->json_log[it.key()] = it.value();
            }
        }
    }

    /*****************
     * MessageLogger *
     *****************/

    MessageLogger::MessageLogger(log_level level)
        : m_level(level)
        , m_stream()
    {
    }

    MessageLogger::~MessageLogger()
    {
        emit(m_stream.str(), m_level);
    }

    std::stringstream& MessageLogger::stream()
    {
        return m_stream;
    }

    void MessageLogger::emit(const std::string& msg, const log_level& level)
    {
        const auto str = prepend(msg, "", std::string(4, ' '));
        switch (level)
        {
            case log_level::critical:
                SPDLOG_CRITICAL(str);
                break;
            case log_level::err:
                SPDLOG_ERROR(str);
                break;
            case log_level::warn:
                SPDLOG_WARN(str);
                break;
            case log_level::info:
                SPDLOG_INFO(str);
                break;
            case log_level::debug:
                SPDLOG_DEBUG(str);
                break;
            case log_level::trace:
                SPDLOG_TRACE(str);
                break;
            default:
                break;
        }
    }
}
