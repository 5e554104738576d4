// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "spell/core/capabilities.hpp"
#include "spell/core/download.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/package_handling.hpp"
#include "spell/core/subprocess.hpp"
#include "spell/util/environment.hpp"

namespace spell
{
    namespace
    {
        auto require_executable(std::string_view exe) -> fs::path
        {
            auto path = util::which(exe);
            if (path.empty())
            {
                throw spell_error(
                    fmt::format("Could not find '{}' in PATH", exe),
                    spell_error_code::subprocess_failure,
                    SubprocessFailure{ std::string(exe), 127, {} }
                );
            }
            return path;
        }

        auto quote(const fs::path& path) -> std::string
        {
            std::string out = "'";
            for (char c : path.string())
            {
                if (c == '\'')
                {
                    out += "'\\''";
                }
                else
                {
                    out += c;
                }
            }
            out += '\'';
            return out;
        }
    }

    SystemCapabilities::SystemCapabilities(const Context& context)
        : m_context(context)
    {
    }

    void SystemCapabilities::fetch_url(const std::string& url, const fs::path& destination)
    {
        Console::instance().report(message_kind::info, fmt::format("Downloading {}", url));
        spell::extract(download_file(url, destination));
    }

    void SystemCapabilities::clone(
        const std::string& url,
        const std::optional<std::string>& ref,
        const fs::path& destination
    )
    {
        Console::instance().report(message_kind::info, fmt::format("Cloning {}", url));
        auto args = command_args{ require_executable("git").string(), "clone", "--depth", "1" };
        if (ref.has_value())
        {
            args.insert(args.end(), { "--branch", ref.value() });
        }
        args.insert(args.end(), { url, destination.string() });
        run_command(m_context, args, { {}, {}, std::nullopt, fmt::format("Cloning {}", url) });
    }

    void SystemCapabilities::extract(const fs::path& archive, const fs::path& destination)
    {
        Console::instance().report(
            message_kind::info,
            fmt::format("Extracting {}", archive.filename().string())
        );
        extract_archive(archive, destination);
    }

    void
    SystemCapabilities::apply_patch(const fs::path& patch, const fs::path& source_root, const fs::path& log)
    {
        Console::instance().report(
            message_kind::info,
            fmt::format("Applying patch {}", patch.filename().string())
        );
        const auto patch_exe = require_executable("patch");
        run_shell(
            m_context,
            fmt::format("{} -p1 < {}", quote(patch_exe), quote(fs::absolute(patch))),
            { source_root, {}, log, fmt::format("Patching with {}", patch.filename().string()) }
        );
    }

    void SystemCapabilities::install_entry(const fs::path& staged, const fs::path& target)
    {
        const auto status = fs::symlink_status(staged);
        if (fs::is_symlink(status))
        {
            if (fs::exists(fs::symlink_status(target)))
            {
                fs::remove(target);
            }
            fs::copy_symlink(staged, target);
        }
        else
        {
            fs::copy_file(staged, target, fs::copy_options::overwrite_existing);
        }
    }
}
