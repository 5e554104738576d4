// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_UTIL_HPP
#define SPELL_CORE_UTIL_HPP

#include <fstream>
#include <optional>
#include <string>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        const fs::path& path() const;
        operator fs::path() const;

    private:

        fs::path m_path;
    };

    class TemporaryFile
    {
    public:

        TemporaryFile(
            const std::string& prefix = "spellf",
            const std::optional<fs::path>& dir = std::nullopt
        );
        ~TemporaryFile();

        TemporaryFile(const TemporaryFile&) = delete;
        TemporaryFile& operator=(const TemporaryFile&) = delete;

        const fs::path& path() const;
        operator fs::path() const;

    private:

        fs::path m_path;
    };

    std::ofstream
    open_ofstream(const fs::path& path, std::ios::openmode mode = std::ios::out | std::ios::binary);

    std::ifstream
    open_ifstream(const fs::path& path, std::ios::openmode mode = std::ios::in | std::ios::binary);

    /** Whole content of a file, throwing on failure to open it. */
    std::string read_contents(const fs::path& path);

    /** Remove a directory tree if it exists then create it again, empty. */
    void reset_directory(const fs::path& path);
}

#endif
