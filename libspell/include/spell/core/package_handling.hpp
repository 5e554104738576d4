// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_PACKAGE_HANDLING_HPP
#define SPELL_CORE_PACKAGE_HANDLING_HPP

#include <string_view>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    /** File name suffixes of the archives unpacked after a fetch. */
    inline constexpr std::string_view archive_suffixes[] = {
        ".tar.gz", ".tar.xz", ".tar.bz2", ".tar.zst", ".zip", ".tar", ".tgz",
        ".tbz",    ".txz",    ".7z",      ".gz",      ".bz2", ".xz",  ".zst",
    };

    [[nodiscard]] auto is_archive_filename(std::string_view filename) -> bool;

    /**
     * Unpack an archive into a directory, creating it if needed.
     *
     * Entries with absolute paths, ``..`` components or escaping symlinks are refused.
     *
     * @throw spell_error with ``archive_failure`` code.
     */
    void extract_archive(const fs::path& file, const fs::path& destination);

    /**
     * Bundle every entry under a directory into a zstd compressed tarball.
     *
     * Paths are stored relative to the directory and ownership is cleared.
     *
     * @throw spell_error with ``archive_failure`` code.
     */
    void create_archive(const fs::path& directory, const fs::path& destination, int compression_level);
}

#endif
