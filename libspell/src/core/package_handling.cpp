// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <array>
#include <fstream>
#include <string>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/package_handling.hpp"
#include "spell/core/thread_utils.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    namespace
    {
        class scoped_archive_read
        {
        public:

            scoped_archive_read()
                : scoped_archive_read(archive_read_new())
            {
            }

            static scoped_archive_read read_disk()
            {
                return scoped_archive_read(archive_read_disk_new());
            }

            ~scoped_archive_read()
            {
                archive_read_free(m_archive);
            }

            scoped_archive_read(const scoped_archive_read&) = delete;
            scoped_archive_read& operator=(const scoped_archive_read&) = delete;

            operator archive*()
            {
                return m_archive;
            }

        private:

            explicit scoped_archive_read(archive* a)
                : m_archive(a)
            {
                if (!m_archive)
                {
                    throw spell_error(
                        "Could not create libarchive read object",
                        spell_error_code::archive_failure
                    );
                }
            }

            archive* m_archive;
        };

        class scoped_archive_write
        {
        public:

            scoped_archive_write()
                : scoped_archive_write(archive_write_new())
            {
            }

            static scoped_archive_write write_disk()
            {
                return scoped_archive_write(archive_write_disk_new());
            }

            ~scoped_archive_write()
            {
                archive_write_free(m_archive);
            }

            scoped_archive_write(const scoped_archive_write&) = delete;
            scoped_archive_write& operator=(const scoped_archive_write&) = delete;

            operator archive*()
            {
                return m_archive;
            }

        private:

            explicit scoped_archive_write(archive* a)
                : m_archive(a)
            {
                if (!m_archive)
                {
                    throw spell_error(
                        "Could not create libarchive write object",
                        spell_error_code::archive_failure
                    );
                }
            }

            archive* m_archive;
        };

        class scoped_archive_entry
        {
        public:

            scoped_archive_entry()
                : m_entry(archive_entry_new())
            {
                if (!m_entry)
                {
                    throw spell_error(
                        "Could not create libarchive entry object",
                        spell_error_code::archive_failure
                    );
                }
            }

            ~scoped_archive_entry()
            {
                archive_entry_free(m_entry);
            }

            scoped_archive_entry(const scoped_archive_entry&) = delete;
            scoped_archive_entry& operator=(const scoped_archive_entry&) = delete;

            operator archive_entry*()
            {
                return m_entry;
            }

        private:

            archive_entry* m_entry;
        };

        [[noreturn]] void throw_archive_error(archive* a, std::string_view context)
        {
            const char* msg = archive_error_string(a);
            throw spell_error(
                util::concat("libarchive error (", context, "): ", msg ? msg : "unknown error"),
                spell_error_code::archive_failure
            );
        }

        // Entry paths are joined to the destination, they must stay inside it
        auto contained_path(const fs::path& destination, std::string_view entry_path) -> fs::path
        {
            const auto rel = fs::path(entry_path).lexically_normal();
            if (rel.empty() || rel.is_absolute() || *rel.begin() == "..")
            {
                throw spell_error(
                    util::concat("Archive entry escapes the extraction directory: ", entry_path),
                    spell_error_code::archive_failure
                );
            }
            auto target = destination / rel;

            // A symlink extracted earlier must not carry later entries out of the destination
            const auto parent = fs::weakly_canonical(target.parent_path())
                                    .lexically_relative(destination);
            if (parent.empty() || *parent.begin() == "..")
            {
                throw spell_error(
                    util::concat("Archive entry is reached through a symlink outside: ", entry_path),
                    spell_error_code::archive_failure
                );
            }
            return target;
        }

        void copy_data(archive* ar, archive* aw)
        {
            const void* buff = nullptr;
            std::size_t size = 0;
            la_int64_t offset = 0;

            while (true)
            {
                interruption_point();
                int r = archive_read_data_block(ar, &buff, &size, &offset);
                if (r == ARCHIVE_EOF)
                {
                    return;
                }
                if (r < ARCHIVE_OK)
                {
                    throw_archive_error(ar, "read data");
                }
                if (archive_write_data_block(aw, buff, size, offset) < ARCHIVE_OK)
                {
                    throw_archive_error(aw, "write data");
                }
            }
        }
    }

    auto is_archive_filename(std::string_view filename) -> bool
    {
        return util::ends_with_any(util::to_lower(filename), archive_suffixes);
    }

    void extract_archive(const fs::path& file, const fs::path& destination)
    {
        LOG_DEBUG << "Extracting " << file << " to " << destination;

        scoped_archive_read a;
        archive_read_support_format_all(a);
        archive_read_support_format_raw(a);
        archive_read_support_filter_all(a);
        if (archive_read_open_filename(a, file.c_str(), 10240) != ARCHIVE_OK)
        {
            throw_archive_error(a, file.string());
        }

        fs::create_directories(destination);
        const auto dest_root = fs::canonical(destination);

        // Entries are given absolute paths under the canonical destination, relative entry
        // paths are checked by contained_path instead of SECURE_NOABSOLUTEPATHS.
        int flags = ARCHIVE_EXTRACT_TIME;
        flags |= ARCHIVE_EXTRACT_PERM;
        flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
        flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
        flags |= ARCHIVE_EXTRACT_UNLINK;

        scoped_archive_write ext = scoped_archive_write::write_disk();
        archive_write_disk_set_options(ext, flags);
        archive_write_disk_set_standard_lookup(ext);

        archive_entry* entry = nullptr;
        while (true)
        {
            interruption_point();

            int r = archive_read_next_header(a, &entry);
            if (r == ARCHIVE_EOF)
            {
                break;
            }
            if (r < ARCHIVE_OK)
            {
                throw_archive_error(a, file.string());
            }

            // Compressed single files without a tar layer come out as "data"
            std::string pathname = archive_entry_pathname(entry);
            if (archive_format(a) == ARCHIVE_FORMAT_RAW)
            {
                std::string stem = file.filename().string();
                pathname = std::string(util::remove_suffix(stem, file.extension().string()));
            }
            const auto target = contained_path(dest_root, pathname);
            archive_entry_set_pathname(entry, target.c_str());

            // Hardlink targets are stored relative to the archive root
            if (const char* link = archive_entry_hardlink(entry); link != nullptr)
            {
                const auto link_target = contained_path(dest_root, link);
                archive_entry_set_hardlink(entry, link_target.c_str());
            }

            if (archive_write_header(ext, entry) < ARCHIVE_OK)
            {
                throw_archive_error(ext, pathname);
            }
            if (archive_entry_size(entry) > 0)
            {
                copy_data(a, ext);
            }
            r = archive_write_finish_entry(ext);
            if (r == ARCHIVE_WARN)
            {
                LOG_WARNING << "libarchive warning: " << archive_error_string(ext);
            }
            else if (r < ARCHIVE_OK)
            {
                throw_archive_error(ext, pathname);
            }
        }
    }

    void create_archive(const fs::path& directory, const fs::path& destination, int compression_level)
    {
        if (!fs::is_directory(directory))
        {
            throw spell_error(
                util::concat("Directory to archive does not exist: ", directory.string()),
                spell_error_code::archive_failure
            );
        }
        fs::create_directories(destination.parent_path());

        scoped_archive_write a;
        archive_write_set_format_gnutar(a);
        archive_write_add_filter_zstd(a);

        const std::string comp_level = util::concat(
            "zstd:compression-level=",
            std::to_string(std::clamp(compression_level, 1, 22))
        );
        if (archive_write_set_options(a, comp_level.c_str()) != ARCHIVE_OK)
        {
            LOG_ERROR << "libarchive error: " << archive_error_string(a);
        }

        if (archive_write_open_filename(a, destination.c_str()) != ARCHIVE_OK)
        {
            throw_archive_error(a, destination.string());
        }

        std::vector<fs::path> files;
        for (const auto& dir_entry : fs::recursive_directory_iterator(directory))
        {
            files.push_back(dir_entry.path());
        }
        std::sort(files.begin(), files.end());

        for (const auto& path : files)
        {
            interruption_point();

            const auto status = fs::symlink_status(path);
            const auto rel = path.lexically_relative(directory);

            // skip adding non-empty directories (they are implicitly added by the files therein)
            if (fs::is_directory(status) && !fs::is_empty(path))
            {
                continue;
            }

            LOG_TRACE << "Adding " << rel << " to archive";

            scoped_archive_entry entry;
            scoped_archive_read disk = scoped_archive_read::read_disk();
            archive_read_disk_set_symlink_physical(disk);
            if (archive_read_disk_open(disk, path.c_str()) < ARCHIVE_OK)
            {
                throw_archive_error(disk, path.string());
            }
            if (archive_read_next_header2(disk, entry) < ARCHIVE_OK)
            {
                throw_archive_error(disk, path.string());
            }

            archive_entry_set_pathname(entry, rel.c_str());
            // clean out UID and GID
            archive_entry_set_uid(entry, 0);
            archive_entry_set_gid(entry, 0);
            archive_entry_set_gname(entry, "");
            archive_entry_set_uname(entry, "");

            if (archive_write_header(a, entry) < ARCHIVE_OK)
            {
                throw_archive_error(a, rel.string());
            }

            if (fs::is_regular_file(status))
            {
                std::array<char, 8192> buffer;
                std::ifstream fin(path, std::ios::in | std::ios::binary);
                while (fin)
                {
                    fin.read(buffer.data(), buffer.size());
                    const std::streamsize len = fin.gcount();
                    if (len > 0
                        && archive_write_data(a, buffer.data(), static_cast<std::size_t>(len)) < 0)
                    {
                        throw_archive_error(a, rel.string());
                    }
                }
            }

            const int r = archive_write_finish_entry(a);
            if (r == ARCHIVE_WARN)
            {
                LOG_WARNING << "libarchive warning: " << archive_error_string(a);
            }
            else if (r < ARCHIVE_OK)
            {
                throw_archive_error(a, rel.string());
            }
        }

        if (archive_write_close(a) != ARCHIVE_OK)
        {
            throw_archive_error(a, destination.string());
        }
    }
}
