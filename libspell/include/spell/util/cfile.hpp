// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_UTIL_CFILE_HPP
#define SPELL_UTIL_CFILE_HPP

#include <cstdio>
#include <memory>
#include <string_view>
#include <system_error>

#include <tl/expected.hpp>

#include "spell/fs/filesystem.hpp"

namespace spell::util
{
    /**
     * Owning wrapper around a C ``FILE`` pointer.
     *
     * Used where the durability of a write matters: the content can be flushed down to the
     * storage device with @ref try_sync before the file is closed.
     */
    class CFile
    {
    public:

        static auto try_open(const fs::path& path, const char* mode, std::error_code& ec)
            -> CFile;

        static auto try_open(const fs::path& path, const char* mode)
            -> tl::expected<CFile, std::error_code>;

        CFile(CFile&&) = default;
        auto operator=(CFile&&) -> CFile& = default;

        /**
         * The destructor will flush and close the file descriptor.
         *
         * Like ``std::fstream``, errors are ignored.
         * Explicitly call @ref try_close to get them.
         */
        ~CFile();

        [[nodiscard]] auto try_write(std::string_view data) noexcept
            -> tl::expected<void, std::error_code>;

        /** Flush the C buffers and ask the kernel to commit the file to disk. */
        [[nodiscard]] auto try_sync() noexcept -> tl::expected<void, std::error_code>;

        void try_close(std::error_code& ec) noexcept;
        [[nodiscard]] auto try_close() noexcept -> tl::expected<void, std::error_code>;

        auto raw() noexcept -> std::FILE*;

    private:

        struct FileClose
        {
            void operator()(std::FILE* ptr);
        };

        std::unique_ptr<std::FILE, FileClose> m_ptr = nullptr;

        explicit CFile(std::FILE* ptr);
    };
}
#endif
