// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_DOWNLOAD_HPP
#define SPELL_CORE_DOWNLOAD_HPP

#include <array>
#include <string>

#include <curl/curl.h>

#include "spell/core/error_handling.hpp"
#include "spell/fs/filesystem.hpp"

namespace spell
{
    class CURLHandle
    {
    public:

        CURLHandle();
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;
        CURLHandle(CURLHandle&&) = delete;
        CURLHandle& operator=(CURLHandle&&) = delete;

        template <class T>
        CURLHandle& set_opt(CURLoption opt, const T& val);

        CURLHandle& set_opt(CURLoption opt, const std::string& val);

        CURLcode perform();

        [[nodiscard]] auto response_code() const -> long;
        [[nodiscard]] auto error_buffer() const -> const char*;

        static bool can_retry(CURLcode res);

    private:

        CURL* m_handle;
        std::array<char, CURL_ERROR_SIZE> m_errorbuffer;
    };

    /**
     * Download a URL to a file, following redirections.
     *
     * The destination is only written once the transfer succeeded. ``file://`` URLs are
     * supported.
     */
    [[nodiscard]] auto download_file(const std::string& url, const fs::path& destination)
        -> expected_t<void>;

    template <class T>
    CURLHandle& CURLHandle::set_opt(CURLoption opt, const T& val)
    {
        const CURLcode res = curl_easy_setopt(m_handle, opt, val);
        if (res != CURLE_OK)
        {
            throw spell_error(
                std::string("Could not set curl option: ") + curl_easy_strerror(res),
                spell_error_code::fetch_failure
            );
        }
        return *this;
    }
}

#endif
