// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

#include <fmt/format.h>

#include "spell/core/download.hpp"
#include "spell/core/output.hpp"
#include "spell/core/thread_utils.hpp"
#include "spell/util/cfile.hpp"

namespace spell
{
    namespace
    {
        constexpr int max_retries = 3;
        constexpr auto retry_wait = std::chrono::seconds(2);

        std::size_t write_to_file(char* ptr, std::size_t size, std::size_t nmemb, void* self)
        {
            auto* file = static_cast<std::FILE*>(self);
            return std::fwrite(ptr, size, nmemb, file);
        }

        int check_interrupted(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            // Non zero aborts the transfer
            return is_sig_interrupted() ? 1 : 0;
        }
    }

    CURLHandle::CURLHandle()
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw spell_error("Could not initialize CURL handle", spell_error_code::fetch_failure);
        }

        // Set error buffer
        std::fill(m_errorbuffer.begin(), m_errorbuffer.end(), '\0');
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle::~CURLHandle()
    {
        curl_easy_cleanup(m_handle);
    }

    CURLHandle& CURLHandle::set_opt(CURLoption opt, const std::string& val)
    {
        return set_opt(opt, val.c_str());
    }

    CURLcode CURLHandle::perform()
    {
        return curl_easy_perform(m_handle);
    }

    auto CURLHandle::response_code() const -> long
    {
        long code = 0;
        curl_easy_getinfo(m_handle, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    auto CURLHandle::error_buffer() const -> const char*
    {
        return m_errorbuffer.data();
    }

    bool CURLHandle::can_retry(CURLcode res)
    {
        switch (res)
        {
            case CURLE_COULDNT_CONNECT:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_PARTIAL_FILE:
            case CURLE_RECV_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_GOT_NOTHING:
                return true;
            default:
                return false;
        }
    }

    auto download_file(const std::string& url, const fs::path& destination) -> expected_t<void>
    {
        std::error_code ec;
        if (destination.has_parent_path())
        {
            fs::create_directories(destination.parent_path(), ec);
        }

        auto partial = destination;
        partial += ".part";

        for (int attempt = 1;; ++attempt)
        {
            auto file = util::CFile::try_open(partial, "wb");
            if (!file)
            {
                return make_unexpected(
                    fmt::format("Could not open '{}': {}", partial.string(), file.error().message()),
                    spell_error_code::fetch_failure
                );
            }

            auto handle = CURLHandle();
            handle.set_opt(CURLOPT_URL, url)
                .set_opt(CURLOPT_FOLLOWLOCATION, 1L)
                .set_opt(CURLOPT_FAILONERROR, 1L)
                .set_opt(CURLOPT_USERAGENT, "spell")
                .set_opt(CURLOPT_WRITEFUNCTION, &write_to_file)
                .set_opt(CURLOPT_WRITEDATA, static_cast<void*>(file->raw()))
                .set_opt(CURLOPT_NOPROGRESS, 0L)
                .set_opt(CURLOPT_XFERINFOFUNCTION, &check_interrupted);

            LOG_INFO << "Downloading " << url << " (attempt " << attempt << ")";
            const CURLcode res = handle.perform();
            const auto closed = file->try_close();

            if (res == CURLE_OK && closed)
            {
                fs::rename(partial, destination, ec);
                if (ec)
                {
                    return make_unexpected(
                        fmt::format("Could not move download to '{}': {}", destination.string(), ec.message()),
                        spell_error_code::fetch_failure
                    );
                }
                return {};
            }

            fs::remove(partial, ec);
            interruption_point();
            if (res == CURLE_OK)
            {
                return make_unexpected(
                    fmt::format("Could not write '{}': {}", partial.string(), closed.error().message()),
                    spell_error_code::fetch_failure
                );
            }
            if (!CURLHandle::can_retry(res) || attempt >= max_retries)
            {
                const std::string detail = handle.error_buffer()[0] != '\0'
                                               ? handle.error_buffer()
                                               : curl_easy_strerror(res);
                return make_unexpected(
                    fmt::format("Could not download '{}': {}", url, detail),
                    spell_error_code::fetch_failure
                );
            }
            LOG_WARNING << "Transfer of " << url << " failed, retrying: " << curl_easy_strerror(res);
            std::this_thread::sleep_for(retry_wait);
        }
    }
}
