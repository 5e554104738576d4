// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_UTIL_CRYPTOGRAPHY_HPP
#define SPELL_UTIL_CRYPTOGRAPHY_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "spell/util/encoding.hpp"

using EVP_MD_CTX = struct evp_md_ctx_st;  // OpenSSL impl

namespace spell::util
{
    /**
     * Provide high-level hashing functions over a digest hashing algorithm.
     */
    template <typename Digester>
    class DigestHasher
    {
    public:

        using digester_type = Digester;

        inline static constexpr std::size_t bytes_size = digester_type::bytes_size;
        inline static constexpr std::size_t hex_size = 2 * bytes_size;
        inline static constexpr std::size_t digest_size = digester_type::digest_size;

        using bytes_array = std::array<std::byte, bytes_size>;

        /**
         * Hash a string and return the hashed bytes with hexadecimal encoding as a string.
         */
        [[nodiscard]] auto str_hex_str(std::string_view data) -> std::string;

        /**
         * Hash the remaining content of a file stream.
         *
         * The file should be opened in binary mode.
         */
        [[nodiscard]] auto file_bytes(std::ifstream& infile) -> bytes_array;

        [[nodiscard]] auto file_hex_str(std::ifstream& infile) -> std::string;

    private:

        std::vector<std::byte> m_digest_buffer = {};
        digester_type m_digester = {};
    };

    namespace detail
    {
        class EVPDigester
        {
        public:

            enum struct Algorithm
            {
                sha256,
                sha512,
                md5
            };

            EVPDigester(Algorithm algo);

            void digest_start();
            void digest_update(const std::byte* buffer, std::size_t count);
            void digest_finalize_to(std::byte* hash);

        private:

            struct EVPContextDeleter
            {
                void operator()(::EVP_MD_CTX* ptr) const;
            };

            std::unique_ptr<::EVP_MD_CTX, EVPContextDeleter> m_ctx;
            Algorithm m_algorithm;
        };

        template <EVPDigester::Algorithm algo, std::size_t size>
        class BasicEVPDigester : private EVPDigester
        {
        public:

            inline static constexpr std::size_t bytes_size = size;
            inline static constexpr std::size_t digest_size = 32768;

            using EVPDigester::digest_start;
            using EVPDigester::digest_update;
            using EVPDigester::digest_finalize_to;

            BasicEVPDigester()
                : EVPDigester(algo)
            {
            }
        };
    }

    using Sha256Digester = detail::BasicEVPDigester<detail::EVPDigester::Algorithm::sha256, 32>;
    using Sha512Digester = detail::BasicEVPDigester<detail::EVPDigester::Algorithm::sha512, 64>;
    using Md5Digester = detail::BasicEVPDigester<detail::EVPDigester::Algorithm::md5, 16>;

    using Sha256Hasher = DigestHasher<Sha256Digester>;
    using Sha512Hasher = DigestHasher<Sha512Digester>;
    using Md5Hasher = DigestHasher<Md5Digester>;

    /********************************
     *  Implementation of hashers  *
     ********************************/

    template <typename D>
    auto DigestHasher<D>::str_hex_str(std::string_view data) -> std::string
    {
        auto bytes = bytes_array{};
        m_digester.digest_start();
        auto iter = reinterpret_cast<const std::byte*>(data.data());
        auto remaining = data.size();
        while (remaining > 0)
        {
            const auto taken = std::min(remaining, digest_size);
            m_digester.digest_update(iter, taken);
            remaining -= taken;
            iter += taken;
        }
        m_digester.digest_finalize_to(bytes.data());
        return bytes_to_hex_str(bytes.data(), bytes.data() + bytes.size());
    }

    template <typename D>
    auto DigestHasher<D>::file_bytes(std::ifstream& infile) -> bytes_array
    {
        auto out = bytes_array{};
        m_digest_buffer.assign(digest_size, std::byte(0));
        m_digester.digest_start();

        while (infile)
        {
            infile.read(reinterpret_cast<char*>(m_digest_buffer.data()), digest_size);
            const auto count = static_cast<std::size_t>(infile.gcount());
            if (!count)
            {
                break;
            }
            m_digester.digest_update(m_digest_buffer.data(), count);
        }
        m_digester.digest_finalize_to(out.data());
        return out;
    }

    template <typename D>
    auto DigestHasher<D>::file_hex_str(std::ifstream& infile) -> std::string
    {
        const auto bytes = file_bytes(infile);
        return bytes_to_hex_str(bytes.data(), bytes.data() + bytes.size());
    }
}
#endif
