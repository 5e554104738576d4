// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>

#include <openssl/evp.h>

#include "spell/util/cryptography.hpp"

namespace spell::util::detail
{
    void EVPDigester::EVPContextDeleter::operator()(::EVP_MD_CTX* ptr) const
    {
        if (ptr)
        {
            ::EVP_MD_CTX_free(ptr);
        }
    }

    EVPDigester::EVPDigester(Algorithm algo)
        : m_algorithm(algo)
    {
        m_ctx.reset(::EVP_MD_CTX_new());
        if (!m_ctx)
        {
            throw std::runtime_error("Could not allocate OpenSSL digest context");
        }
    }

    void EVPDigester::digest_start()
    {
        const ::EVP_MD* md = nullptr;
        switch (m_algorithm)
        {
            case Algorithm::sha256:
                md = ::EVP_sha256();
                break;
            case Algorithm::sha512:
                md = ::EVP_sha512();
                break;
            case Algorithm::md5:
                md = ::EVP_md5();
                break;
        }
        if (::EVP_DigestInit_ex(m_ctx.get(), md, nullptr) != 1)
        {
            throw std::runtime_error("Could not initialize OpenSSL digest");
        }
    }

    void EVPDigester::digest_update(const std::byte* buffer, std::size_t count)
    {
        ::EVP_DigestUpdate(m_ctx.get(), buffer, count);
    }

    void EVPDigester::digest_finalize_to(std::byte* hash)
    {
        ::EVP_DigestFinal_ex(m_ctx.get(), reinterpret_cast<unsigned char*>(hash), nullptr);
    }
}
