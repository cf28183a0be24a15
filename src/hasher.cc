/**
 * Copyright (c) 2025, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file hasher.cc
 */

#include <endian.h>

#include "hasher.hh"

#include "base/redact_log.hh"

static const EVP_MD*
to_evp_md(digest_algorithm_t algo)
{
    switch (algo) {
        case digest_algorithm_t::SHA1:
            return EVP_sha1();
        case digest_algorithm_t::MD5:
            return EVP_md5();
        case digest_algorithm_t::SHA256:
            break;
    }

    return EVP_sha256();
}

const char*
digest_algorithm_name(digest_algorithm_t algo)
{
    switch (algo) {
        case digest_algorithm_t::SHA1:
            return "SHA-1";
        case digest_algorithm_t::MD5:
            return "MD5";
        case digest_algorithm_t::SHA256:
            break;
    }

    return "SHA-256";
}

hasher::hasher(digest_algorithm_t algo)
    : h_algorithm(algo), h_context(EVP_MD_CTX_free)
{
    this->h_context = EVP_MD_CTX_new();
    require(this->h_context.in() != nullptr);

    auto rc = EVP_DigestInit_ex(this->h_context, to_evp_md(algo), nullptr);
    ensure(rc == 1);
}

hasher&
hasher::update(const char* bits, size_t len)
{
    auto rc = EVP_DigestUpdate(this->h_context, bits, len);
    ensure(rc == 1);

    return *this;
}

hasher&
hasher::update(int64_t value)
{
    value = htole64(value);

    return this->update((const char*) &value, sizeof(value));
}

hasher::array_t
hasher::to_array() const
{
    auto_mem<EVP_MD_CTX> copy(EVP_MD_CTX_free);
    unsigned char md_value[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;

    copy = EVP_MD_CTX_new();
    require(copy.in() != nullptr);
    auto rc = EVP_MD_CTX_copy_ex(copy, this->h_context);
    ensure(rc == 1);
    rc = EVP_DigestFinal_ex(copy, md_value, &md_len);
    ensure(rc == 1);

    return {md_value, md_value + md_len};
}

std::string
hasher::to_string() const
{
    static const char HEX_DIGITS[] = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };

    auto bits = this->to_array();
    std::string retval;

    retval.reserve(bits.size() * 2);
    for (const auto byte : bits) {
        retval.push_back(HEX_DIGITS[byte >> 4U]);
        retval.push_back(HEX_DIGITS[byte & 0x0fU]);
    }

    return retval;
}

uint64_t
hasher::to_uint64() const
{
    auto bits = this->to_array();
    uint64_t retval = 0;

    for (size_t lpc = 0; lpc < sizeof(retval) && lpc < bits.size(); lpc++) {
        retval = (retval << 8U) | bits[lpc];
    }

    return retval;
}
