/**
 * Copyright (c) 2021, Timothy Stack
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
 * @file hasher.hh
 */

#ifndef redact_hasher_hh
#define redact_hasher_hh

#include <string>
#include <vector>

#include <stdint.h>

#include <openssl/evp.h>

#include "base/auto_mem.hh"
#include "base/string_fragment.hh"

enum class digest_algorithm_t {
    SHA256,
    SHA1,
    MD5,
};

const char* digest_algorithm_name(digest_algorithm_t algo);

/**
 * Incremental message digest over one of the OpenSSL EVP algorithms.  The
 * digest can be read out at any point without disturbing further updates.
 */
class hasher {
public:
    using array_t = std::vector<unsigned char>;

    explicit hasher(digest_algorithm_t algo = digest_algorithm_t::SHA256);

    hasher(hasher&& other) = default;

    hasher& update(const std::string& str)
    {
        return this->update(str.data(), str.length());
    }

    hasher& update(const string_fragment& str)
    {
        return this->update(str.data(), str.length());
    }

    hasher& update(const char* bits, size_t len);

    hasher& update(int64_t value);

    array_t to_array() const;

    /**
     * @return The digest as lower-case hex.
     */
    std::string to_string() const;

    /**
     * @return The first eight bytes of the digest as a big-endian integer.
     */
    uint64_t to_uint64() const;

    digest_algorithm_t get_algorithm() const { return this->h_algorithm; }

private:
    digest_algorithm_t h_algorithm;
    auto_mem<EVP_MD_CTX> h_context;
};

#endif
