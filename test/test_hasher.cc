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
 * @file test_hasher.cc
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "hasher.hh"

TEST_CASE("digest vectors")
{
    const std::string ABC = "abc";

    CHECK(hasher().update(ABC).to_string()
          == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(hasher(digest_algorithm_t::SHA1).update(ABC).to_string()
          == "a9993e364706816aba3e25717850c26c9cd0d89d");
    CHECK(hasher(digest_algorithm_t::MD5).update(ABC).to_string()
          == "900150983cd24fb0d6963f7d28e17f72");
}

TEST_CASE("incremental updates")
{
    hasher h;

    h.update(std::string("abc"));
    CHECK(h.to_string()
          == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    h.update(string_fragment::from_const("def"));
    CHECK(h.to_string()
          == "bef57ec7f53a6d40beb640a780a639c83bc29ac8a9816f1fc6c5c6dcd93c4721");
}

TEST_CASE("to_uint64")
{
    CHECK(hasher().update(std::string("abc")).to_uint64()
          == 13436514500253700074ULL);
    CHECK(hasher().update((int64_t) 1).to_string().substr(0, 16)
          == "7c9fa136d4413fa6");
}

TEST_CASE("algorithm names")
{
    CHECK(std::string(digest_algorithm_name(digest_algorithm_t::SHA256))
          == "SHA-256");
    CHECK(hasher(digest_algorithm_t::MD5).get_algorithm()
          == digest_algorithm_t::MD5);
}
