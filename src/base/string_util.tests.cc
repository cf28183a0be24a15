/**
 * Copyright (c) 2014, Timothy Stack
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
 * @file string_util.tests.cc
 */

#include "base/string_util.hh"

#include "doctest/doctest.h"

TEST_CASE("endswith")
{
    std::string hw("hello");

    CHECK(endswith(hw, "f") == false);
    CHECK(endswith(hw, "lo") == true);
}

TEST_CASE("capitalize")
{
    CHECK(capitalize("") == "");
    CHECK(capitalize("alice") == "Alice");
    CHECK(capitalize("Bob") == "Bob");
}

TEST_CASE("ifind")
{
    CHECK(ifind("Hello, World", "world") == 7);
    CHECK(ifind("Hello, World", "WORLD", 8) == std::string::npos);
    CHECK(ifind("abc", "") == std::string::npos);
}

TEST_CASE("replace_all")
{
    std::string str = "Bob met bob and BOB";

    CHECK(replace_all(str, "bob", "X") == 1);
    CHECK(str == "Bob met X and BOB");

    str = "Bob met bob and BOB";
    CHECK(replace_all(str, "bob", "bobby", true) == 3);
    CHECK(str == "bobby met bobby and bobby");
}

TEST_CASE("quote")
{
    CHECK(redact::pcre2pp::quote(string_fragment::from_const("a.b|c"))
          == "a\\.b\\|c");
    CHECK(redact::pcre2pp::quote(string_fragment::from_const("plain"))
          == "plain");
}
