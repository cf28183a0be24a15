/**
 * Copyright (c) 2022, Timothy Stack
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
 * @file test_pcre2pp.cc
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pcre2pp.hh"

TEST_CASE("bad pattern")
{
    auto compile_res
        = redact::pcre2pp::code::from(string_fragment::from_const("[abc"));

    CHECK(compile_res.isErr());
    auto ce = compile_res.unwrapErr();
    CHECK(ce.ce_offset == 4);
    CHECK(ce.ce_pattern == "[abc");
    CHECK_FALSE(ce.get_message().empty());
}

TEST_CASE("for_each captures")
{
    static const char INPUT[] = "key1=1234;key2=5678;";

    auto co = redact::pcre2pp::code::from_const(R"((\w+)=([^;]+);)");
    std::vector<std::string> keys;
    std::vector<std::string> values;

    auto res = co.capture_from(string_fragment::from_const(INPUT))
                   .for_each([&](redact::pcre2pp::match_data& md) {
                       keys.emplace_back(md[1]->to_string());
                       values.emplace_back(md[2]->to_string());
                   });

    CHECK(res.isOk());
    CHECK(keys == std::vector<std::string>{"key1", "key2"});
    CHECK(values == std::vector<std::string>{"1234", "5678"});
}

TEST_CASE("capture_count")
{
    auto co = redact::pcre2pp::code::from_const(R"(^(\w+)=(?:[^;]+);)");

    CHECK(co.get_capture_count() == 1);
}

TEST_CASE("matches_whole")
{
    auto co = redact::pcre2pp::code::from_const(R"(user\d{3})");

    CHECK(co.matches_whole(string_fragment::from_const("user123")));
    CHECK_FALSE(co.matches_whole(string_fragment::from_const("user1234")));
    CHECK_FALSE(co.matches_whole(string_fragment::from_const("xuser123")));
}

TEST_CASE("replace_with")
{
    static const char INPUT[] = "ip 10.0.0.1 and 192.168.1.20 done";

    auto co = redact::pcre2pp::code::from_const(R"(\d+(?:\.\d+){3})");
    auto in = string_fragment::from_const(INPUT);
    int count = 0;

    auto res = co.replace_with(in, [&count](redact::pcre2pp::match_data& md) {
        count += 1;
        return "<" + std::to_string(md[0]->length()) + ">";
    });
    CHECK(res.unwrap() == "ip <8> and <12> done");
    CHECK(count == 2);
}

TEST_CASE("replace_with no match")
{
    auto co = redact::pcre2pp::code::from_const(R"(\d+)");
    auto in = string_fragment::from_const("nothing here");

    auto res = co.replace_with(
        in, [](redact::pcre2pp::match_data&) { return std::string("X"); });
    CHECK(res.unwrap() == "nothing here");
}

TEST_CASE("replace_with invalid utf-8")
{
    static const char INPUT[] = "user\xff alice@example.com logged in";

    auto co = redact::pcre2pp::code::from_const(R"([a-z]+@[a-z]+\.com)");
    auto in = string_fragment::from_const(INPUT);

    auto res = co.replace_with(
        in, [](redact::pcre2pp::match_data&) { return std::string("***"); });
    REQUIRE(res.isOk());
    CHECK(res.unwrap() == "user\xff *** logged in");
}

TEST_CASE("matches_whole invalid utf-8")
{
    auto co = redact::pcre2pp::code::from_const(R"(\w+)");

    CHECK_FALSE(co.matches_whole(string_fragment::from_const("caf\xe9")));
    CHECK(co.matches_whole(string_fragment::from_const("cafe")));
}
