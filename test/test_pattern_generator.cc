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
 * @file test_pattern_generator.cc
 */

#include <algorithm>
#include <set>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pattern_generator.hh"
#include "pcrepp/pcre2pp.hh"
#include "realistic_data_generator.hh"

using redact::pattern_generator;

static constexpr uint64_t FIXED_SEED = 42;

static pattern_generator
make_gen(const std::map<std::string, std::string>& patterns,
         uint64_t seed = FIXED_SEED)
{
    auto res = pattern_generator::create(patterns, seed);

    REQUIRE(res.isOk());
    return res.unwrap();
}

static bool
matches(const std::string& regex, const std::string& value)
{
    auto expanded = pattern_generator::expand_placeholders(regex);
    auto co = redact::pcre2pp::code::from(string_fragment::from_str(expanded))
                  .unwrap();

    return co.matches_whole(string_fragment::from_str(value));
}

TEST_CASE("generate is deterministic")
{
    auto gen1 = make_gen({{"user", "user[0-9]{3}"}});
    auto gen2 = make_gen({{"user", "user[0-9]{3}"}});

    auto first = gen1.generate("user", "john.doe");
    REQUIRE(first);
    CHECK(matches("user[0-9]{3}", first.value()));
    CHECK(gen1.generate("user", "john.doe") == first);
    CHECK(gen2.generate("user", "john.doe") == first);
    CHECK(gen1.get_cache_size("user") == 1);
}

TEST_CASE("different seeds usually differ")
{
    auto gen1 = make_gen({{"id", "[a-z]{12}"}}, 1);
    auto gen2 = make_gen({{"id", "[a-z]{12}"}}, 2);

    CHECK(gen1.generate("id", "value") != gen2.generate("id", "value"));
}

TEST_CASE("distinct inputs get distinct outputs within a cycle")
{
    auto gen = make_gen({{"abc", "[a-c]"}});
    std::set<std::string> seen;

    for (const auto* in : {"one", "two", "three"}) {
        auto out = gen.generate("abc", in);

        REQUIRE(out);
        seen.emplace(out.value());
    }
    CHECK(seen == std::set<std::string>{"a", "b", "c"});
}

TEST_CASE("exhausted pattern starts a new cycle")
{
    auto gen = make_gen({{"ab", "[ab]"}});

    auto first = gen.generate("ab", "first").value();
    auto second = gen.generate("ab", "second").value();
    CHECK(first != second);

    auto third = gen.generate("ab", "third");
    REQUIRE(third);
    CHECK((third.value() == "a" || third.value() == "b"));

    CHECK(gen.generate("ab", "first").value() == first);
    CHECK(gen.generate("ab", "second").value() == second);
    CHECK(gen.get_cache_size("ab") == 3);
}

TEST_CASE("empty pattern")
{
    auto gen = make_gen({{"none", ""}});

    CHECK(gen.generate("none", "anything") == std::string());
    CHECK(gen.generate("none", "other") == std::string());
}

TEST_CASE("unknown pattern name")
{
    auto gen = make_gen({{"user", "user[0-9]{3}"}});

    CHECK_FALSE(gen.has_pattern("host"));
    CHECK_FALSE(gen.generate("host", "x").has_value());
    CHECK_FALSE(gen.generate_random("host").has_value());
    CHECK_FALSE(gen.get_pattern("host").has_value());
    CHECK_FALSE(gen.get_cardinality("host").has_value());
    CHECK(gen.get_cache_size("host") == 0);
}

TEST_CASE("pattern metadata")
{
    auto gen = make_gen({{"user", "user[0-9]{3}"}, {"host", "srv[0-9]{2}"}});

    CHECK(gen.get_pattern_names() == std::vector<std::string>{"host", "user"});
    CHECK(gen.get_pattern("user") == std::string("user[0-9]{3}"));
    CHECK(gen.get_cardinality("host") == uint64_t{100});
}

TEST_CASE("generate_random")
{
    static const std::string IP_RE = "10\\.0\\.[0-9]{1,3}\\.[0-9]{1,3}";

    auto gen = make_gen({{"ip", IP_RE}});
    std::set<std::string> seen;

    for (int lpc = 0; lpc < 10; lpc++) {
        auto ip = gen.generate_random("ip");

        REQUIRE(ip);
        CHECK(matches(IP_RE, ip.value()));
        seen.emplace(ip.value());
    }
    CHECK(seen.size() >= 5);
    CHECK(gen.get_cache_size("ip") == 0);
}

TEST_CASE("placeholders")
{
    static const std::string PATH_RE = "srv[0-9]{2}/{users}/app\\.log";
    const auto& first_names
        = redact::realistic_data_generator::get_first_names();

    auto gen = make_gen({
        {"path", PATH_RE},
        {"pair", "{users}-{users}"},
        {"home", "/home/{users}"},
        {"name", "{names}"},
        {"email", "{emails}"},
    });

    auto path = gen.generate("path", "srv01/bob/app.log").value();
    CHECK(matches(PATH_RE, path));
    auto user = path.substr(6, path.size() - 6 - 8);
    CHECK(std::find(first_names.begin(), first_names.end(), user)
          != first_names.end());

    auto pair = gen.generate("pair", "x").value();
    CHECK(matches("{users}-{users}", pair));

    auto home = gen.generate("home", "/home/johndoe").value();
    CHECK(matches("/home/{users}", home));
    CHECK_FALSE(matches("/home/user\\d+", home));

    auto name = gen.generate("name", "John Doe").value();
    CHECK(name.find('.') != std::string::npos);
    CHECK(matches("{names}", name));

    auto email = gen.generate("email", "john@corp.internal").value();
    CHECK(matches("{emails}", email));
}

TEST_CASE("malformed regex fails create")
{
    auto res = pattern_generator::create({{"bad", "user[0-9"}}, FIXED_SEED);

    REQUIRE(res.isErr());
    auto err = res.unwrapErr();
    CHECK(err.pe_name == "bad");
    CHECK(err.pe_pattern == "user[0-9");
    CHECK_FALSE(err.get_message().empty());

    auto unsupported
        = pattern_generator::create({{"backref", "(a)\\1"}}, FIXED_SEED);
    CHECK(unsupported.isErr());
}

TEST_CASE("clearing the cache restarts the sequence")
{
    auto gen = make_gen({{"abc", "[a-c]"}, {"num", "[0-9]{4}"}});
    auto fresh = make_gen({{"abc", "[a-c]"}, {"num", "[0-9]{4}"}});

    gen.generate("abc", "one");
    gen.generate("abc", "two");
    gen.generate("num", "one");
    gen.clear_pattern_cache("abc");
    CHECK(gen.get_cache_size("abc") == 0);
    CHECK(gen.get_cache_size("num") == 1);

    CHECK(gen.generate("abc", "two") == fresh.generate("abc", "two"));
    CHECK(gen.generate("abc", "one") == fresh.generate("abc", "one"));

    gen.clear_all_caches();
    CHECK(gen.get_cache_size("abc") == 0);
    CHECK(gen.get_cache_size("num") == 0);
}
