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
 * @file test_pseudonymizer.cc
 */

#include <set>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "base/string_util.hh"
#include "doctest/doctest.h"
#include "pcrepp/pcre2pp.hh"
#include "pseudonymizer.hh"

using redact::pseudonymizer;
namespace pseudonym = redact::pseudonym;

static pseudonymizer
build_ok(const pseudonymizer::builder& bld)
{
    auto res = bld.build();

    REQUIRE(res.isOk());
    return res.unwrap();
}

TEST_CASE("defaults")
{
    auto ps = pseudonymizer::with_defaults();
    static auto REDACTED_RE
        = redact::pcre2pp::code::from_const("^<redacted:.+>$");

    auto out = ps.pseudonymize(std::string("test@example.com"), "***");
    CHECK(REDACTED_RE.matches_whole(string_fragment::from_str(out)));
    CHECK(out.size() > 15);
    CHECK(out == "<redacted:973dfe46>");
    CHECK(ps.pseudonymize(std::string("test@example.com"), "***") == out);
    CHECK(ps.is_enabled());
    CHECK(ps.get_mode() == pseudonym::mode_type::HASH);
}

TEST_CASE("counter mode")
{
    auto ps = build_ok(
        pseudonymizer::builder().mode(pseudonym::mode_type::COUNTER));

    CHECK(ps.pseudonymize(std::string("a"), "***") == "<redacted:1>");
    CHECK(ps.pseudonymize(std::string("b"), "***") == "<redacted:2>");
    CHECK(ps.pseudonymize(std::string("a"), "***") == "<redacted:1>");
    CHECK(ps.get_cache_size() == 2);

    ps.clear_cache();
    CHECK(ps.get_cache_size() == 0);
    CHECK(ps.pseudonymize(std::string("b"), "***") == "<redacted:1>");
}

TEST_CASE("formats")
{
    auto hashed = build_ok(
        pseudonymizer::builder().format(pseudonym::format_type::HASH));
    CHECK(hashed.pseudonymize(std::string("test@example.com"), "***")
          == "<hash:973dfe46>");

    auto custom = build_ok(pseudonymizer::builder()
                               .format(pseudonym::format_type::CUSTOM)
                               .custom_prefix("[")
                               .custom_suffix("]")
                               .mode(pseudonym::mode_type::COUNTER));
    CHECK(custom.pseudonymize(std::string("x"), "***") == "[1]");
}

TEST_CASE("hash length and algorithm")
{
    auto shorty = build_ok(pseudonymizer::builder().hash_length(2));
    CHECK(shorty.pseudonymize(std::string("test@example.com"), "***")
          == "<redacted:973dfe>");

    auto longer = build_ok(pseudonymizer::builder().hash_length(100));
    CHECK(longer.pseudonymize(std::string("test@example.com"), "***")
          == "<redacted:973dfe463ec85785f5f95af5ba3906ee>");

    auto md5 = build_ok(
        pseudonymizer::builder().hash_algorithm(digest_algorithm_t::MD5));
    CHECK(md5.pseudonymize(std::string("test@example.com"), "***")
          == "<redacted:55502f40>");

    auto sha1 = build_ok(pseudonymizer::builder().hash_algorithm(
        pseudonym::algorithm_from_str("SHA-1")));
    CHECK(sha1.pseudonymize(std::string("test@example.com"), "***")
          == "<redacted:567159d6>");
}

TEST_CASE("disabled and missing values")
{
    auto off = pseudonymizer::disabled();

    CHECK_FALSE(off.is_enabled());
    CHECK(off.pseudonymize(std::string("secret"), "***") == "***");
    CHECK(off.pseudonymize_port(8080) == 8080);
    CHECK(off.get_stats()
          == "Pseudonymization: disabled, Cache size: 0 unique values");

    auto on = pseudonymizer::with_defaults();
    CHECK(on.pseudonymize(std::nullopt, "***") == "***");
    CHECK(on.pseudonymize(std::string(), "***") != "***");
}

TEST_CASE("custom replacements win")
{
    auto ps = build_ok(pseudonymizer::builder()
                           .mode(pseudonym::mode_type::COUNTER)
                           .add_replacement("alice", "user_a")
                           .add_pattern_generator("user", "user[0-9]{3}"));

    CHECK(ps.pseudonymize(std::string("alice"), "***") == "user_a");
    CHECK(ps.pseudonymize_with_pattern(std::string("alice"), "user", "***")
          == "user_a");
    CHECK(ps.pseudonymize(std::string("bob"), "***") == "<redacted:1>");
    CHECK(ps.get_cache_size() == 2);
}

TEST_CASE("pattern generators")
{
    auto ps = build_ok(
        pseudonymizer::builder().seed(42).add_pattern_generator(
            "host", "srv[0-9]{2}\\.example\\.com"));
    auto host_re = redact::pcre2pp::code::from_const(
        "srv[0-9]{2}\\.example\\.com");

    auto out = ps.pseudonymize_with_pattern(
        std::string("db1.corp.internal"), "host", "***");
    CHECK(host_re.matches_whole(string_fragment::from_str(out)));
    CHECK(ps.pseudonymize_with_pattern(
              std::string("db1.corp.internal"), "host", "***")
          == out);
    CHECK(ps.pseudonymize(std::string("db1.corp.internal"), "***") == out);

    auto fallback = ps.pseudonymize_with_pattern(
        std::string("other"), "missing", "***");
    CHECK(startswith(fallback, "<redacted:"));

    auto again = build_ok(
        pseudonymizer::builder().seed(42).add_pattern_generator(
            "host", "srv[0-9]{2}\\.example\\.com"));
    CHECK(again.pseudonymize_with_pattern(
              std::string("db1.corp.internal"), "host", "***")
          == out);
}

TEST_CASE("bad pattern generator fails build")
{
    auto res = pseudonymizer::builder()
                   .add_pattern_generator("bad", "(unclosed")
                   .build();

    REQUIRE(res.isErr());
    CHECK(res.unwrapErr().pe_name == "bad");
}

TEST_CASE("realistic mode")
{
    auto ps = build_ok(
        pseudonymizer::builder().mode(pseudonym::mode_type::REALISTIC));

    auto email = ps.pseudonymize(std::string("john.doe@corp.org"), "***");
    CHECK(email.find('@') != std::string::npos);
    CHECK_FALSE(startswith(email, "<redacted:"));

    auto path = ps.pseudonymize(std::string("/home/johndoe/x"), "***");
    CHECK(startswith(path, "/home/"));
    CHECK(path.find("johndoe") == std::string::npos);

    CHECK(ps.pseudonymize(std::string("johndoe"), "***") == "user01");
}

TEST_CASE("ports")
{
    auto ps = pseudonymizer::with_defaults();

    CHECK(ps.pseudonymize_port(8080) == 1000);
    CHECK(ps.pseudonymize_port(443) == 1001);
    CHECK(ps.pseudonymize_port(8080) == 1000);
    CHECK(ps.get_cache_size() == 0);

    ps.clear_cache();
    CHECK(ps.pseudonymize_port(443) == 1000);

    auto no_ports = build_ok(pseudonymizer::builder().scope(
        pseudonym::scope(true, true, true, true, false)));
    CHECK(no_ports.pseudonymize_port(8080) == 8080);
    CHECK_FALSE(no_ports.get_scope().should_pseudonymize_ports());
    CHECK(no_ports.get_scope().should_pseudonymize_paths());
}

TEST_CASE("stats")
{
    auto ps = pseudonymizer::with_defaults();

    ps.pseudonymize(std::string("a"), "***");
    ps.pseudonymize(std::string("b"), "***");
    ps.pseudonymize(std::string("a"), "***");
    CHECK(ps.get_stats()
          == "Pseudonymization: enabled, Cache size: 2 unique values");
}

TEST_CASE("seed derivation is reproducible")
{
    auto ps1 = build_ok(pseudonymizer::builder()
                            .mode(pseudonym::mode_type::REALISTIC)
                            .custom_prefix("{")
                            .custom_suffix("}"));
    auto ps2 = build_ok(pseudonymizer::builder()
                            .mode(pseudonym::mode_type::REALISTIC)
                            .custom_prefix("{")
                            .custom_suffix("}"));

    CHECK(ps1.pseudonymize(std::string("/home/zed/a"), "***")
          == ps2.pseudonymize(std::string("/home/zed/a"), "***"));
}

TEST_CASE("lenient enum parsing")
{
    CHECK(pseudonym::mode_from_str("Counter") == pseudonym::mode_type::COUNTER);
    CHECK(pseudonym::mode_from_str(" realistic ")
          == pseudonym::mode_type::REALISTIC);
    CHECK(pseudonym::mode_from_str("bogus") == pseudonym::mode_type::HASH);
    CHECK(pseudonym::format_from_str("HASH") == pseudonym::format_type::HASH);
    CHECK(pseudonym::format_from_str("??") == pseudonym::format_type::REDACTED);
    CHECK(pseudonym::algorithm_from_str("md5")
          == digest_algorithm_t::MD5);
    CHECK(pseudonym::algorithm_from_str("sha-512")
          == digest_algorithm_t::SHA256);
}

TEST_CASE("config layering")
{
    pseudonym::config parent;
    parent.c_replacements["alice"] = "parent_a";
    parent.c_replacements["bob"] = "parent_b";
    parent.c_seed = 7;

    pseudonym::config child;
    child.c_mode = pseudonym::mode_type::COUNTER;
    child.c_replacements["alice"] = "child_a";
    child.merge_with(parent);

    CHECK(child.c_replacements["alice"] == "child_a");
    CHECK(child.c_replacements["bob"] == "parent_b");
    CHECK(child.c_seed == uint64_t{7});

    auto ps = build_ok(pseudonymizer::builder(child));
    CHECK(ps.pseudonymize(std::string("bob"), "***") == "parent_b");
    CHECK(ps.pseudonymize(std::string("carol"), "***") == "<redacted:1>");
}
