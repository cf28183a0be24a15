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
 * @file test_discovered_patterns.cc
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "discovered_patterns.hh"
#include "doctest/doctest.h"

using redact::discovered_patterns;
using redact::pattern_type_t;

TEST_CASE("case-insensitive values are folded")
{
    discovered_patterns dp(false);

    dp.add_value("Bob", pattern_type_t::USERNAME);
    dp.add_value("bob", pattern_type_t::USERNAME);

    CHECK(dp.get_total_count() == 1);
    auto dv = dp.get("BOB");
    REQUIRE(dv);
    CHECK(dv->dv_occurrences == 2);
    CHECK(dv->dv_value == "Bob");
    CHECK(dp.contains("bOb"));
    CHECK_FALSE(dp.is_case_sensitive());
}

TEST_CASE("case-sensitive values are kept apart")
{
    discovered_patterns dp(true);

    dp.add_value("Bob", pattern_type_t::USERNAME);
    dp.add_value("bob", pattern_type_t::USERNAME);

    CHECK(dp.get_total_count() == 2);
    CHECK_FALSE(dp.contains("BOB"));
}

TEST_CASE("empty and allowlisted values are ignored")
{
    discovered_patterns dp(false, {"Root", "admin"});

    dp.add_value("", pattern_type_t::USERNAME);
    dp.add_value("root", pattern_type_t::USERNAME);
    dp.add_value("ADMIN", pattern_type_t::USERNAME);
    dp.add_value("carol", pattern_type_t::USERNAME);

    CHECK(dp.get_total_count() == 1);
    CHECK(dp.contains("carol"));
}

TEST_CASE("minimum occurrences")
{
    discovered_patterns dp(false);

    dp.add_value("often", pattern_type_t::HOSTNAME);
    dp.add_value("often", pattern_type_t::HOSTNAME);
    dp.add_value("often", pattern_type_t::HOSTNAME);
    dp.add_value("rare", pattern_type_t::HOSTNAME);
    dp.add_value("ticket-1", pattern_type_t::CUSTOM, std::string("ticket"));

    CHECK(dp.get_values(1).size() == 3);
    CHECK(dp.get_all_values().size() == 3);
    auto frequent = dp.get_values(3);
    REQUIRE(frequent.size() == 1);
    CHECK(frequent[0].dv_value == "often");
    CHECK(dp.get_total_count(2) == 1);

    auto by_type = dp.get_count_by_type(1);
    CHECK(by_type[pattern_type_t::HOSTNAME] == 2);
    CHECK(by_type[pattern_type_t::CUSTOM] == 1);
    CHECK(dp.get_count_by_type(3).count(pattern_type_t::CUSTOM) == 0);
}

TEST_CASE("to_string")
{
    discovered_patterns dp(false);

    dp.add_value("alice", pattern_type_t::USERNAME);
    dp.add_value("T-1", pattern_type_t::CUSTOM, std::string("ticket"));

    CHECK(dp.get("alice")->to_string() == "alice (USERNAME, 1 occurrences)");
    CHECK(dp.get("t-1")->to_string() == "T-1 (ticket, 1 occurrences)");
}

TEST_CASE("merge sums occurrences")
{
    discovered_patterns shard1(false);
    discovered_patterns shard2(false);

    shard1.add_value("Alice", pattern_type_t::USERNAME);
    shard2.add_value("alice", pattern_type_t::USERNAME);
    shard2.add_value("alice", pattern_type_t::USERNAME);
    shard2.add_value("Dave", pattern_type_t::USERNAME);

    shard1.merge(shard2);
    CHECK(shard1.get_total_count() == 2);
    CHECK(shard1.get("alice")->dv_occurrences == 3);
    CHECK(shard1.get("alice")->dv_value == "Alice");
    CHECK(shard1.get("dave")->dv_value == "Dave");
    CHECK(shard2.get_total_count() == 2);
}

TEST_CASE("merge respects the receiver's allowlist")
{
    discovered_patterns dest(false, {"root"});
    discovered_patterns src(false);

    src.add_value("ROOT", pattern_type_t::USERNAME);
    src.add_value("eve", pattern_type_t::USERNAME);
    dest.merge(src);

    CHECK(dest.get_total_count() == 1);
    CHECK_FALSE(dest.contains("root"));
}

TEST_CASE("add_value reports the occurrence count")
{
    discovered_patterns dp(false, {"root"});

    CHECK(dp.add_value("Bob", pattern_type_t::USERNAME) == 1);
    CHECK(dp.add_value("bob", pattern_type_t::USERNAME) == 2);
    CHECK(dp.add_value("root", pattern_type_t::USERNAME) == 0);
    CHECK(dp.add_value("", pattern_type_t::USERNAME) == 0);
}

TEST_CASE("merge with a minimum occurrence count")
{
    discovered_patterns dest(false);
    discovered_patterns src(true);

    src.add_value("carol", pattern_type_t::USERNAME);
    src.add_value("carol", pattern_type_t::USERNAME);
    src.add_value("Carol", pattern_type_t::USERNAME);
    src.add_value("Carol", pattern_type_t::USERNAME);
    src.add_value("frank", pattern_type_t::USERNAME);
    dest.merge(src, 2);

    CHECK(dest.get_total_count() == 1);
    CHECK(dest.get("CAROL")->dv_occurrences == 4);
    CHECK_FALSE(dest.contains("frank"));

    dest.clear();
    CHECK(dest.get_total_count() == 0);
    dest.add_value("frank", pattern_type_t::USERNAME);
    CHECK_FALSE(dest.is_case_sensitive());
    CHECK(dest.contains("FRANK"));
}
