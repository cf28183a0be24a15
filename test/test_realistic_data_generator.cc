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
 * @file test_realistic_data_generator.cc
 */

#include <algorithm>
#include <set>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "base/string_util.hh"
#include "doctest/doctest.h"
#include "fmt/format.h"
#include "realistic_data_generator.hh"

using redact::realistic_data_generator;

static constexpr uint64_t FIXED_SEED = 42;

static bool
is_first_name(const std::string& name)
{
    const auto& pool = realistic_data_generator::get_first_names();

    return std::find(pool.begin(), pool.end(), tolower(name)) != pool.end();
}

TEST_CASE("pools")
{
    CHECK(realistic_data_generator::get_first_names().size() == 26);
    CHECK(realistic_data_generator::get_tlds()
          == std::vector<std::string>{"com", "org", "net", "io"});
}

TEST_CASE("usernames")
{
    realistic_data_generator rdg(FIXED_SEED);

    CHECK(rdg.generate_username("johndoe") == "user01");
    CHECK(rdg.generate_username("janedoe") == "user02");
    CHECK(rdg.generate_username("john_doe") == "user_03");
    CHECK(rdg.generate_username("johndoe") == "user01");

    auto dotted = rdg.generate_username("john.doe");
    auto dot = dotted.find('.');
    REQUIRE(dot != std::string::npos);
    CHECK(is_first_name(dotted.substr(0, dot)));
    CHECK(rdg.generate_username("") == "");
}

TEST_CASE("emails")
{
    realistic_data_generator rdg(FIXED_SEED);

    auto email = rdg.generate_email("john.doe@corp.org");
    CHECK(endswith(email, ".org"));
    CHECK(email.find('@') != std::string::npos);
    CHECK(email != "john.doe@corp.org");
    CHECK(rdg.generate_email("john.doe@corp.org") == email);

    CHECK(endswith(rdg.generate_email("x@corp.internal"), ".com"));
    CHECK(rdg.generate_email("not-an-email") == "not-an-email");

    std::set<std::string> seen;
    for (int lpc = 0; lpc < 50; lpc++) {
        seen.emplace(rdg.generate_email(fmt::format("a.b{}@c.com", lpc)));
    }
    CHECK(seen.size() == 50);
}

TEST_CASE("home paths")
{
    realistic_data_generator rdg(FIXED_SEED);

    auto path = rdg.generate_path("/home/johndoe/documents");
    CHECK(startswith(path, "/home/"));
    CHECK(endswith(path, "/documents"));
    auto user = path.substr(6, path.size() - 6 - 10);
    CHECK(user != "johndoe");
    CHECK(is_first_name(user));

    auto mac = rdg.generate_path("/Users/johndoe/Library");
    CHECK(startswith(mac, "/Users/"));
    CHECK(endswith(mac, "/Library"));
    CHECK(mac.substr(7, mac.size() - 7 - 8) == user);

    auto win = rdg.generate_path("C:\\Users\\johndoe\\Desktop");
    CHECK(startswith(win, "C:\\Users\\"));
    CHECK(endswith(win, "\\Desktop"));
    CHECK(win.substr(9, win.size() - 9 - 8) == capitalize(user));

    CHECK(rdg.generate_path("/var/log/syslog") == "/var/log/syslog");
}

TEST_CASE("paths with embedded names")
{
    realistic_data_generator rdg(FIXED_SEED);

    auto path = rdg.generate_path("/srv/Alice-projects/readme");
    CHECK(path.find("Alice") == std::string::npos);
    CHECK(startswith(path, "/srv/"));
    CHECK(endswith(path, "-projects/readme"));
}

TEST_CASE("names inside longer words are not replaced")
{
    realistic_data_generator rdg(FIXED_SEED);

    CHECK(rdg.generate_path("/opt/development/app") == "/opt/development/app");
    CHECK(rdg.generate_path("/var/lib/bobcat") == "/var/lib/bobcat");

    auto path = rdg.generate_path("/data/eve/eve-backup");
    auto folder = rdg.generate_user_folder("eve");
    CHECK(path == "/data/" + folder + "/" + folder + "-backup");
}

TEST_CASE("user folders are unique")
{
    realistic_data_generator rdg(FIXED_SEED);
    std::set<std::string> seen;

    for (int lpc = 0; lpc < 60; lpc++) {
        seen.emplace(rdg.generate_user_folder(fmt::format("user{}", lpc)));
    }
    CHECK(seen.size() == 60);
}

TEST_CASE("replacement dispatch")
{
    realistic_data_generator rdg(FIXED_SEED);

    CHECK(rdg.generate_replacement("bob@example.com").find('@')
          != std::string::npos);
    CHECK(startswith(rdg.generate_replacement("/home/bob/x"), "/home/"));
    CHECK(startswith(rdg.generate_replacement("bob"), "user"));
}

TEST_CASE("same seed gives the same values")
{
    realistic_data_generator rdg1(FIXED_SEED);
    realistic_data_generator rdg2(FIXED_SEED);

    CHECK(rdg1.generate_path("/home/alice") == rdg2.generate_path("/home/alice"));
    CHECK(rdg1.generate_email("a@b.io") == rdg2.generate_email("a@b.io"));
}

TEST_CASE("clear_cache restarts")
{
    realistic_data_generator rdg(FIXED_SEED);

    auto before = rdg.generate_path("/home/alice");
    rdg.generate_username("x");
    rdg.clear_cache();
    CHECK(rdg.generate_path("/home/alice") == before);
    CHECK(rdg.generate_username("y") == "user01");
}
