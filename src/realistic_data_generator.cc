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
 * @file realistic_data_generator.cc
 */

#include <algorithm>

#include <ctype.h>

#include "realistic_data_generator.hh"

#include "base/redact_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"

namespace redact {

static constexpr size_t MAX_COMBINATION_ATTEMPTS = 64;

const std::vector<std::string>&
realistic_data_generator::get_first_names()
{
    static const std::vector<std::string> retval = {
        "alice", "bob",    "carol", "dave",  "eve",     "frank", "grace",
        "heidi", "ivan",   "judy",  "kevin", "laura",   "mike",  "nancy",
        "oscar", "peggy",  "quinn", "rachel", "steve",  "tina",  "ursula",
        "victor", "wendy", "xavier", "yvonne", "zoe",
    };

    return retval;
}

const std::vector<std::string>&
realistic_data_generator::get_last_names()
{
    static const std::vector<std::string> retval = {
        "smith",     "johnson",  "williams", "brown",    "jones",
        "garcia",    "miller",   "davis",    "rodriguez", "martinez",
        "hernandez", "lopez",    "gonzalez", "wilson",   "anderson",
        "thomas",    "taylor",   "moore",    "jackson",  "martin",
        "lee",       "perez",    "thompson",
    };

    return retval;
}

const std::vector<std::string>&
realistic_data_generator::get_companies()
{
    static const std::vector<std::string> retval = {
        "example",  "test",      "demo",       "sample",
        "acme",     "techcorp",  "datagroup",  "systems",
        "solutions", "industries", "services", "global",
    };

    return retval;
}

const std::vector<std::string>&
realistic_data_generator::get_tlds()
{
    static const std::vector<std::string> retval = {
        "com",
        "org",
        "net",
        "io",
    };

    return retval;
}

realistic_data_generator::realistic_data_generator(uint64_t seed)
    : rdg_seed(seed), rdg_random(seed)
{
    this->clear_cache();
}

const std::string&
realistic_data_generator::pick(const std::vector<std::string>& pool)
{
    return pool[this->rdg_random() % pool.size()];
}

std::string
realistic_data_generator::claim(used_t& used, const std::string& candidate)
{
    auto retval = candidate;

    for (uint32_t suffix = 2; used.count(retval) > 0; suffix++) {
        retval = fmt::format(FMT_STRING("{}{}"), candidate, suffix);
    }
    used.emplace(retval);

    return retval;
}

std::string
realistic_data_generator::generate_username(const std::string& original)
{
    if (original.empty()) {
        return original;
    }

    return this->get_default(
        this->rdg_user_names,
        original,
        [this](size_t, const std::string& in) {
            std::string candidate;

            if (in.find('.') != std::string::npos) {
                candidate = this->pick(get_first_names());
                candidate.push_back('.');
                candidate.append(this->pick(get_last_names()));
            } else if (in.find('_') != std::string::npos) {
                candidate = fmt::format(FMT_STRING("user_{:02}"),
                                        this->rdg_user_counter++);
            } else {
                candidate = fmt::format(FMT_STRING("user{:02}"),
                                        this->rdg_user_counter++);
            }

            return this->claim(this->rdg_used_user_names, candidate);
        });
}

std::string
realistic_data_generator::generate_email(const std::string& original)
{
    auto at_pos = original.rfind('@');

    if (original.empty() || at_pos == std::string::npos) {
        return original;
    }

    return this->get_default(
        this->rdg_emails,
        original,
        [this, at_pos](size_t, const std::string& in) {
            auto local_part = in.substr(0, at_pos);
            auto domain = in.substr(at_pos + 1);
            auto dot_pos = domain.rfind('.');
            std::string tld = "com";
            std::string local;

            if (dot_pos != std::string::npos) {
                auto orig_tld = tolower(domain.substr(dot_pos + 1));
                const auto& tlds = get_tlds();

                if (std::find(tlds.begin(), tlds.end(), orig_tld)
                    != tlds.end())
                {
                    tld = orig_tld;
                }
            }

            if (local_part.find('.') != std::string::npos) {
                local = this->pick(get_first_names());
                local.push_back('.');
                local.append(this->pick(get_last_names()));
            } else {
                local = fmt::format(FMT_STRING("{}{}"),
                                    this->pick(get_first_names()),
                                    this->rdg_email_counter++);
            }

            const auto& company = this->pick(get_companies());
            auto candidate
                = fmt::format(FMT_STRING("{}@{}.{}"), local, company, tld);
            for (uint32_t suffix = 2;
                 this->rdg_used_emails.count(candidate) > 0;
                 suffix++)
            {
                candidate = fmt::format(
                    FMT_STRING("{}{}@{}.{}"), local, suffix, company, tld);
            }
            this->rdg_used_emails.emplace(candidate);

            return candidate;
        });
}

std::string
realistic_data_generator::replace_home_segment(const std::string& original,
                                               size_t prefix_len,
                                               char sep,
                                               bool capitalized)
{
    auto seg_end = original.find(sep, prefix_len);

    if (seg_end == std::string::npos) {
        seg_end = original.size();
    }
    if (seg_end == prefix_len) {
        return original;
    }

    auto segment = original.substr(prefix_len, seg_end - prefix_len);
    auto folder = this->generate_user_folder(segment);
    if (capitalized) {
        folder = capitalize(folder);
    }

    return original.substr(0, prefix_len) + folder + original.substr(seg_end);
}

/**
 * Case-insensitive search for a word that is not part of a longer run of
 * letters and digits, so "eve" is found in "/srv/eve-data" but not in
 * "/opt/development".
 */
static size_t
find_word(const std::string& haystack, const std::string& word, size_t start)
{
    auto pos = ifind(haystack, word, start);

    while (pos != std::string::npos) {
        auto end = pos + word.size();

        if ((pos == 0 || !isalnum((unsigned char) haystack[pos - 1]))
            && (end == haystack.size()
                || !isalnum((unsigned char) haystack[end])))
        {
            return pos;
        }
        pos = ifind(haystack, word, pos + 1);
    }

    return std::string::npos;
}

std::string
realistic_data_generator::generate_path(const std::string& original)
{
    if (original.empty()) {
        return original;
    }

    auto iter = this->rdg_paths.find(original);
    if (iter != this->rdg_paths.end()) {
        return iter->second;
    }

    static const std::string WIN_USERS = "c:\\users\\";
    std::string retval;

    if (startswith(original, "/home/")) {
        retval = this->replace_home_segment(original, 6, '/', false);
    } else if (startswith(original, "/Users/")) {
        retval = this->replace_home_segment(original, 7, '/', false);
    } else if (original.size() > WIN_USERS.size()
               && tolower(original.substr(0, WIN_USERS.size())) == WIN_USERS)
    {
        retval = this->replace_home_segment(
            original, WIN_USERS.size(), '\\', true);
    } else {
        retval = original;
        for (const auto& name : get_first_names()) {
            auto pos = find_word(retval, name, 0);

            if (pos == std::string::npos) {
                continue;
            }

            auto folder
                = this->generate_user_folder(retval.substr(pos, name.size()));
            while (pos != std::string::npos) {
                retval.replace(pos, name.size(), folder);
                pos = find_word(retval, name, pos + folder.size());
            }
            break;
        }
    }

    this->rdg_paths.emplace(original, retval);

    return retval;
}

std::string
realistic_data_generator::generate_user_folder(const std::string& original)
{
    if (original.empty()) {
        return original;
    }

    return this->get_default(
        this->rdg_user_folders,
        original,
        [this](size_t, const std::string&) {
            if (this->rdg_folder_cursor < this->rdg_folder_order.size()) {
                auto retval
                    = this->rdg_folder_order[this->rdg_folder_cursor++];

                this->rdg_used_folders.emplace(retval);
                return retval;
            }

            if (this->rdg_folder_cursor == this->rdg_folder_order.size()) {
                log_debug("user folder pool of %zu names is exhausted, "
                          "combining names",
                          this->rdg_folder_order.size());
                this->rdg_folder_cursor += 1;
            }
            for (size_t attempt = 0; attempt < MAX_COMBINATION_ATTEMPTS;
                 attempt++)
            {
                auto candidate = this->pick(get_first_names())
                    + this->pick(get_first_names());

                if (this->rdg_used_folders.count(candidate) == 0) {
                    this->rdg_used_folders.emplace(candidate);
                    return candidate;
                }
            }

            return this->claim(this->rdg_used_folders,
                               this->pick(get_first_names()));
        });
}

std::string
realistic_data_generator::generate_replacement(const std::string& original)
{
    if (original.find('@') != std::string::npos
        && original.find('.') != std::string::npos)
    {
        return this->generate_email(original);
    }
    if (original.find('/') != std::string::npos
        || original.find('\\') != std::string::npos)
    {
        return this->generate_path(original);
    }

    return this->generate_username(original);
}

void
realistic_data_generator::clear_cache()
{
    this->rdg_user_names.clear();
    this->rdg_emails.clear();
    this->rdg_paths.clear();
    this->rdg_user_folders.clear();
    this->rdg_used_user_names.clear();
    this->rdg_used_emails.clear();
    this->rdg_used_folders.clear();
    this->rdg_user_counter = 1;
    this->rdg_email_counter = 1;
    this->rdg_folder_cursor = 0;

    this->rdg_random.seed(this->rdg_seed);
    this->rdg_folder_order = get_first_names();
    std::shuffle(this->rdg_folder_order.begin(),
                 this->rdg_folder_order.end(),
                 this->rdg_random);
}

}  // namespace redact
