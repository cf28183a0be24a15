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
 * @file pattern_generator.cc
 */

#include <algorithm>

#include "pattern_generator.hh"

#include "base/redact_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"
#include "hasher.hh"
#include "pcrepp/pcre2pp.hh"
#include "realistic_data_generator.hh"

namespace redact {

static constexpr uint64_t MAX_PROBES = 4096;

static std::string
to_alternation(const std::vector<std::string>& pool)
{
    std::string retval = "(";

    for (const auto& item : pool) {
        if (retval.size() > 1) {
            retval.push_back('|');
        }
        retval.append(pcre2pp::quote(item));
    }
    retval.push_back(')');

    return retval;
}

std::string
pattern_error::get_message() const
{
    return fmt::format(FMT_STRING("invalid pattern for '{}' at offset {}: {}"),
                       this->pe_name,
                       this->pe_offset,
                       this->pe_message);
}

std::string
pattern_generator::expand_placeholders(const std::string& regex)
{
    static const auto USERS
        = to_alternation(realistic_data_generator::get_first_names());
    static const auto NAMES = USERS + "\\."
        + to_alternation(realistic_data_generator::get_last_names());
    static const auto EMAILS = NAMES + "@"
        + to_alternation({"example", "test", "demo", "sample"}) + "\\."
        + to_alternation(realistic_data_generator::get_tlds());

    auto retval = regex;

    replace_all(retval, "{users}", USERS);
    replace_all(retval, "{names}", NAMES);
    replace_all(retval, "{emails}", EMAILS);

    return retval;
}

Result<pattern_generator, pattern_error>
pattern_generator::create(const std::map<std::string, std::string>& patterns,
                          uint64_t seed)
{
    std::map<std::string, pattern_state> states;

    for (const auto& pair : patterns) {
        auto expanded = expand_placeholders(pair.second);
        auto compile_res
            = pcre2pp::code::from(string_fragment::from_str(expanded));

        if (compile_res.isErr()) {
            auto ce = compile_res.unwrapErr();

            log_error("pattern '%s' does not compile: %s",
                      pair.first.c_str(),
                      ce.get_message().c_str());
            return Err(pattern_error{
                pair.first,
                pair.second,
                ce.get_message(),
                ce.ce_offset,
            });
        }

        auto parse_res
            = regex_enum::parse(string_fragment::from_str(expanded));
        if (parse_res.isErr()) {
            auto pe = parse_res.unwrapErr();

            log_error("pattern '%s' cannot be used for generation: %s",
                      pair.first.c_str(),
                      pe.pe_message.c_str());
            return Err(pattern_error{
                pair.first,
                pair.second,
                pe.pe_message,
                pe.pe_offset,
            });
        }

        auto en = parse_res.unwrap();
        if (!en.is_empty_pattern()
            && en.get_cardinality() < MIN_RECOMMENDED_CARDINALITY)
        {
            log_debug("pattern '%s' only has %llu values, outputs will "
                      "repeat once they are used up",
                      pair.first.c_str(),
                      (unsigned long long) en.get_cardinality());
        }

        states.emplace(pair.first, pattern_state{pair.second, std::move(en)});
    }

    log_info("loaded %zu generator patterns", states.size());

    return Ok(pattern_generator{std::move(states), seed});
}

uint64_t
pattern_generator::hash_input(const std::string& name,
                              const std::string& original) const
{
    return hasher()
        .update((int64_t) this->pg_seed)
        .update(name)
        .update("\0", 1)
        .update(original)
        .to_uint64();
}

std::optional<std::string>
pattern_generator::generate(const std::string& name,
                            const std::string& original)
{
    auto iter = this->pg_patterns.find(name);
    if (iter == this->pg_patterns.end()) {
        return std::nullopt;
    }

    auto& state = iter->second;
    if (state.ps_enum.is_empty_pattern()) {
        return std::string();
    }

    auto cache_iter = state.ps_cache.find(original);
    if (cache_iter != state.ps_cache.end()) {
        return cache_iter->second;
    }

    const auto card = state.ps_enum.get_cardinality();
    const auto hash = this->hash_input(name, original);
    auto index = hash % card;
    std::optional<std::string> candidate;

    if (state.ps_used_indexes.size() < card) {
        const auto max_probes = std::min(card, MAX_PROBES);

        for (uint64_t probe = 0; probe < max_probes; probe++) {
            if (state.ps_used_indexes.count(index) == 0) {
                auto value = state.ps_enum.decode(index);

                if (state.ps_emitted.count(value) == 0) {
                    candidate = std::move(value);
                    break;
                }
                // a different index already produced this string
                state.ps_used_indexes.emplace(index);
            }
            index = (index + 1) % card;
        }
    }

    if (!candidate) {
        log_warning("all %llu values of pattern '%s' have been used, "
                    "starting cycle %u",
                    (unsigned long long) card,
                    name.c_str(),
                    state.ps_cycle + 1);
        state.start_cycle();
        index = hash % card;
        candidate = state.ps_enum.decode(index);
    }

    state.ps_used_indexes.emplace(index);
    state.ps_emitted.emplace(candidate.value());
    state.ps_cache.emplace(original, candidate.value());

    return candidate;
}

std::optional<std::string>
pattern_generator::generate_random(const std::string& name)
{
    auto iter = this->pg_patterns.find(name);
    if (iter == this->pg_patterns.end()) {
        return std::nullopt;
    }

    const auto& en = iter->second.ps_enum;

    return en.decode(this->pg_random() % en.get_cardinality());
}

std::vector<std::string>
pattern_generator::get_pattern_names() const
{
    std::vector<std::string> retval;

    for (const auto& pair : this->pg_patterns) {
        retval.emplace_back(pair.first);
    }

    return retval;
}

std::optional<std::string>
pattern_generator::get_pattern(const std::string& name) const
{
    auto iter = this->pg_patterns.find(name);
    if (iter == this->pg_patterns.end()) {
        return std::nullopt;
    }

    return iter->second.ps_regex;
}

std::optional<uint64_t>
pattern_generator::get_cardinality(const std::string& name) const
{
    auto iter = this->pg_patterns.find(name);
    if (iter == this->pg_patterns.end()) {
        return std::nullopt;
    }

    return iter->second.ps_enum.get_cardinality();
}

void
pattern_generator::clear_pattern_cache(const std::string& name)
{
    auto iter = this->pg_patterns.find(name);
    if (iter != this->pg_patterns.end()) {
        iter->second.reset();
    }
}

void
pattern_generator::clear_all_caches()
{
    for (auto& pair : this->pg_patterns) {
        pair.second.reset();
    }
}

size_t
pattern_generator::get_cache_size(const std::string& name) const
{
    auto iter = this->pg_patterns.find(name);
    if (iter == this->pg_patterns.end()) {
        return 0;
    }

    return iter->second.ps_cache.size();
}

}  // namespace redact
