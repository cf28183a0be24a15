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
 * @file pattern_generator.hh
 */

#ifndef redact_pattern_generator_hh
#define redact_pattern_generator_hh

#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <stdint.h>

#include "regex_enum.hh"
#include "result.h"
#include "robin_hood/robin_hood.h"

namespace redact {

struct pattern_error {
    std::string pe_name;
    std::string pe_pattern;
    std::string pe_message;
    size_t pe_offset{0};

    std::string get_message() const;
};

/**
 * Generates replacement values that match a named regular expression.
 *
 * In the deterministic mode, the replacement for an input is chosen by
 * hashing the seed, pattern name and input into the pattern's enumeration.
 * Indexes already handed out are skipped so that distinct inputs get
 * distinct outputs until the enumeration runs dry.  At that point, a new
 * cycle starts and earlier outputs can be reused, while inputs that were
 * already seen keep their cached output.
 */
class pattern_generator {
public:
    static constexpr uint64_t MIN_RECOMMENDED_CARDINALITY = 100;

    /**
     * Expand the {users}, {names} and {emails} placeholders into
     * alternations over the realistic name pools.
     */
    static std::string expand_placeholders(const std::string& regex);

    static Result<pattern_generator, pattern_error> create(
        const std::map<std::string, std::string>& patterns, uint64_t seed);

    std::optional<std::string> generate(const std::string& name,
                                        const std::string& original);

    std::optional<std::string> generate_random(const std::string& name);

    bool has_pattern(const std::string& name) const
    {
        return this->pg_patterns.count(name) > 0;
    }

    std::vector<std::string> get_pattern_names() const;

    std::optional<std::string> get_pattern(const std::string& name) const;

    /**
     * @return The number of distinct values the pattern can produce.
     */
    std::optional<uint64_t> get_cardinality(const std::string& name) const;

    void clear_pattern_cache(const std::string& name);

    void clear_all_caches();

    size_t get_cache_size(const std::string& name) const;

private:
    struct pattern_state {
        std::string ps_regex;
        regex_enum ps_enum;
        robin_hood::unordered_map<std::string, std::string> ps_cache;
        robin_hood::unordered_set<uint64_t> ps_used_indexes;
        robin_hood::unordered_set<std::string> ps_emitted;
        uint32_t ps_cycle{0};

        void reset()
        {
            this->ps_cache.clear();
            this->ps_used_indexes.clear();
            this->ps_emitted.clear();
            this->ps_cycle = 0;
        }

        void start_cycle()
        {
            this->ps_used_indexes.clear();
            this->ps_emitted.clear();
            this->ps_cycle += 1;
        }
    };

    pattern_generator(std::map<std::string, pattern_state> patterns,
                      uint64_t seed)
        : pg_patterns(std::move(patterns)), pg_seed(seed), pg_random(seed)
    {
    }

    uint64_t hash_input(const std::string& name,
                        const std::string& original) const;

    std::map<std::string, pattern_state> pg_patterns;
    uint64_t pg_seed;
    std::mt19937_64 pg_random;
};

}  // namespace redact

#endif
