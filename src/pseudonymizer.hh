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
 * @file pseudonymizer.hh
 */

#ifndef redact_pseudonymizer_hh
#define redact_pseudonymizer_hh

#include <map>
#include <optional>
#include <string>

#include <stdint.h>

#include "pattern_generator.hh"
#include "pseudonymizer.cfg.hh"
#include "realistic_data_generator.hh"
#include "result.h"
#include "robin_hood/robin_hood.h"

namespace redact {

/**
 * Turns a sensitive value into a consistent replacement.  The same value
 * always gets the same replacement from an instance until clear_cache() is
 * called.  Instances are not thread-safe, use one per worker.
 */
class pseudonymizer {
public:
    class builder {
    public:
        builder() = default;

        explicit builder(pseudonym::config cfg) : b_config(std::move(cfg)) {}

        builder& enabled(bool val)
        {
            this->b_config.c_enabled = val;
            return *this;
        }

        builder& mode(pseudonym::mode_type val)
        {
            this->b_config.c_mode = val;
            return *this;
        }

        builder& format(pseudonym::format_type val)
        {
            this->b_config.c_format = val;
            return *this;
        }

        builder& custom_prefix(std::string val)
        {
            this->b_config.c_custom_prefix = std::move(val);
            return *this;
        }

        builder& custom_suffix(std::string val)
        {
            this->b_config.c_custom_suffix = std::move(val);
            return *this;
        }

        builder& hash_length(int val)
        {
            this->b_config.c_hash_length = val;
            return *this;
        }

        builder& hash_algorithm(digest_algorithm_t val)
        {
            this->b_config.c_hash_algorithm = val;
            return *this;
        }

        builder& scope(pseudonym::scope val)
        {
            this->b_config.c_scope = val;
            return *this;
        }

        builder& seed(uint64_t val)
        {
            this->b_config.c_seed = val;
            return *this;
        }

        builder& custom_replacements(std::map<std::string, std::string> val)
        {
            this->b_config.c_replacements = std::move(val);
            return *this;
        }

        builder& add_replacement(const std::string& original,
                                 const std::string& replacement)
        {
            this->b_config.c_replacements[original] = replacement;
            return *this;
        }

        builder& pattern_generators(std::map<std::string, std::string> val)
        {
            this->b_config.c_pattern_generators = std::move(val);
            return *this;
        }

        builder& add_pattern_generator(const std::string& name,
                                       const std::string& regex)
        {
            this->b_config.c_pattern_generators[name] = regex;
            return *this;
        }

        Result<pseudonymizer, pattern_error> build() const;

    private:
        pseudonym::config b_config;
    };

    static pseudonymizer with_defaults();

    static pseudonymizer disabled();

    bool is_enabled() const { return this->p_config.c_enabled; }

    pseudonym::mode_type get_mode() const { return this->p_config.c_mode; }

    const pseudonym::scope& get_scope() const
    {
        return this->p_config.c_scope;
    }

    /**
     * @param value The sensitive value or nullopt if there is none.
     * @param fallback The text to return when pseudonymization is disabled
     *   or there is no value.
     */
    std::string pseudonymize(const std::optional<std::string>& value,
                             const std::string& fallback);

    /**
     * Like pseudonymize(), but use the named pattern generator to produce
     * the replacement, if there is one.
     */
    std::string pseudonymize_with_pattern(
        const std::optional<std::string>& value,
        const std::string& pattern_name,
        const std::string& fallback);

    int pseudonymize_port(int port);

    void clear_cache();

    size_t get_cache_size() const { return this->p_cache.size(); }

    std::string get_stats() const;

private:
    static constexpr int FIRST_COUNTER = 1;
    static constexpr int FIRST_PORT = 1000;

    pseudonymizer(pseudonym::config cfg,
                  uint64_t seed,
                  std::optional<pattern_generator> patterns);

    std::string generate(const std::string& value);

    std::string wrap(const std::string& body) const;

    pseudonym::config p_config;
    realistic_data_generator p_realistic;
    std::optional<pattern_generator> p_patterns;
    robin_hood::unordered_map<std::string, std::string> p_cache;
    robin_hood::unordered_map<int, int> p_port_cache;
    int p_counter{FIRST_COUNTER};
    int p_port_counter{FIRST_PORT};
};

}  // namespace redact

#endif
