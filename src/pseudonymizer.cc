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
 * @file pseudonymizer.cc
 */

#include <algorithm>

#include "pseudonymizer.hh"

#include "base/redact_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"
#include "hasher.hh"

namespace redact {

namespace pseudonym {

mode_type
mode_from_str(const std::string& str)
{
    auto lower = tolower(trim(str));

    if (lower == "counter") {
        return mode_type::COUNTER;
    }
    if (lower == "realistic") {
        return mode_type::REALISTIC;
    }
    if (lower != "hash") {
        log_warning("unknown pseudonymization mode '%s', using hash",
                    str.c_str());
    }

    return mode_type::HASH;
}

format_type
format_from_str(const std::string& str)
{
    auto lower = tolower(trim(str));

    if (lower == "hash") {
        return format_type::HASH;
    }
    if (lower == "custom") {
        return format_type::CUSTOM;
    }
    if (lower != "redacted") {
        log_warning("unknown pseudonymization format '%s', using redacted",
                    str.c_str());
    }

    return format_type::REDACTED;
}

digest_algorithm_t
algorithm_from_str(const std::string& str)
{
    auto upper = toupper(trim(str));

    upper.erase(std::remove(upper.begin(), upper.end(), '-'), upper.end());
    if (upper == "SHA1") {
        return digest_algorithm_t::SHA1;
    }
    if (upper == "MD5") {
        return digest_algorithm_t::MD5;
    }
    if (upper != "SHA256") {
        log_warning("unsupported hash algorithm '%s', using SHA-256",
                    str.c_str());
    }

    return digest_algorithm_t::SHA256;
}

const char*
mode_name(mode_type mode)
{
    switch (mode) {
        case mode_type::COUNTER:
            return "counter";
        case mode_type::REALISTIC:
            return "realistic";
        case mode_type::HASH:
            break;
    }

    return "hash";
}

}  // namespace pseudonym

static constexpr int MIN_HASH_LENGTH = 6;
static constexpr int MAX_HASH_LENGTH = 32;

Result<pseudonymizer, pattern_error>
pseudonymizer::builder::build() const
{
    auto cfg = this->b_config;

    cfg.c_hash_length = std::clamp(
        cfg.c_hash_length, MIN_HASH_LENGTH, MAX_HASH_LENGTH);

    // derive the seed from the decoration so runs are reproducible
    auto seed = cfg.c_seed.value_or(hasher()
                                        .update(cfg.c_custom_prefix)
                                        .update(cfg.c_custom_suffix)
                                        .to_uint64());

    std::optional<pattern_generator> patterns;
    if (!cfg.c_pattern_generators.empty()) {
        auto gen = TRY(pattern_generator::create(cfg.c_pattern_generators,
                                                 seed));

        patterns = std::move(gen);
    }

    return Ok(pseudonymizer{std::move(cfg), seed, std::move(patterns)});
}

pseudonymizer
pseudonymizer::with_defaults()
{
    return builder().build().unwrap();
}

pseudonymizer
pseudonymizer::disabled()
{
    return builder().enabled(false).build().unwrap();
}

pseudonymizer::pseudonymizer(pseudonym::config cfg,
                             uint64_t seed,
                             std::optional<pattern_generator> patterns)
    : p_config(std::move(cfg)), p_realistic(seed),
      p_patterns(std::move(patterns))
{
    log_debug("pseudonymizer: enabled=%d; mode=%s; replacements=%zu; "
              "patterns=%zu",
              this->p_config.c_enabled,
              pseudonym::mode_name(this->p_config.c_mode),
              this->p_config.c_replacements.size(),
              this->p_config.c_pattern_generators.size());
}

std::string
pseudonymizer::wrap(const std::string& body) const
{
    switch (this->p_config.c_format) {
        case pseudonym::format_type::HASH:
            return fmt::format(FMT_STRING("<hash:{}>"), body);
        case pseudonym::format_type::CUSTOM:
            return fmt::format(FMT_STRING("{}{}{}"),
                               this->p_config.c_custom_prefix,
                               body,
                               this->p_config.c_custom_suffix);
        case pseudonym::format_type::REDACTED:
            break;
    }

    return fmt::format(FMT_STRING("<redacted:{}>"), body);
}

std::string
pseudonymizer::generate(const std::string& value)
{
    switch (this->p_config.c_mode) {
        case pseudonym::mode_type::REALISTIC:
            return this->p_realistic.generate_replacement(value);
        case pseudonym::mode_type::COUNTER:
            return this->wrap(fmt::to_string(this->p_counter++));
        case pseudonym::mode_type::HASH:
            break;
    }

    auto digest
        = hasher(this->p_config.c_hash_algorithm).update(value).to_string();

    return this->wrap(digest.substr(0, this->p_config.c_hash_length));
}

std::string
pseudonymizer::pseudonymize(const std::optional<std::string>& value,
                            const std::string& fallback)
{
    if (!this->p_config.c_enabled || !value) {
        return fallback;
    }

    auto iter = this->p_cache.find(value.value());
    if (iter != this->p_cache.end()) {
        return iter->second;
    }

    std::string retval;
    auto repl_iter = this->p_config.c_replacements.find(value.value());
    if (repl_iter != this->p_config.c_replacements.end()) {
        log_debug("using custom replacement for value of length %zu",
                  value->size());
        retval = repl_iter->second;
    } else {
        retval = this->generate(value.value());
        log_trace("generated pseudonym for value of length %zu; cache=%zu",
                  value->size(),
                  this->p_cache.size() + 1);
    }
    this->p_cache.emplace(value.value(), retval);

    return retval;
}

std::string
pseudonymizer::pseudonymize_with_pattern(
    const std::optional<std::string>& value,
    const std::string& pattern_name,
    const std::string& fallback)
{
    if (!this->p_config.c_enabled || !value) {
        return fallback;
    }

    if (this->p_config.c_replacements.count(value.value()) > 0
        || !this->p_patterns || !this->p_patterns->has_pattern(pattern_name))
    {
        return this->pseudonymize(value, fallback);
    }

    auto iter = this->p_cache.find(value.value());
    if (iter != this->p_cache.end()) {
        return iter->second;
    }

    auto gen = this->p_patterns->generate(pattern_name, value.value());
    if (!gen) {
        return this->pseudonymize(value, fallback);
    }

    this->p_cache.emplace(value.value(), gen.value());

    return gen.value();
}

int
pseudonymizer::pseudonymize_port(int port)
{
    if (!this->p_config.c_enabled
        || !this->p_config.c_scope.should_pseudonymize_ports())
    {
        return port;
    }

    auto iter = this->p_port_cache.find(port);
    if (iter != this->p_port_cache.end()) {
        return iter->second;
    }

    auto retval = this->p_port_counter++;
    this->p_port_cache.emplace(port, retval);
    log_trace("assigned port %d", retval);

    return retval;
}

void
pseudonymizer::clear_cache()
{
    log_debug("clearing pseudonym cache: values=%zu; ports=%zu",
              this->p_cache.size(),
              this->p_port_cache.size());

    this->p_cache.clear();
    this->p_port_cache.clear();
    this->p_counter = FIRST_COUNTER;
    this->p_port_counter = FIRST_PORT;
}

std::string
pseudonymizer::get_stats() const
{
    return fmt::format(
        FMT_STRING("Pseudonymization: {}, Cache size: {} unique values"),
        this->p_config.c_enabled ? "enabled" : "disabled",
        this->p_cache.size());
}

}  // namespace redact
