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
 * @file pseudonymizer.cfg.hh
 */

#ifndef redact_pseudonymizer_cfg_hh
#define redact_pseudonymizer_cfg_hh

#include <map>
#include <optional>
#include <string>

#include <stdint.h>

#include "hasher.hh"

namespace redact::pseudonym {

enum class mode_type {
    HASH,
    COUNTER,
    REALISTIC,
};

enum class format_type {
    REDACTED,
    HASH,
    CUSTOM,
};

/**
 * Parse a mode name, ignoring case.  Unknown names map to HASH.
 */
mode_type mode_from_str(const std::string& str);

/**
 * Parse a format name, ignoring case.  Unknown names map to REDACTED.
 */
format_type format_from_str(const std::string& str);

/**
 * Parse a digest name like "SHA-256", "sha1" or "MD5".  Unknown names map to
 * SHA-256.
 */
digest_algorithm_t algorithm_from_str(const std::string& str);

const char* mode_name(mode_type mode);

/**
 * Which categories of fields should be pseudonymized at all.  The flags
 * are only consulted by callers, nothing here infers a category from a
 * value.
 */
class scope {
public:
    scope() = default;

    scope(bool properties, bool strings, bool network, bool paths, bool ports)
        : s_properties(properties), s_strings(strings), s_network(network),
          s_paths(paths), s_ports(ports)
    {
    }

    bool should_pseudonymize_properties() const { return this->s_properties; }
    bool should_pseudonymize_strings() const { return this->s_strings; }
    bool should_pseudonymize_network() const { return this->s_network; }
    bool should_pseudonymize_paths() const { return this->s_paths; }
    bool should_pseudonymize_ports() const { return this->s_ports; }

private:
    bool s_properties{true};
    bool s_strings{true};
    bool s_network{true};
    bool s_paths{true};
    bool s_ports{true};
};

struct config {
    bool c_enabled{true};
    mode_type c_mode{mode_type::HASH};
    format_type c_format{format_type::REDACTED};
    std::string c_custom_prefix{"<redacted:"};
    std::string c_custom_suffix{">"};
    int c_hash_length{8};
    digest_algorithm_t c_hash_algorithm{digest_algorithm_t::SHA256};
    scope c_scope;
    std::optional<uint64_t> c_seed;
    std::map<std::string, std::string> c_replacements;
    std::map<std::string, std::string> c_pattern_generators;

    /**
     * Layer this config over a parent.  Map entries from the parent are kept
     * unless this config has an entry with the same key.
     */
    void merge_with(const config& parent)
    {
        for (const auto& pair : parent.c_replacements) {
            this->c_replacements.emplace(pair);
        }
        for (const auto& pair : parent.c_pattern_generators) {
            this->c_pattern_generators.emplace(pair);
        }
        if (!this->c_seed) {
            this->c_seed = parent.c_seed;
        }
    }
};

}  // namespace redact::pseudonym

#endif
