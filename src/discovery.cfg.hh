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
 * @file discovery.cfg.hh
 */

#ifndef redact_discovery_cfg_hh
#define redact_discovery_cfg_hh

#include <string>
#include <vector>

#include "discovered_patterns.hh"

namespace redact::discovery {

enum class mode_type {
    NONE,
    FAST,
    TWO_PASS,
};

/**
 * Parse a discovery mode name: "none", "fast" or "default".  Unknown names
 * map to TWO_PASS.
 */
mode_type mode_from_str(const std::string& str);

const char* mode_name(mode_type mode);

/**
 * Parse a pattern type name, ignoring case.  Unknown names map to CUSTOM.
 */
pattern_type_t type_from_str(const std::string& str);

/**
 * A rule that pulls sensitive values out of free text.
 */
struct custom_extraction {
    std::string cx_name;
    std::string cx_description;
    std::string cx_pattern;
    int cx_capture_group{0};
    pattern_type_t cx_type{pattern_type_t::CUSTOM};
    bool cx_case_sensitive{false};
    int cx_min_occurrences{1};
    std::vector<std::string> cx_whitelist;
    std::vector<std::string> cx_ignore_exact;
    std::vector<std::string> cx_ignore;
    bool cx_enabled{true};
};

/**
 * A rule that pulls sensitive values out of the named fields of a record.
 * The value of a field whose name matches the key pattern is taken as is.
 * For records that store a key and a value in two fields, the names of
 * those fields are given by px_key_property and px_value_property.
 */
struct property_extraction {
    std::string px_name;
    std::string px_description;
    std::string px_key_pattern;
    std::string px_key_property{"key"};
    std::string px_value_pattern{".*"};
    std::string px_value_property{"value"};
    std::string px_event_type_filter;
    pattern_type_t px_type{pattern_type_t::CUSTOM};
    bool px_case_sensitive{false};
    int px_min_occurrences{1};
    std::vector<std::string> px_whitelist;
    bool px_enabled{true};
};

inline custom_extraction
email_extraction()
{
    custom_extraction retval;

    retval.cx_name = "email";
    retval.cx_pattern = "([a-zA-Z0-9._%+-]+)@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}";
    retval.cx_capture_group = 1;
    retval.cx_type = pattern_type_t::EMAIL_LOCAL_PART;

    return retval;
}

struct config {
    mode_type c_mode{mode_type::TWO_PASS};
    std::vector<custom_extraction> c_custom_extractions;
    std::vector<property_extraction> c_property_extractions;

    bool is_enabled() const { return this->c_mode != mode_type::NONE; }

    void set_min_occurrences(int min_occurrences)
    {
        for (auto& cx : this->c_custom_extractions) {
            cx.cx_min_occurrences = min_occurrences;
        }
        for (auto& px : this->c_property_extractions) {
            px.px_min_occurrences = min_occurrences;
        }
    }

    void set_case_sensitive(bool case_sensitive)
    {
        for (auto& cx : this->c_custom_extractions) {
            cx.cx_case_sensitive = case_sensitive;
        }
        for (auto& px : this->c_property_extractions) {
            px.px_case_sensitive = case_sensitive;
        }
    }
};

struct rule_error {
    std::string re_rule;
    std::string re_pattern;
    std::string re_message;
    size_t re_offset{0};

    std::string get_message() const;
};

}  // namespace redact::discovery

#endif
