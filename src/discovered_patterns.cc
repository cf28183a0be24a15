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
 * @file discovered_patterns.cc
 */

#include "discovered_patterns.hh"

#include "base/redact_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"

namespace redact {

const char*
pattern_type_name(pattern_type_t type)
{
    switch (type) {
        case pattern_type_t::USERNAME:
            return "USERNAME";
        case pattern_type_t::HOSTNAME:
            return "HOSTNAME";
        case pattern_type_t::EMAIL_LOCAL_PART:
            return "EMAIL_LOCAL_PART";
        case pattern_type_t::CUSTOM:
            break;
    }

    return "CUSTOM";
}

std::string
discovered_value::to_string() const
{
    const char* type_name = pattern_type_name(this->dv_type);

    if (this->dv_type == pattern_type_t::CUSTOM && this->dv_custom_type_name)
    {
        type_name = this->dv_custom_type_name->c_str();
    }

    return fmt::format(FMT_STRING("{} ({}, {} occurrences)"),
                       this->dv_value,
                       type_name,
                       this->dv_occurrences);
}

discovered_patterns::discovered_patterns(
    bool case_sensitive, const std::vector<std::string>& allowlist)
    : dp_case_sensitive(case_sensitive)
{
    for (const auto& value : allowlist) {
        this->dp_allowlist.emplace(this->normalize(value));
    }
}

std::string
discovered_patterns::normalize(const std::string& value) const
{
    if (this->dp_case_sensitive) {
        return value;
    }

    return tolower(value);
}

int
discovered_patterns::add_value(
    const std::string& value,
    pattern_type_t type,
    const std::optional<std::string>& custom_type_name)
{
    if (value.empty()) {
        return 0;
    }

    auto normalized = this->normalize(value);
    if (this->dp_allowlist.count(normalized) > 0) {
        return 0;
    }

    auto iter = this->dp_values.find(normalized);
    if (iter != this->dp_values.end()) {
        iter->second.dv_occurrences += 1;
        return iter->second.dv_occurrences;
    }

    log_trace("discovered new %s value of length %zu",
              pattern_type_name(type),
              value.size());
    this->dp_values.emplace(
        normalized, discovered_value{value, type, custom_type_name, 1});

    return 1;
}

std::vector<discovered_value>
discovered_patterns::get_values(int min_occurrences) const
{
    std::vector<discovered_value> retval;

    for (const auto& pair : this->dp_values) {
        if (pair.second.dv_occurrences >= min_occurrences) {
            retval.emplace_back(pair.second);
        }
    }

    return retval;
}

std::vector<discovered_value>
discovered_patterns::get_all_values() const
{
    return this->get_values(0);
}

bool
discovered_patterns::contains(const std::string& value) const
{
    return this->dp_values.count(this->normalize(value)) > 0;
}

std::optional<discovered_value>
discovered_patterns::get(const std::string& value) const
{
    auto iter = this->dp_values.find(this->normalize(value));
    if (iter == this->dp_values.end()) {
        return std::nullopt;
    }

    return iter->second;
}

std::map<pattern_type_t, int>
discovered_patterns::get_count_by_type(int min_occurrences) const
{
    std::map<pattern_type_t, int> retval;

    for (const auto& dv : this->get_values(min_occurrences)) {
        retval[dv.dv_type] += 1;
    }

    return retval;
}

size_t
discovered_patterns::get_total_count(int min_occurrences) const
{
    return this->get_values(min_occurrences).size();
}

void
discovered_patterns::merge(const discovered_patterns& other,
                           int min_occurrences)
{
    for (const auto& pair : other.dp_values) {
        if (pair.second.dv_occurrences < min_occurrences) {
            continue;
        }

        auto normalized = this->normalize(pair.second.dv_value);

        if (this->dp_allowlist.count(normalized) > 0) {
            continue;
        }

        auto iter = this->dp_values.find(normalized);
        if (iter != this->dp_values.end()) {
            iter->second.dv_occurrences += pair.second.dv_occurrences;
        } else {
            this->dp_values.emplace(normalized, pair.second);
        }
    }
}

}  // namespace redact
