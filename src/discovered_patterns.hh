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
 * @file discovered_patterns.hh
 */

#ifndef redact_discovered_patterns_hh
#define redact_discovered_patterns_hh

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace redact {

enum class pattern_type_t {
    USERNAME,
    HOSTNAME,
    EMAIL_LOCAL_PART,
    CUSTOM,
};

const char* pattern_type_name(pattern_type_t type);

struct discovered_value {
    std::string dv_value;
    pattern_type_t dv_type{pattern_type_t::CUSTOM};
    std::optional<std::string> dv_custom_type_name;
    int dv_occurrences{1};

    std::string to_string() const;
};

/**
 * The set of sensitive values found while scanning a source.  Values are
 * keyed by their normalized form, which is the lower-cased value when the
 * set is case-insensitive.  The first spelling seen for a key is the one
 * that is reported.
 *
 * Not thread-safe.  Use one set per shard and merge() them once the shards
 * are done.
 */
class discovered_patterns {
public:
    explicit discovered_patterns(bool case_sensitive,
                                 const std::vector<std::string>& allowlist
                                 = {});

    /**
     * Record an occurrence of a value.
     *
     * @return The number of times the value has been seen, including this
     *   one, or zero if the value is empty or allowlisted.
     */
    int add_value(const std::string& value,
                  pattern_type_t type,
                  const std::optional<std::string>& custom_type_name
                  = std::nullopt);

    std::vector<discovered_value> get_values(int min_occurrences) const;

    std::vector<discovered_value> get_all_values() const;

    bool contains(const std::string& value) const;

    std::optional<discovered_value> get(const std::string& value) const;

    std::map<pattern_type_t, int> get_count_by_type(int min_occurrences) const;

    size_t get_total_count(int min_occurrences) const;

    size_t get_total_count() const { return this->dp_values.size(); }

    /**
     * Fold the values from another set into this one, summing the
     * occurrences of values present in both.
     */
    void merge(const discovered_patterns& other) { this->merge(other, 0); }

    /**
     * Fold in only the values from the other set that were seen at least
     * min_occurrences times.
     */
    void merge(const discovered_patterns& other, int min_occurrences);

    /**
     * Forget every value.  The case sensitivity and allowlist are kept.
     */
    void clear() { this->dp_values.clear(); }

    bool is_case_sensitive() const { return this->dp_case_sensitive; }

private:
    std::string normalize(const std::string& value) const;

    bool dp_case_sensitive;
    std::set<std::string> dp_allowlist;
    std::map<std::string, discovered_value> dp_values;
};

}  // namespace redact

#endif
