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
 * @file pattern_discovery.hh
 */

#ifndef redact_pattern_discovery_hh
#define redact_pattern_discovery_hh

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "discovered_patterns.hh"
#include "discovery.cfg.hh"
#include "pcrepp/pcre2pp.hh"
#include "result.h"

namespace redact {

/**
 * Runs the extraction rules from a discovery config over text lines and
 * records.  Each rule accumulates into its own set of discovered values so
 * that the rule's case sensitivity, whitelist and minimum occurrence count
 * can be applied independently.
 */
class pattern_discovery {
public:
    using fields_t = std::map<std::string, std::string>;

    static Result<pattern_discovery, discovery::rule_error> create(
        const discovery::config& cfg);

    /**
     * Apply every text rule to the given line.
     */
    void analyze_line(const std::string& line);

    /**
     * Apply every property rule to the string fields of a record.
     *
     * @param event_type The type name of the record, checked against the
     *   rule's event type filter.
     * @param fields The record's string fields, keyed by field name.
     */
    void analyze_properties(const std::string& event_type,
                            const fields_t& fields);

    /**
     * @return The values from all rules that were seen at least as often as
     *   their rule requires, combined into one case-insensitive set.
     */
    discovered_patterns get_discovered_patterns() const;

    std::string get_statistics() const;

    /**
     * Drop every value recorded so far.  The rules are kept.
     */
    void clear();

    size_t get_rule_count() const
    {
        return this->pd_line_rules.size() + this->pd_property_rules.size();
    }

    /**
     * @return A counter that changes whenever the set of values returned by
     *   get_discovered_patterns() changes, that is when a value first reaches
     *   its rule's minimum occurrence count or the values are cleared.
     */
    size_t get_generation() const { return this->pd_generation; }

private:
    struct line_rule {
        std::string lr_name;
        pattern_type_t lr_type;
        std::shared_ptr<pcre2pp::code> lr_regex;
        int lr_capture_group;
        int lr_min_occurrences;
        std::vector<std::string> lr_ignore_exact;
        std::vector<std::shared_ptr<pcre2pp::code>> lr_ignore;
        discovered_patterns lr_values;

        bool should_ignore(const std::string& value) const;
    };

    struct property_rule {
        std::string pr_name;
        pattern_type_t pr_type;
        std::shared_ptr<pcre2pp::code> pr_key_regex;
        std::string pr_key_property;
        std::shared_ptr<pcre2pp::code> pr_value_regex;
        std::string pr_value_property;
        std::shared_ptr<pcre2pp::code> pr_event_type_filter;
        int pr_min_occurrences;
        std::vector<std::string> pr_whitelist;
        discovered_patterns pr_values;

        bool is_whitelisted(const std::string& value) const;

        /**
         * @return True if this occurrence brought the value up to the
         *   rule's minimum occurrence count.
         */
        bool add_value(const std::string& value);
    };

    pattern_discovery() = default;

    std::vector<line_rule> pd_line_rules;
    std::vector<property_rule> pd_property_rules;
    size_t pd_generation{0};
};

}  // namespace redact

#endif
