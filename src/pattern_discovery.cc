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
 * @file pattern_discovery.cc
 */

#include <algorithm>

#include "pattern_discovery.hh"

#include "base/redact_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"

namespace redact {

namespace discovery {

mode_type
mode_from_str(const std::string& str)
{
    auto lower = tolower(trim(str));

    if (lower == "none") {
        return mode_type::NONE;
    }
    if (lower == "fast") {
        return mode_type::FAST;
    }
    if (lower != "default" && lower != "two_pass") {
        log_warning("unknown discovery mode '%s', using default",
                    str.c_str());
    }

    return mode_type::TWO_PASS;
}

const char*
mode_name(mode_type mode)
{
    switch (mode) {
        case mode_type::NONE:
            return "none";
        case mode_type::FAST:
            return "fast";
        case mode_type::TWO_PASS:
            break;
    }

    return "default";
}

pattern_type_t
type_from_str(const std::string& str)
{
    auto upper = toupper(trim(str));

    if (upper == "USERNAME") {
        return pattern_type_t::USERNAME;
    }
    if (upper == "HOSTNAME") {
        return pattern_type_t::HOSTNAME;
    }
    if (upper == "EMAIL_LOCAL_PART") {
        return pattern_type_t::EMAIL_LOCAL_PART;
    }
    if (upper != "CUSTOM") {
        log_warning("invalid pattern type '%s', using CUSTOM", str.c_str());
    }

    return pattern_type_t::CUSTOM;
}

std::string
rule_error::get_message() const
{
    return fmt::format(FMT_STRING("invalid regex for rule '{}' at offset {}: {}"),
                       this->re_rule,
                       this->re_offset,
                       this->re_message);
}

}  // namespace discovery

static Result<std::shared_ptr<pcre2pp::code>, discovery::rule_error>
compile_rule_regex(const std::string& rule, const std::string& pattern)
{
    auto compile_res = pcre2pp::code::from(string_fragment::from_str(pattern));

    if (compile_res.isErr()) {
        auto ce = compile_res.unwrapErr();

        log_error("discovery rule '%s' does not compile: %s",
                  rule.c_str(),
                  ce.get_message().c_str());
        return Err(discovery::rule_error{
            rule,
            pattern,
            ce.get_message(),
            ce.ce_offset,
        });
    }

    return Ok(compile_res.unwrap().to_shared());
}

static bool
equals_ignore_case(const std::string& lhs, const std::string& rhs)
{
    return string_fragment::from_str(lhs).iequal(
        string_fragment::from_str(rhs));
}

Result<pattern_discovery, discovery::rule_error>
pattern_discovery::create(const discovery::config& cfg)
{
    pattern_discovery retval;

    for (const auto& px : cfg.c_property_extractions) {
        if (!px.px_enabled || px.px_key_pattern.empty()) {
            continue;
        }

        auto key_regex = TRY(compile_rule_regex(px.px_name, px.px_key_pattern));
        auto value_regex = TRY(compile_rule_regex(
            px.px_name,
            px.px_value_pattern.empty() ? ".*" : px.px_value_pattern));
        std::shared_ptr<pcre2pp::code> event_filter;
        if (!px.px_event_type_filter.empty()) {
            event_filter = TRY(
                compile_rule_regex(px.px_name, px.px_event_type_filter));
        }

        retval.pd_property_rules.emplace_back(property_rule{
            px.px_name,
            px.px_type,
            std::move(key_regex),
            px.px_key_property.empty() ? "key" : px.px_key_property,
            std::move(value_regex),
            px.px_value_property.empty() ? "value" : px.px_value_property,
            std::move(event_filter),
            std::max(1, px.px_min_occurrences),
            px.px_whitelist,
            discovered_patterns{px.px_case_sensitive, px.px_whitelist},
        });
        log_debug("compiled property rule '%s' (type: %s, kv: %s/%s)",
                  px.px_name.c_str(),
                  pattern_type_name(px.px_type),
                  px.px_key_property.c_str(),
                  px.px_value_property.c_str());
    }

    for (const auto& cx : cfg.c_custom_extractions) {
        if (!cx.cx_enabled || cx.cx_pattern.empty()) {
            continue;
        }

        auto regex = TRY(compile_rule_regex(cx.cx_name, cx.cx_pattern));
        std::vector<std::shared_ptr<pcre2pp::code>> ignore;
        for (const auto& ignore_pattern : cx.cx_ignore) {
            ignore.emplace_back(
                TRY(compile_rule_regex(cx.cx_name, ignore_pattern)));
        }

        if (cx.cx_capture_group > 0
            && (size_t) cx.cx_capture_group > regex->get_capture_count())
        {
            log_warning("rule '%s' has no capture group %d, it will not "
                        "discover anything",
                        cx.cx_name.c_str(),
                        cx.cx_capture_group);
        }

        retval.pd_line_rules.emplace_back(line_rule{
            cx.cx_name,
            cx.cx_type,
            std::move(regex),
            cx.cx_capture_group,
            std::max(1, cx.cx_min_occurrences),
            cx.cx_ignore_exact,
            std::move(ignore),
            discovered_patterns{cx.cx_case_sensitive, cx.cx_whitelist},
        });
        log_debug("compiled extraction rule '%s' (type: %s, group: %d)",
                  cx.cx_name.c_str(),
                  pattern_type_name(cx.cx_type),
                  cx.cx_capture_group);
    }

    log_info("compiled %zu extraction rules and %zu property rules",
             retval.pd_line_rules.size(),
             retval.pd_property_rules.size());

    return Ok(std::move(retval));
}

bool
pattern_discovery::line_rule::should_ignore(const std::string& value) const
{
    for (const auto& exact : this->lr_ignore_exact) {
        if (equals_ignore_case(value, exact)) {
            return true;
        }
    }

    auto sf = string_fragment::from_str(value);
    for (const auto& regex : this->lr_ignore) {
        if (regex->matches_whole(sf)) {
            return true;
        }
    }

    return false;
}

void
pattern_discovery::analyze_line(const std::string& line)
{
    if (line.empty()) {
        return;
    }

    auto line_sf = string_fragment::from_str(line);
    for (auto& rule : this->pd_line_rules) {
        const auto capture_count = rule.lr_regex->get_capture_count();
        auto for_res = rule.lr_regex->capture_from(line_sf).for_each(
            [this, &rule, capture_count](const pcre2pp::match_data& md) {
                std::optional<string_fragment> cap;

                if (rule.lr_capture_group == 0 || capture_count == 0) {
                    cap = md[0];
                } else if (capture_count >= (size_t) rule.lr_capture_group) {
                    cap = md[rule.lr_capture_group];
                }
                if (!cap || cap->empty()) {
                    return;
                }

                auto value = cap->to_string();
                if (rule.should_ignore(value)) {
                    log_trace("rule '%s' ignoring value of length %zu",
                              rule.lr_name.c_str(),
                              value.size());
                    return;
                }

                auto count = rule.lr_values.add_value(
                    value,
                    rule.lr_type,
                    rule.lr_type == pattern_type_t::CUSTOM
                        ? std::make_optional(rule.lr_name)
                        : std::nullopt);
                if (count == rule.lr_min_occurrences) {
                    this->pd_generation += 1;
                }
            });

        if (for_res.isErr()) {
            log_error("rule '%s' failed to match: %s",
                      rule.lr_name.c_str(),
                      for_res.unwrapErr().get_message().c_str());
        }
    }
}

bool
pattern_discovery::property_rule::is_whitelisted(
    const std::string& value) const
{
    return std::any_of(
        this->pr_whitelist.begin(),
        this->pr_whitelist.end(),
        [&value](const auto& item) { return equals_ignore_case(value, item); });
}

bool
pattern_discovery::property_rule::add_value(const std::string& value)
{
    if (value.empty() || this->is_whitelisted(value)) {
        return false;
    }

    auto count = this->pr_values.add_value(
        value,
        this->pr_type,
        this->pr_type == pattern_type_t::CUSTOM
            ? std::make_optional(this->pr_name)
            : std::nullopt);

    return count == this->pr_min_occurrences;
}

void
pattern_discovery::analyze_properties(const std::string& event_type,
                                      const fields_t& fields)
{
    for (auto& rule : this->pd_property_rules) {
        if (rule.pr_event_type_filter
            && !rule.pr_event_type_filter->matches_whole(
                string_fragment::from_str(event_type)))
        {
            continue;
        }

        for (const auto& field : fields) {
            if (rule.pr_key_regex->matches_whole(
                    string_fragment::from_str(field.first)))
            {
                if (rule.add_value(field.second)) {
                    this->pd_generation += 1;
                }
            }
        }

        auto key_iter = fields.find(rule.pr_key_property);
        auto value_iter = fields.find(rule.pr_value_property);
        if (key_iter == fields.end() || value_iter == fields.end()) {
            continue;
        }

        if (rule.pr_key_regex->matches_whole(
                string_fragment::from_str(key_iter->second))
            && rule.pr_value_regex->matches_whole(
                string_fragment::from_str(value_iter->second)))
        {
            log_trace("property rule '%s' matched key/value pair in '%s'",
                      rule.pr_name.c_str(),
                      event_type.c_str());
            if (rule.add_value(value_iter->second)) {
                this->pd_generation += 1;
            }
        }
    }
}

discovered_patterns
pattern_discovery::get_discovered_patterns() const
{
    discovered_patterns retval(false);

    for (const auto& rule : this->pd_line_rules) {
        retval.merge(rule.lr_values, rule.lr_min_occurrences);
    }
    for (const auto& rule : this->pd_property_rules) {
        retval.merge(rule.pr_values, rule.pr_min_occurrences);
    }

    return retval;
}

void
pattern_discovery::clear()
{
    for (auto& rule : this->pd_line_rules) {
        rule.lr_values.clear();
    }
    for (auto& rule : this->pd_property_rules) {
        rule.pr_values.clear();
    }
    this->pd_generation += 1;
}

std::string
pattern_discovery::get_statistics() const
{
    std::string retval = "Discovery Statistics:\n";
    size_t total = 0;

    for (const auto& rule : this->pd_line_rules) {
        auto count
            = rule.lr_values.get_values(rule.lr_min_occurrences).size();

        if (count > 0) {
            total += count;
            retval.append(fmt::format(
                FMT_STRING("  {} ({}): {} values (min occurrences: {})\n"),
                rule.lr_name,
                pattern_type_name(rule.lr_type),
                count,
                rule.lr_min_occurrences));
        }
    }
    for (const auto& rule : this->pd_property_rules) {
        auto count
            = rule.pr_values.get_values(rule.pr_min_occurrences).size();

        if (count > 0) {
            total += count;
            retval.append(fmt::format(
                FMT_STRING(
                    "  {} [property] ({}): {} values (min occurrences: {})\n"),
                rule.pr_name,
                pattern_type_name(rule.pr_type),
                count,
                rule.pr_min_occurrences));
        }
    }
    retval.append(
        fmt::format(FMT_STRING("  Total discovered values: {}\n"), total));

    return retval;
}

}  // namespace redact
