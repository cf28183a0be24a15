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
 * @file text_redactor.cc
 */

#include <algorithm>

#include "text_redactor.hh"

#include "base/redact_log.hh"
#include "base/string_util.hh"
#include "fmt/format.h"

namespace redact {

static constexpr size_t PROGRESS_INTERVAL = 10000;

std::optional<std::string>
string_line_source::next_line()
{
    if (this->sls_offset >= this->sls_content.size()) {
        return std::nullopt;
    }

    auto eol = this->sls_content.find('\n', this->sls_offset);
    if (eol == std::string::npos) {
        eol = this->sls_content.size();
    }

    auto retval
        = this->sls_content.substr(this->sls_offset, eol - this->sls_offset);
    this->sls_offset = eol + 1;

    return retval;
}

Result<void, std::string>
string_line_source::rewind()
{
    this->sls_offset = 0;

    return Ok();
}

std::string
string_line_sink::to_string() const
{
    std::string retval;

    for (const auto& line : this->sls_lines) {
        retval.append(line);
        retval.push_back('\n');
    }

    return retval;
}

static Result<std::shared_ptr<pcre2pp::code>, discovery::rule_error>
compile_static_regex(const std::string& rule, const std::string& pattern)
{
    auto compile_res = pcre2pp::code::from(string_fragment::from_str(pattern));

    if (compile_res.isErr()) {
        auto ce = compile_res.unwrapErr();

        log_error("static rule '%s' does not compile: %s",
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

Result<text_redactor, discovery::rule_error>
text_redactor::create(pseudonymizer& pseudo,
                      const std::vector<static_rule>& rules,
                      options opts)
{
    std::vector<compiled_rule> compiled;

    for (const auto& rule : rules) {
        auto regex = TRY(compile_static_regex(rule.sr_name, rule.sr_pattern));
        std::vector<std::shared_ptr<pcre2pp::code>> ignore;

        for (const auto& ignore_pattern : rule.sr_ignore) {
            ignore.emplace_back(
                TRY(compile_static_regex(rule.sr_name, ignore_pattern)));
        }
        compiled.emplace_back(compiled_rule{
            rule.sr_name,
            std::move(regex),
            rule.sr_capture_group,
            rule.sr_ignore_exact,
            std::move(ignore),
            rule.sr_ignore_after,
            rule.sr_generator,
        });
    }

    log_debug("text redactor has %zu static rules", compiled.size());

    return Ok(text_redactor{pseudo, std::move(compiled), std::move(opts)});
}

bool
text_redactor::should_keep(const compiled_rule& rule,
                           const std::string& line,
                           size_t value_offset,
                           const std::string& value) const
{
    for (const auto& safe : this->tr_options.o_no_redact) {
        if (!safe.empty() && value.find(safe) != std::string::npos) {
            return true;
        }
    }

    auto value_sf = string_fragment::from_str(value);
    for (const auto& exact : rule.cr_ignore_exact) {
        if (value_sf.iequal(string_fragment::from_str(exact))) {
            return true;
        }
    }
    for (const auto& regex : rule.cr_ignore) {
        if (regex->matches_whole(value_sf)) {
            return true;
        }
    }
    if (value_offset > 0 && !rule.cr_ignore_after.empty()) {
        auto before = line.substr(0, value_offset);

        for (const auto& prefix : rule.cr_ignore_after) {
            if (!prefix.empty() && endswith(before, prefix.c_str())) {
                return true;
            }
        }
    }

    return false;
}

std::string
text_redactor::replacement_for(const compiled_rule& rule,
                               const std::string& value)
{
    if (rule.cr_generator) {
        return this->tr_pseudonymizer.pseudonymize_with_pattern(
            value, rule.cr_generator.value(), this->tr_options.o_redaction_text);
    }

    return this->tr_pseudonymizer.pseudonymize(
        value, this->tr_options.o_redaction_text);
}

std::string
text_redactor::apply_rule(const compiled_rule& rule, const std::string& line)
{
    const auto capture_count = rule.cr_regex->get_capture_count();
    const auto line_sf = string_fragment::from_str(line);

    auto replace_res = rule.cr_regex->replace_with(
        line_sf,
        [this, &rule, &line, &line_sf, capture_count](
            const pcre2pp::match_data& md) {
            auto all = md[0].value();
            auto matched = all.to_string();

            if (rule.cr_capture_group == 0) {
                if (this->should_keep(
                        rule, line, all.sf_begin - line_sf.sf_begin, matched))
                {
                    return matched;
                }
                return this->replacement_for(rule, matched);
            }

            if (capture_count < (size_t) rule.cr_capture_group) {
                return matched;
            }

            auto cap = md[rule.cr_capture_group];
            if (!cap || cap->empty()) {
                return matched;
            }

            auto value = cap->to_string();
            if (this->should_keep(
                    rule, line, cap->sf_begin - line_sf.sf_begin, value))
            {
                return matched;
            }

            auto retval = all.sub_range(0, cap->sf_begin - all.sf_begin)
                              .to_string();
            retval.append(this->replacement_for(rule, value));
            retval.append(
                all.sub_range(cap->sf_end - all.sf_begin, all.length())
                    .to_string());

            return retval;
        });

    if (replace_res.isErr()) {
        log_error("static rule '%s' failed to match, redacting whole line: %s",
                  rule.cr_name.c_str(),
                  replace_res.unwrapErr().get_message().c_str());
        return this->tr_options.o_redaction_text;
    }

    return replace_res.unwrap();
}

std::string
text_redactor::apply_discovered(const std::string& line,
                                const discovered_patterns& discovered)
{
    auto values = discovered.get_values(1);

    if (values.empty()) {
        return line;
    }

    std::stable_sort(values.begin(),
                     values.end(),
                     [](const auto& lhs, const auto& rhs) {
                         return lhs.dv_value.size() > rhs.dv_value.size();
                     });

    const auto icase = !discovered.is_case_sensitive();
    auto retval = line;
    for (const auto& dv : values) {
        auto pos = icase ? ifind(retval, dv.dv_value)
                         : retval.find(dv.dv_value);

        if (pos == std::string::npos) {
            continue;
        }

        auto repl = this->tr_pseudonymizer.pseudonymize(
            dv.dv_value, this->tr_options.o_redaction_text);
        replace_all(retval, dv.dv_value, repl, icase);
        log_trace("replaced discovered %s value of length %zu",
                  pattern_type_name(dv.dv_type),
                  dv.dv_value.size());
    }

    return retval;
}

std::string
text_redactor::next(const std::string& line,
                    const discovered_patterns* discovered)
{
    auto retval = line;

    for (const auto& rule : this->tr_rules) {
        retval = this->apply_rule(rule, retval);
    }

    if (discovered != nullptr && retval == line) {
        retval = this->apply_discovered(retval, *discovered);
    }

    return retval;
}

Result<redaction_stats, std::string>
text_redactor::redact(line_source& source,
                      line_sink& sink,
                      discovery_session& session)
{
    redaction_stats retval;

    for (size_t pass = 0; pass < session.get_pass_count(); pass++) {
        auto kind = TRY(session.begin_pass(pass));

        if (pass > 0) {
            auto rewind_res = source.rewind();

            if (rewind_res.isErr()) {
                auto msg = rewind_res.unwrapErr();

                log_error("unable to rewind source for pass %zu: %s",
                          pass,
                          msg.c_str());
                session.reset();
                return Err(fmt::format(
                    FMT_STRING("unable to rewind source for pass {}: {}"),
                    pass,
                    msg));
            }
        }

        size_t line_count = 0;
        while (true) {
            auto line = source.next_line();

            if (!line) {
                break;
            }

            line_count += 1;
            if (kind == pass_kind::discover) {
                session.observe(line.value());
            } else {
                auto redacted
                    = this->next(line.value(), &session.get_active_patterns());

                // values found on this line take effect on the next one
                if (kind == pass_kind::discover_and_redact) {
                    session.observe(line.value());
                }
                retval.rs_lines_processed += 1;
                if (redacted != line.value()) {
                    retval.rs_lines_changed += 1;
                }
                sink.write_line(redacted);
            }

            if (line_count % PROGRESS_INTERVAL == 0) {
                log_info("pass %zu: processed %zu lines", pass, line_count);
            }
        }

        session.finish_pass();
    }

    retval.rs_discovered = session.get_active_patterns().get_total_count();
    log_info("redaction complete: %zu lines processed, %zu changed, %zu "
             "discovered values",
             retval.rs_lines_processed,
             retval.rs_lines_changed,
             retval.rs_discovered);

    return Ok(retval);
}

}  // namespace redact
