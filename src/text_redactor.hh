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
 * @file text_redactor.hh
 */

#ifndef redact_text_redactor_hh
#define redact_text_redactor_hh

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "discovered_patterns.hh"
#include "discovery.cfg.hh"
#include "discovery_session.hh"
#include "pcrepp/pcre2pp.hh"
#include "pseudonymizer.hh"
#include "result.h"

namespace redact {

/**
 * A regex whose matches are always redacted, whether or not discovery has
 * seen them.  A match is kept as-is when it equals an entry in
 * sr_ignore_exact (ignoring case), fully matches a regex in sr_ignore or
 * immediately follows one of the strings in sr_ignore_after.
 */
struct static_rule {
    std::string sr_name;
    std::string sr_pattern;
    int sr_capture_group{0};
    std::vector<std::string> sr_ignore_exact;
    std::vector<std::string> sr_ignore;
    std::vector<std::string> sr_ignore_after;
    std::optional<std::string> sr_generator;
};

class line_source {
public:
    virtual ~line_source() = default;

    virtual std::optional<std::string> next_line() = 0;

    /**
     * Go back to the first line so the source can be read again.
     */
    virtual Result<void, std::string> rewind() = 0;
};

class line_sink {
public:
    virtual ~line_sink() = default;

    virtual void write_line(const std::string& line) = 0;
};

/**
 * A line source over an in-memory buffer.  Lines are split on '\n' and a
 * trailing newline does not produce an empty last line.
 */
class string_line_source : public line_source {
public:
    explicit string_line_source(std::string content)
        : sls_content(std::move(content))
    {
    }

    std::optional<std::string> next_line() override;

    Result<void, std::string> rewind() override;

private:
    std::string sls_content;
    size_t sls_offset{0};
};

class string_line_sink : public line_sink {
public:
    void write_line(const std::string& line) override
    {
        this->sls_lines.emplace_back(line);
    }

    const std::vector<std::string>& get_lines() const
    {
        return this->sls_lines;
    }

    std::string to_string() const;

private:
    std::vector<std::string> sls_lines;
};

struct redaction_stats {
    size_t rs_lines_processed{0};
    size_t rs_lines_changed{0};
    size_t rs_discovered{0};
};

class text_redactor {
public:
    struct options {
        std::string o_redaction_text{"***"};
        std::vector<std::string> o_no_redact;
    };

    static Result<text_redactor, discovery::rule_error> create(
        pseudonymizer& pseudo,
        const std::vector<static_rule>& rules,
        options opts);

    static Result<text_redactor, discovery::rule_error> create(
        pseudonymizer& pseudo, const std::vector<static_rule>& rules)
    {
        return create(pseudo, rules, options{});
    }

    /**
     * Redact a single line.  Matches of the static rules are replaced
     * first.  If none of them changed the line, every occurrence of a
     * discovered value is replaced, longest values first.  If a rule
     * cannot be matched against the line, the whole line is replaced by
     * the redaction text.
     *
     * @param line The line to redact.
     * @param discovered The values found by discovery or nullptr.
     * @return The redacted line.
     */
    std::string next(const std::string& line,
                     const discovered_patterns* discovered = nullptr);

    /**
     * Run all of the passes required by the session over the source,
     * writing the output of the redacting pass to the sink.
     */
    Result<redaction_stats, std::string> redact(line_source& source,
                                                line_sink& sink,
                                                discovery_session& session);

    const std::string& get_redaction_text() const
    {
        return this->tr_options.o_redaction_text;
    }

private:
    struct compiled_rule {
        std::string cr_name;
        std::shared_ptr<pcre2pp::code> cr_regex;
        int cr_capture_group;
        std::vector<std::string> cr_ignore_exact;
        std::vector<std::shared_ptr<pcre2pp::code>> cr_ignore;
        std::vector<std::string> cr_ignore_after;
        std::optional<std::string> cr_generator;
    };

    text_redactor(pseudonymizer& pseudo,
                  std::vector<compiled_rule> rules,
                  options opts)
        : tr_pseudonymizer(pseudo), tr_rules(std::move(rules)),
          tr_options(std::move(opts))
    {
    }

    bool should_keep(const compiled_rule& rule,
                     const std::string& line,
                     size_t value_offset,
                     const std::string& value) const;

    std::string replacement_for(const compiled_rule& rule,
                                const std::string& value);

    std::string apply_rule(const compiled_rule& rule, const std::string& line);

    std::string apply_discovered(const std::string& line,
                                 const discovered_patterns& discovered);

    pseudonymizer& tr_pseudonymizer;
    std::vector<compiled_rule> tr_rules;
    options tr_options;
};

}  // namespace redact

#endif
