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
 * @file discovery_session.cc
 */

#include "discovery_session.hh"

#include "base/redact_log.hh"
#include "fmt/format.h"

namespace redact {

const char*
pass_kind_name(pass_kind kind)
{
    switch (kind) {
        case pass_kind::discover:
            return "discover";
        case pass_kind::redact:
            return "redact";
        case pass_kind::discover_and_redact:
            break;
    }

    return "discover_and_redact";
}

discovery_session::discovery_session(discovery::mode_type mode,
                                     pattern_discovery discovery)
    : ds_mode(mode), ds_discovery(std::move(discovery))
{
}

size_t
discovery_session::get_pass_count() const
{
    return this->ds_mode == discovery::mode_type::TWO_PASS ? 2 : 1;
}

Result<pass_kind, std::string>
discovery_session::begin_pass(size_t index)
{
    if (this->ds_current) {
        return Err(fmt::format(FMT_STRING("pass {} has not finished"),
                               this->ds_next_pass));
    }
    if (index >= this->get_pass_count()) {
        return Err(fmt::format(
            FMT_STRING("pass {} is out of range, discovery mode '{}' has {} "
                       "pass(es)"),
            index,
            discovery::mode_name(this->ds_mode),
            this->get_pass_count()));
    }
    if (index != this->ds_next_pass) {
        return Err(fmt::format(FMT_STRING("expecting pass {}, not {}"),
                               this->ds_next_pass,
                               index));
    }

    pass_kind retval = pass_kind::redact;
    switch (this->ds_mode) {
        case discovery::mode_type::NONE:
            break;
        case discovery::mode_type::FAST:
            retval = pass_kind::discover_and_redact;
            break;
        case discovery::mode_type::TWO_PASS:
            retval = index == 0 ? pass_kind::discover : pass_kind::redact;
            break;
    }

    log_info("starting pass %zu (%s)", index, pass_kind_name(retval));
    this->ds_current = retval;

    return Ok(retval);
}

bool
discovery_session::is_discovering() const
{
    return this->ds_current
        && (this->ds_current.value() == pass_kind::discover
            || this->ds_current.value() == pass_kind::discover_and_redact);
}

void
discovery_session::observe(const std::string& line)
{
    if (this->is_discovering()) {
        this->ds_discovery.analyze_line(line);
    }
}

void
discovery_session::observe_properties(
    const std::string& event_type, const pattern_discovery::fields_t& fields)
{
    if (this->is_discovering()) {
        this->ds_discovery.analyze_properties(event_type, fields);
    }
}

void
discovery_session::sync_active(bool force)
{
    if (!force
        && this->ds_synced_generation == this->ds_discovery.get_generation())
    {
        return;
    }

    this->ds_active = this->ds_discovery.get_discovered_patterns();
    this->ds_synced_generation = this->ds_discovery.get_generation();
}

const discovered_patterns&
discovery_session::get_active_patterns()
{
    if (this->ds_mode == discovery::mode_type::FAST) {
        this->sync_active();
    }

    return this->ds_active;
}

void
discovery_session::finish_pass()
{
    require(this->ds_current);

    if (this->ds_current.value() == pass_kind::discover) {
        this->sync_active(true);
        log_info("discovery pass found %zu values",
                 this->ds_active.get_total_count());
        log_debug("%s", this->ds_discovery.get_statistics().c_str());
    }
    this->ds_current = std::nullopt;
    this->ds_next_pass += 1;
}

void
discovery_session::reset()
{
    if (this->ds_current) {
        log_warning("abandoning pass %zu (%s)",
                    this->ds_next_pass,
                    pass_kind_name(this->ds_current.value()));
    }

    this->ds_discovery.clear();
    this->ds_active.clear();
    this->ds_synced_generation = this->ds_discovery.get_generation();
    this->ds_next_pass = 0;
    this->ds_current = std::nullopt;
}

}  // namespace redact
