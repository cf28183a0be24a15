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
 * @file discovery_session.hh
 */

#ifndef redact_discovery_session_hh
#define redact_discovery_session_hh

#include <optional>
#include <string>

#include "discovered_patterns.hh"
#include "discovery.cfg.hh"
#include "pattern_discovery.hh"
#include "result.h"

namespace redact {

enum class pass_kind {
    discover,
    redact,
    discover_and_redact,
};

const char* pass_kind_name(pass_kind kind);

/**
 * Tracks the passes over a source for one discovery mode and decides which
 * discovered values are in effect for redaction at any point.
 *
 * NONE reads the source once and never discovers.  FAST reads it once and
 * values take effect as soon as they are recorded.  TWO_PASS discovers on
 * the first read and redacts on the second with the values from the first.
 */
class discovery_session {
public:
    discovery_session(discovery::mode_type mode, pattern_discovery discovery);

    discovery::mode_type get_mode() const { return this->ds_mode; }

    size_t get_pass_count() const;

    /**
     * Start the pass with the given index.  Passes must be started in order
     * and each one must be finished before the next begins.
     */
    Result<pass_kind, std::string> begin_pass(size_t index);

    /**
     * Feed a line to discovery if the current pass discovers.
     */
    void observe(const std::string& line);

    void observe_properties(const std::string& event_type,
                            const pattern_discovery::fields_t& fields);

    /**
     * @return The values that should be redacted right now.
     */
    const discovered_patterns& get_active_patterns();

    void finish_pass();

    /**
     * Abandon any pass in progress and forget what was discovered, so the
     * source can be processed again starting from pass 0.
     */
    void reset();

    const pattern_discovery& get_discovery() const
    {
        return this->ds_discovery;
    }

private:
    bool is_discovering() const;

    void sync_active(bool force = false);

    discovery::mode_type ds_mode;
    pattern_discovery ds_discovery;
    discovered_patterns ds_active{false};
    size_t ds_synced_generation{0};
    size_t ds_next_pass{0};
    std::optional<pass_kind> ds_current;
};

}  // namespace redact

#endif
