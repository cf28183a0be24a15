/**
 * Copyright (c) 2014, Timothy Stack
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
 * @file redact_log.hh
 */

#ifndef redact_log_hh
#define redact_log_hh

#include <cstdint>
#include <optional>
#include <string>

#include <stdio.h>
#include <string.h>

#ifndef redact_dead2
#    define redact_dead2 __attribute__((noreturn))
#endif

enum class redact_log_level_t : uint32_t {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

#if defined(__GNUC__) || defined(__clang__)
#    define REDACT_ATTR_FORMAT_PRINTF(a, b) \
        __attribute__((format(printf, a, b)))
#else
#    define REDACT_ATTR_FORMAT_PRINTF(a, b)
#endif

/**
 * Open the file named by the REDACT_LOG_PATH environment variable, if set,
 * and mirror every subsequent log line into it.
 */
void log_open_from_env();
void log_argv(int argc, char* argv[]);
void log_msg(enum redact_log_level_t level,
             const char* src_file,
             int line_number,
             const char* fmt,
             ...) REDACT_ATTR_FORMAT_PRINTF(4, 5);
void log_abort() redact_dead2;

/**
 * @return A copy of the in-memory ring buffer of recent log lines, oldest
 * first.
 */
std::string log_ring_contents();
void log_write_ring_to(int fd);

extern std::optional<FILE*> redact_log_file;
extern enum redact_log_level_t redact_log_level;

#define log_msg_wrapper(level, fmt...) \
    do { \
        if (redact_log_level <= level) { \
            log_msg(level, __FILE__, __LINE__, fmt); \
        } \
    } while (false)

#define log_error(fmt...) log_msg_wrapper(redact_log_level_t::ERROR, fmt);

#define log_warning(fmt...) log_msg_wrapper(redact_log_level_t::WARNING, fmt);

#define log_info(fmt...) log_msg_wrapper(redact_log_level_t::INFO, fmt);

#define log_debug(fmt...) log_msg_wrapper(redact_log_level_t::DEBUG, fmt);

#define log_trace(fmt...) log_msg_wrapper(redact_log_level_t::TRACE, fmt);

#define require(e) ((void) ((e) ? 0 : redact_require(#e, __FILE__, __LINE__)))
#define redact_require(e, file, line) \
    (log_msg(redact_log_level_t::ERROR, \
             file, \
             line, \
             "failed precondition `%s'", \
             e), \
     log_abort(), \
     1)

#define ensure(e) ((void) ((e) ? 0 : redact_ensure(#e, __FILE__, __LINE__)))
#define redact_ensure(e, file, line) \
    (log_msg(redact_log_level_t::ERROR, \
             file, \
             line, \
             "failed postcondition `%s'", \
             e), \
     log_abort(), \
     1)

#endif
