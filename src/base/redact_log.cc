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
 * @file redact_log.cc
 */

#include <mutex>

#include "redact_log.hh"

#include <signal.h>
#include <stdarg.h>
#include <stdlib.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

static constexpr size_t BUFFER_SIZE = 256 * 1024;
static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

std::optional<FILE*> redact_log_file;
redact_log_level_t redact_log_level = redact_log_level_t::DEBUG;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
// Otherwise, any attempts to log will fail.
static std::mutex*
redact_log_mutex()
{
    static auto* retval = new std::mutex();

    return retval;
}

struct thid {
    static uint32_t COUNTER;

    thid() noexcept : t_id(COUNTER++) {}

    uint32_t t_id;
};

uint32_t thid::COUNTER = 0;

thread_local thid current_thid;

static struct {
    size_t lr_length;
    off_t lr_frag_start;
    off_t lr_frag_end;
    char lr_data[BUFFER_SIZE];
} log_ring = {0, BUFFER_SIZE, 0, {}};

static const char* LEVEL_NAMES[] = {
    "T",
    "D",
    "I",
    "W",
    "E",
};

static char*
log_alloc()
{
    off_t data_end = log_ring.lr_length + MAX_LOG_LINE_SIZE;

    if (data_end >= (off_t) BUFFER_SIZE) {
        const char* new_start = &log_ring.lr_data[MAX_LOG_LINE_SIZE];

        new_start = (const char*) memchr(
            new_start, '\n', log_ring.lr_length - MAX_LOG_LINE_SIZE);
        log_ring.lr_frag_start = new_start == nullptr
            ? (off_t) BUFFER_SIZE
            : new_start - log_ring.lr_data;
        log_ring.lr_frag_end = log_ring.lr_length;
        log_ring.lr_length = 0;
    } else if (data_end >= log_ring.lr_frag_start
               && log_ring.lr_frag_start < (off_t) BUFFER_SIZE)
    {
        const char* new_start = &log_ring.lr_data[log_ring.lr_frag_start];

        new_start = (const char*) memchr(
            new_start, '\n', log_ring.lr_frag_end - log_ring.lr_frag_start);
        if (new_start == nullptr) {
            log_ring.lr_frag_start = BUFFER_SIZE;
            log_ring.lr_frag_end = 0;
        } else {
            log_ring.lr_frag_start = new_start - log_ring.lr_data;
        }
    }

    return &log_ring.lr_data[log_ring.lr_length];
}

void
log_open_from_env()
{
    const char* log_path = getenv("REDACT_LOG_PATH");

    if (log_path != nullptr && !redact_log_file) {
        auto* file = fopen(log_path, "ae");

        if (file != nullptr) {
            redact_log_file = file;
        }
    }
}

void
log_argv(int argc, char* argv[])
{
    log_open_from_env();

    log_info("argv[%d] =", argc);
    for (int lpc = 0; lpc < argc; lpc++) {
        log_info("    [%d] = %s", lpc, argv[lpc]);
    }
}

void
log_msg(redact_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    struct timeval curr_time;
    struct tm localtm;
    ssize_t prefix_size;
    va_list args;
    ssize_t rc;

    if (level < redact_log_level) {
        return;
    }

    std::lock_guard<std::mutex> log_lock(*redact_log_mutex());

    {
        // get the base name of the file.  NB: can't use basename() since it
        // can modify its argument
        const char* last_slash = src_file;

        for (int lpc = 0; src_file[lpc]; lpc++) {
            if (src_file[lpc] == '/' || src_file[lpc] == '\\') {
                last_slash = &src_file[lpc + 1];
            }
        }

        src_file = last_slash;
    }

    va_start(args, fmt);
    gettimeofday(&curr_time, nullptr);
    localtime_r(&curr_time.tv_sec, &localtm);
    auto line = log_alloc();
    auto gmtoff = std::abs(localtm.tm_gmtoff) / 60;
    prefix_size
        = snprintf(line,
                   MAX_LOG_LINE_SIZE,
                   "%4d-%02d-%02dT%02d:%02d:%02d.%03d%c%02d:%02d %s t%u %s:%d ",
                   localtm.tm_year + 1900,
                   localtm.tm_mon + 1,
                   localtm.tm_mday,
                   localtm.tm_hour,
                   localtm.tm_min,
                   localtm.tm_sec,
                   (int) (curr_time.tv_usec / 1000),
                   localtm.tm_gmtoff < 0 ? '-' : '+',
                   (int) gmtoff / 60,
                   (int) gmtoff % 60,
                   LEVEL_NAMES[static_cast<uint32_t>(level)],
                   current_thid.t_id,
                   src_file,
                   line_number);
    rc = vsnprintf(
        &line[prefix_size], MAX_LOG_LINE_SIZE - prefix_size, fmt, args);
    if (rc >= (ssize_t) (MAX_LOG_LINE_SIZE - prefix_size)) {
        rc = MAX_LOG_LINE_SIZE - prefix_size - 1;
    }
    line[prefix_size + rc] = '\n';
    log_ring.lr_length += prefix_size + rc + 1;
    if (redact_log_file) {
        fwrite(line, 1, prefix_size + rc + 1, redact_log_file.value());
        fflush(redact_log_file.value());
    }
    va_end(args);
}

std::string
log_ring_contents()
{
    std::lock_guard<std::mutex> log_lock(*redact_log_mutex());
    std::string retval;

    if (log_ring.lr_frag_start < (off_t) BUFFER_SIZE) {
        retval.append(&log_ring.lr_data[log_ring.lr_frag_start],
                      log_ring.lr_frag_end - log_ring.lr_frag_start);
    }
    retval.append(log_ring.lr_data, log_ring.lr_length);

    return retval;
}

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
void
log_write_ring_to(int fd)
{
    if (log_ring.lr_frag_start < (off_t) BUFFER_SIZE) {
        (void) write(fd,
                     &log_ring.lr_data[log_ring.lr_frag_start],
                     log_ring.lr_frag_end - log_ring.lr_frag_start);
    }
    (void) write(fd, log_ring.lr_data, log_ring.lr_length);
}
#pragma GCC diagnostic pop

void
log_abort()
{
    log_write_ring_to(STDERR_FILENO);
    raise(SIGABRT);
    _exit(1);
}
