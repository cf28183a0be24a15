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
 * @file string_util.cc
 */

#include <algorithm>
#include <optional>

#include "string_util.hh"

std::string
capitalize(const std::string& str)
{
    auto retval = str;

    if (!retval.empty()) {
        retval[0] = ::toupper((unsigned char) retval[0]);
    }

    return retval;
}

size_t
ifind(const std::string& haystack, const std::string& needle, size_t start)
{
    if (needle.empty() || needle.size() > haystack.size()) {
        return std::string::npos;
    }

    for (size_t lpc = start; lpc + needle.size() <= haystack.size(); lpc++) {
        if (strncasecmp(&haystack[lpc], needle.c_str(), needle.size()) == 0) {
            return lpc;
        }
    }

    return std::string::npos;
}

size_t
replace_all(std::string& str,
            const std::string& needle,
            const std::string& repl,
            bool icase)
{
    size_t retval = 0;
    size_t pos = 0;

    if (needle.empty()) {
        return retval;
    }

    while (true) {
        pos = icase ? ifind(str, needle, pos) : str.find(needle, pos);
        if (pos == std::string::npos) {
            break;
        }
        str.replace(pos, needle.size(), repl);
        pos += repl.size();
        retval += 1;
    }

    return retval;
}

namespace redact::pcre2pp {

static bool
is_meta(char ch)
{
    switch (ch) {
        case '\\':
        case '^':
        case '$':
        case '.':
        case '[':
        case ']':
        case '(':
        case ')':
        case '*':
        case '+':
        case '?':
        case '{':
        case '}':
        case '|':
            return true;
        default:
            return false;
    }
}

static std::optional<const char*>
char_escape_seq(char ch)
{
    switch (ch) {
        case '\t':
            return "\\t";
        case '\n':
            return "\\n";
    }

    return std::nullopt;
}

std::string
quote(string_fragment str)
{
    std::string retval;

    for (const auto ch : str) {
        if (is_meta(ch)) {
            retval.push_back('\\');
        } else {
            auto esc_seq = char_escape_seq(ch);
            if (esc_seq) {
                retval.append(esc_seq.value());
                continue;
            }
        }
        retval.push_back(ch);
    }

    return retval;
}

}  // namespace redact::pcre2pp
