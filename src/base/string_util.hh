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
 * @file string_util.hh
 */

#ifndef redact_string_util_hh
#define redact_string_util_hh

#include <string>
#include <vector>

#include <ctype.h>
#include <string.h>

#include "string_fragment.hh"

inline bool
startswith(const char* str, const char* prefix)
{
    return strncmp(str, prefix, strlen(prefix)) == 0;
}

inline bool
startswith(const std::string& str, const char* prefix)
{
    return startswith(str.c_str(), prefix);
}

inline bool
endswith(const std::string& str, const char* suffix)
{
    size_t suffix_len = strlen(suffix);

    if (suffix_len > str.length()) {
        return false;
    }

    return strcmp(&str[str.size() - suffix_len], suffix) == 0;
}

inline std::string
trim(const std::string& str)
{
    std::string::size_type start, end;

    for (start = 0; start < str.size() && isspace(str[start]); start++)
        ;
    for (end = str.size(); end > 0 && isspace(str[end - 1]); end--)
        ;

    return str.substr(start, end - start);
}

inline std::string
tolower(const std::string& str)
{
    std::string retval;

    retval.reserve(str.size());
    for (const auto ch : str) {
        retval.push_back(::tolower((unsigned char) ch));
    }

    return retval;
}

inline std::string
toupper(const std::string& str)
{
    std::string retval;

    retval.reserve(str.size());
    for (const auto ch : str) {
        retval.push_back(::toupper((unsigned char) ch));
    }

    return retval;
}

/**
 * @return A copy of the string with the first character upper-cased.
 */
std::string capitalize(const std::string& str);

/**
 * Case-insensitive search for a needle in a haystack.
 *
 * @return The byte offset of the first match at or after start, or
 * std::string::npos.
 */
size_t ifind(const std::string& haystack,
             const std::string& needle,
             size_t start = 0);

/**
 * Replace every occurrence of needle in str with repl.  When icase is true,
 * the search ignores ASCII case.
 *
 * @return The number of replacements made.
 */
size_t replace_all(std::string& str,
                   const std::string& needle,
                   const std::string& repl,
                   bool icase = false);

namespace redact::pcre2pp {

/**
 * @return The string with any PCRE meta-characters escaped so that it can be
 * embedded in a pattern as a literal.
 */
std::string quote(string_fragment sf);

}  // namespace redact::pcre2pp

#endif
