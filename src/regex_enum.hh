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
 * @file regex_enum.hh
 */

#ifndef redact_regex_enum_hh
#define redact_regex_enum_hh

#include <string>
#include <vector>

#include <stdint.h>

#include "base/string_fragment.hh"
#include "result.h"

namespace redact {

/**
 * An enumeration of the language matched by a regular expression.  The
 * pattern is parsed once into a small tree where every node knows how many
 * distinct strings it can produce.  Any index below that count can then be
 * decoded into a matching string by treating the index as a mixed-radix
 * number over the tree.
 *
 * Unbounded quantifiers are capped at UNBOUNDED_REPEAT_MAX repetitions past
 * their minimum.  Counts saturate at UINT64_MAX.
 */
class regex_enum {
public:
    static constexpr uint32_t UNBOUNDED_REPEAT_MAX = 8;

    struct parse_error {
        size_t pe_offset{0};
        std::string pe_message;
    };

    static Result<regex_enum, parse_error> parse(string_fragment pattern);

    uint64_t get_cardinality() const
    {
        return this->re_root.n_cardinality;
    }

    bool is_empty_pattern() const { return this->re_pattern.empty(); }

    const std::string& get_pattern() const { return this->re_pattern; }

    /**
     * @param index A value less than get_cardinality().  Larger values are
     *   reduced modulo the cardinality.
     * @return The string for the given position in the enumeration.
     */
    std::string decode(uint64_t index) const;

    enum class node_kind {
        empty,
        literal,
        char_set,
        concat,
        alternate,
        repeat,
    };

    struct node {
        node_kind n_kind{node_kind::empty};
        std::string n_literal;
        std::vector<char> n_chars;
        std::vector<node> n_children;
        uint32_t n_min{0};
        uint32_t n_max{0};
        uint64_t n_cardinality{1};
    };

private:
    regex_enum(std::string pattern, node root)
        : re_pattern(std::move(pattern)), re_root(std::move(root))
    {
    }

    std::string re_pattern;
    node re_root;
};

}  // namespace redact

#endif
