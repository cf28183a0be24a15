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
 * @file regex_enum.cc
 */

#include <algorithm>
#include <array>
#include <limits>
#include <optional>

#include <ctype.h>
#include <string.h>

#include "regex_enum.hh"

#include "base/redact_log.hh"
#include "fmt/format.h"

namespace redact {

using node = regex_enum::node;
using node_kind = regex_enum::node_kind;

namespace {

constexpr uint64_t CARD_MAX = std::numeric_limits<uint64_t>::max();
constexpr char PRINTABLE_FIRST = 0x20;
constexpr char PRINTABLE_LAST = 0x7e;

uint64_t
sat_add(uint64_t lhs, uint64_t rhs)
{
    uint64_t retval;

    if (__builtin_add_overflow(lhs, rhs, &retval)) {
        return CARD_MAX;
    }
    return retval;
}

uint64_t
sat_mul(uint64_t lhs, uint64_t rhs)
{
    uint64_t retval;

    if (__builtin_mul_overflow(lhs, rhs, &retval)) {
        return CARD_MAX;
    }
    return retval;
}

uint64_t
sat_pow(uint64_t base, uint32_t exp)
{
    uint64_t retval = 1;

    if (base <= 1) {
        return (base == 0 && exp > 0) ? 0 : 1;
    }
    for (uint32_t lpc = 0; lpc < exp; lpc++) {
        retval = sat_mul(retval, base);
        if (retval == CARD_MAX) {
            break;
        }
    }
    return retval;
}

using char_bits = std::array<bool, 128>;

void
add_range(char_bits& bits, int low, int high)
{
    for (int ch = low; ch <= high; ch++) {
        bits[ch] = true;
    }
}

void
add_digits(char_bits& bits)
{
    add_range(bits, '0', '9');
}

void
add_word(char_bits& bits)
{
    add_range(bits, 'a', 'z');
    add_range(bits, 'A', 'Z');
    add_digits(bits);
    bits['_'] = true;
}

void
add_space(char_bits& bits)
{
    bits[' '] = true;
    bits['\t'] = true;
}

char_bits
complement(const char_bits& bits)
{
    char_bits retval{};

    for (int ch = PRINTABLE_FIRST; ch <= PRINTABLE_LAST; ch++) {
        retval[ch] = !bits[ch];
    }
    return retval;
}

node
make_char_set(const char_bits& bits)
{
    node retval;

    retval.n_kind = node_kind::char_set;
    for (size_t ch = 0; ch < bits.size(); ch++) {
        if (bits[ch]) {
            retval.n_chars.push_back((char) ch);
        }
    }
    retval.n_cardinality = retval.n_chars.size();
    return retval;
}

node
make_literal(std::string lit)
{
    node retval;

    retval.n_kind = node_kind::literal;
    retval.n_literal = std::move(lit);
    return retval;
}

node
make_repeat(node child, uint32_t min, uint32_t max)
{
    node retval;

    retval.n_kind = node_kind::repeat;
    retval.n_min = min;
    retval.n_max = max;
    retval.n_cardinality = 0;
    for (auto count = min; count <= max; count++) {
        retval.n_cardinality = sat_add(retval.n_cardinality,
                                       sat_pow(child.n_cardinality, count));
    }
    retval.n_children.emplace_back(std::move(child));
    return retval;
}

class parser {
public:
    explicit parser(string_fragment sf) : p_input(sf) {}

    Result<node, regex_enum::parse_error> parse_all()
    {
        auto retval = TRY(this->parse_alternate());

        if (!this->at_end()) {
            return this->error("unmatched closing parenthesis");
        }
        return Ok(std::move(retval));
    }

private:
    bool at_end() const { return this->p_index >= this->p_input.length(); }

    char peek(int offset = 0) const
    {
        if (this->p_index + offset >= this->p_input.length()) {
            return '\0';
        }
        return this->p_input[this->p_index + offset];
    }

    template<typename... Args>
    Result<node, regex_enum::parse_error> error(const char* format_str,
                                                Args&&... args) const
    {
        return Err(regex_enum::parse_error{
            (size_t) this->p_index,
            fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...),
        });
    }

    Result<node, regex_enum::parse_error> parse_alternate()
    {
        std::vector<node> branches;

        branches.emplace_back(TRY(this->parse_concat()));
        while (this->peek() == '|') {
            this->p_index += 1;
            branches.emplace_back(TRY(this->parse_concat()));
        }

        if (branches.size() == 1) {
            return Ok(std::move(branches.front()));
        }

        node retval;

        retval.n_kind = node_kind::alternate;
        retval.n_cardinality = 0;
        for (auto& branch : branches) {
            retval.n_cardinality
                = sat_add(retval.n_cardinality, branch.n_cardinality);
        }
        retval.n_children = std::move(branches);
        return Ok(std::move(retval));
    }

    Result<node, regex_enum::parse_error> parse_concat()
    {
        node retval;

        retval.n_kind = node_kind::concat;
        while (!this->at_end() && this->peek() != '|' && this->peek() != ')') {
            retval.n_children.emplace_back(TRY(this->parse_quantified()));
        }

        if (retval.n_children.empty()) {
            return Ok(node{});
        }
        if (retval.n_children.size() == 1) {
            return Ok(std::move(retval.n_children.front()));
        }
        for (const auto& child : retval.n_children) {
            retval.n_cardinality
                = sat_mul(retval.n_cardinality, child.n_cardinality);
        }
        return Ok(std::move(retval));
    }

    static constexpr uint64_t MAX_REPEAT = 65535;

    struct bounds {
        uint64_t b_min;
        uint64_t b_max;
        int b_length;
    };

    /**
     * Scan a "{n}", "{n,}" or "{n,m}" quantifier at the current position
     * without consuming it.
     */
    std::optional<bounds> scan_bounds() const
    {
        if (this->peek() != '{') {
            return std::nullopt;
        }

        int offset = 1;
        uint64_t min = 0, max;
        bool have_min = false;

        while (isdigit(this->peek(offset))) {
            min = std::min<uint64_t>(min * 10 + (this->peek(offset) - '0'),
                                     MAX_REPEAT + 1);
            have_min = true;
            offset += 1;
        }
        if (!have_min) {
            return std::nullopt;
        }
        max = min;
        if (this->peek(offset) == ',') {
            offset += 1;
            if (isdigit(this->peek(offset))) {
                max = 0;
                while (isdigit(this->peek(offset))) {
                    max = std::min<uint64_t>(
                        max * 10 + (this->peek(offset) - '0'), MAX_REPEAT + 1);
                    offset += 1;
                }
            } else {
                max = min + regex_enum::UNBOUNDED_REPEAT_MAX;
            }
        }
        if (this->peek(offset) != '}') {
            return std::nullopt;
        }

        return bounds{min, max, offset + 1};
    }

    Result<node, regex_enum::parse_error> parse_quantified()
    {
        auto retval = TRY(this->parse_atom());

        while (!this->at_end()) {
            uint32_t min, max;

            switch (this->peek()) {
                case '?':
                    min = 0;
                    max = 1;
                    this->p_index += 1;
                    break;
                case '*':
                    min = 0;
                    max = regex_enum::UNBOUNDED_REPEAT_MAX;
                    this->p_index += 1;
                    break;
                case '+':
                    min = 1;
                    max = 1 + regex_enum::UNBOUNDED_REPEAT_MAX;
                    this->p_index += 1;
                    break;
                case '{': {
                    auto bounds_opt = this->scan_bounds();
                    if (!bounds_opt) {
                        return Ok(std::move(retval));
                    }
                    if (bounds_opt->b_max > MAX_REPEAT) {
                        return this->error(
                            "number too big in {{}} quantifier");
                    }
                    if (bounds_opt->b_min > bounds_opt->b_max) {
                        return this->error(
                            "numbers out of order in {{}} quantifier");
                    }
                    min = bounds_opt->b_min;
                    max = bounds_opt->b_max;
                    this->p_index += bounds_opt->b_length;
                    break;
                }
                default:
                    return Ok(std::move(retval));
            }

            // lazy and possessive suffixes do not change the language
            if (this->peek() == '?' || this->peek() == '+') {
                this->p_index += 1;
            }
            retval = make_repeat(std::move(retval), min, max);
        }

        return Ok(std::move(retval));
    }

    Result<node, regex_enum::parse_error> parse_group()
    {
        // the opening parenthesis has already been consumed
        if (this->peek() == '?') {
            auto kind = this->peek(1);

            if (kind == ':') {
                this->p_index += 2;
            } else if ((kind == '<' && isalpha(this->peek(2)))
                       || (kind == 'P' && this->peek(2) == '<')
                       || kind == '\'')
            {
                auto close = kind == '\'' ? '\'' : '>';

                this->p_index += kind == 'P' ? 3 : 2;
                while (!this->at_end() && this->peek() != close) {
                    this->p_index += 1;
                }
                if (this->at_end()) {
                    return this->error("unterminated group name");
                }
                this->p_index += 1;
            } else if (kind == '=' || kind == '!' || kind == '<') {
                return this->error("lookaround assertions are not supported");
            } else {
                return this->error("unsupported group syntax '(?{}'", kind);
            }
        }

        auto retval = TRY(this->parse_alternate());

        if (this->peek() != ')') {
            return this->error("missing closing parenthesis");
        }
        this->p_index += 1;
        return Ok(std::move(retval));
    }

    /**
     * Handle the escapes that stand for a set of characters.
     *
     * @return True if the escape was a class escape and was added to bits.
     */
    static bool add_class_escape(char esc, char_bits& bits)
    {
        char_bits tmp{};

        switch (esc) {
            case 'd':
                add_digits(bits);
                return true;
            case 'w':
                add_word(bits);
                return true;
            case 's':
                add_space(bits);
                return true;
            case 'D':
                add_digits(tmp);
                break;
            case 'W':
                add_word(tmp);
                break;
            case 'S':
                add_space(tmp);
                break;
            default:
                return false;
        }

        auto comp = complement(tmp);
        for (size_t ch = 0; ch < bits.size(); ch++) {
            bits[ch] = bits[ch] || comp[ch];
        }
        return true;
    }

    /**
     * Decode a single-character escape, like "\." or "\n", whose
     * backslash has already been consumed.
     */
    Result<char, regex_enum::parse_error> parse_char_escape()
    {
        if (this->at_end()) {
            return Err(regex_enum::parse_error{
                (size_t) this->p_index,
                "pattern ends with a backslash",
            });
        }

        auto esc = this->peek();

        this->p_index += 1;
        switch (esc) {
            case 'n':
                return Ok('\n');
            case 't':
                return Ok('\t');
            case 'r':
                return Ok('\r');
            case 'f':
                return Ok('\f');
            case 'x': {
                int value = 0;
                int digits = 0;

                while (digits < 2 && isxdigit(this->peek())) {
                    auto ch = this->peek();

                    value = value * 16
                        + (isdigit(ch) ? ch - '0' : tolower(ch) - 'a' + 10);
                    digits += 1;
                    this->p_index += 1;
                }
                if (digits == 0 || value >= 0x80) {
                    return Err(regex_enum::parse_error{
                        (size_t) this->p_index,
                        "only two-digit ASCII \\x escapes are supported",
                    });
                }
                return Ok((char) value);
            }
            default:
                break;
        }

        if ((unsigned char) esc >= 0x80) {
            return Err(regex_enum::parse_error{
                (size_t) this->p_index - 1,
                "escaped non-ASCII characters are not supported",
            });
        }
        if (isdigit(esc)) {
            return Err(regex_enum::parse_error{
                (size_t) this->p_index - 1,
                "back references are not supported",
            });
        }
        if (isalnum(esc)) {
            return Err(regex_enum::parse_error{
                (size_t) this->p_index - 1,
                fmt::format(FMT_STRING("unsupported escape '\\{}'"), esc),
            });
        }
        return Ok(esc);
    }

    Result<node, regex_enum::parse_error> parse_class()
    {
        // the opening bracket has already been consumed
        char_bits bits{};
        bool negated = false;
        bool first = true;

        if (this->peek() == '^') {
            negated = true;
            this->p_index += 1;
        }

        while (true) {
            if (this->at_end()) {
                return this->error("missing terminating ] for character class");
            }

            auto ch = this->peek();
            int low;

            if (ch == ']' && !first) {
                this->p_index += 1;
                break;
            }
            first = false;

            if (ch == '[' && this->peek(1) == ':') {
                TRY(this->parse_posix_class(bits));
                continue;
            }
            if (ch == '\\') {
                this->p_index += 1;
                if (add_class_escape(this->peek(), bits)) {
                    this->p_index += 1;
                    continue;
                }
                if (this->peek() == 'b') {
                    this->p_index += 1;
                    low = '\b';
                } else {
                    low = TRY(this->parse_char_escape());
                }
            } else if ((unsigned char) ch >= 0x80) {
                return this->error(
                    "non-ASCII characters in a class are not supported");
            } else {
                low = ch;
                this->p_index += 1;
            }

            if (this->peek() == '-' && this->peek(1) != ']'
                && this->peek(1) != '\0')
            {
                int high;

                this->p_index += 1;
                if (this->peek() == '\\') {
                    this->p_index += 1;
                    high = TRY(this->parse_char_escape());
                } else {
                    high = this->peek();
                    if (high >= 0x80 || high < 0) {
                        return this->error(
                            "non-ASCII characters in a class are not "
                            "supported");
                    }
                    this->p_index += 1;
                }
                if (high < low) {
                    return this->error("range out of order in character class");
                }
                add_range(bits, low, high);
            } else {
                bits[low] = true;
            }
        }

        if (negated) {
            bits = complement(bits);
        }

        return Ok(make_char_set(bits));
    }

    Result<node, regex_enum::parse_error> parse_posix_class(char_bits& bits)
    {
        static const struct {
            const char* name;
            void (*adder)(char_bits&);
        } POSIX_CLASSES[] = {
            {"[:digit:]", [](char_bits& b) { add_digits(b); }},
            {"[:alpha:]",
             [](char_bits& b) {
                 add_range(b, 'a', 'z');
                 add_range(b, 'A', 'Z');
             }},
            {"[:alnum:]",
             [](char_bits& b) {
                 add_range(b, 'a', 'z');
                 add_range(b, 'A', 'Z');
                 add_digits(b);
             }},
            {"[:lower:]", [](char_bits& b) { add_range(b, 'a', 'z'); }},
            {"[:upper:]", [](char_bits& b) { add_range(b, 'A', 'Z'); }},
            {"[:space:]", [](char_bits& b) { add_space(b); }},
            {"[:xdigit:]",
             [](char_bits& b) {
                 add_digits(b);
                 add_range(b, 'a', 'f');
                 add_range(b, 'A', 'F');
             }},
            {"[:word:]", [](char_bits& b) { add_word(b); }},
        };

        auto rest = this->p_input.substr(this->p_index);
        for (const auto& pc : POSIX_CLASSES) {
            if (rest.startswith(pc.name)) {
                pc.adder(bits);
                this->p_index += strlen(pc.name);
                return Ok(node{});
            }
        }

        return this->error("unsupported POSIX character class");
    }

    Result<node, regex_enum::parse_error> parse_atom()
    {
        auto ch = this->peek();

        switch (ch) {
            case '(':
                this->p_index += 1;
                return this->parse_group();
            case '[':
                this->p_index += 1;
                return this->parse_class();
            case '.': {
                char_bits bits{};

                this->p_index += 1;
                return Ok(make_char_set(complement(bits)));
            }
            case '^':
            case '$':
                this->p_index += 1;
                return Ok(node{});
            case '?':
            case '*':
            case '+':
                return this->error("quantifier does not follow a repeatable "
                                   "item");
            case '{':
                if (this->scan_bounds()) {
                    return this->error(
                        "quantifier does not follow a repeatable item");
                }
                this->p_index += 1;
                return Ok(make_literal("{"));
            case '\\': {
                char_bits bits{};

                this->p_index += 1;
                if (add_class_escape(this->peek(), bits)) {
                    this->p_index += 1;
                    return Ok(make_char_set(bits));
                }
                switch (this->peek()) {
                    case 'b':
                    case 'B':
                    case 'A':
                    case 'z':
                    case 'Z':
                        // assertions consume no input
                        this->p_index += 1;
                        return Ok(node{});
                    default:
                        break;
                }
                auto esc = TRY(this->parse_char_escape());
                return Ok(make_literal(std::string(1, esc)));
            }
            default:
                break;
        }

        auto start = this->p_index;

        this->p_index += 1;
        if ((unsigned char) ch >= 0xc0) {
            // keep multi-byte UTF-8 sequences together
            while (!this->at_end()
                   && ((unsigned char) this->peek() & 0xc0) == 0x80)
            {
                this->p_index += 1;
            }
        }

        return Ok(make_literal(
            this->p_input.sub_range(start, this->p_index).to_string()));
    }

    string_fragment p_input;
    int p_index{0};
};

void
decode_node(const node& nd, uint64_t index, std::string& dst)
{
    switch (nd.n_kind) {
        case node_kind::empty:
            break;
        case node_kind::literal:
            dst.append(nd.n_literal);
            break;
        case node_kind::char_set:
            dst.push_back(nd.n_chars[index % nd.n_chars.size()]);
            break;
        case node_kind::concat: {
            std::vector<uint64_t> digits(nd.n_children.size());

            for (size_t lpc = nd.n_children.size(); lpc > 0; lpc--) {
                auto card = nd.n_children[lpc - 1].n_cardinality;

                digits[lpc - 1] = index % card;
                index /= card;
            }
            for (size_t lpc = 0; lpc < nd.n_children.size(); lpc++) {
                decode_node(nd.n_children[lpc], digits[lpc], dst);
            }
            break;
        }
        case node_kind::alternate: {
            for (const auto& child : nd.n_children) {
                if (index < child.n_cardinality) {
                    decode_node(child, index, dst);
                    return;
                }
                index -= child.n_cardinality;
            }

            // only reachable when the branch total saturated
            auto largest = std::max_element(
                nd.n_children.begin(),
                nd.n_children.end(),
                [](const node& lhs, const node& rhs) {
                    return lhs.n_cardinality < rhs.n_cardinality;
                });
            decode_node(*largest, index % largest->n_cardinality, dst);
            break;
        }
        case node_kind::repeat: {
            const auto& child = nd.n_children.front();

            for (auto count = nd.n_min; count <= nd.n_max; count++) {
                auto term = sat_pow(child.n_cardinality, count);

                if (index < term || count == nd.n_max) {
                    std::vector<uint64_t> digits(count);

                    for (auto lpc = count; lpc > 0; lpc--) {
                        digits[lpc - 1] = index % child.n_cardinality;
                        index /= child.n_cardinality;
                    }
                    for (const auto digit : digits) {
                        decode_node(child, digit, dst);
                    }
                    return;
                }
                index -= term;
            }
            break;
        }
    }
}

}  // namespace

Result<regex_enum, regex_enum::parse_error>
regex_enum::parse(string_fragment pattern)
{
    parser pars(pattern);
    auto root = TRY(pars.parse_all());

    if (root.n_cardinality == 0) {
        return Err(parse_error{
            0,
            "pattern does not match any printable string",
        });
    }

    log_trace("parsed enumerable pattern of %d bytes; cardinality=%llu",
              pattern.length(),
              (unsigned long long) root.n_cardinality);

    return Ok(regex_enum{pattern.to_string(), std::move(root)});
}

std::string
regex_enum::decode(uint64_t index) const
{
    std::string retval;

    decode_node(this->re_root, index % this->re_root.n_cardinality, retval);

    return retval;
}

}  // namespace redact
