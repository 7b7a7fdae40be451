
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "io.h"

namespace capcheck {

auto keyword_of(invocation_kind k)
    -> std::string_view
{
    switch (k) {
    break;case invocation_kind::assert_constraint: return "assertConstraint";
    break;case invocation_kind::wrap_opaque:       return "wrapOpaque";
    break;default:                                 return "";
    }
}


//---------------------------------------------------------------------------
//  cpp_scanner: walks C++ text one character at a time, just enough to
//  know what to skip over
//
//  Comments and string, character and raw string literals are consumed
//  whole; pp-numbers too, so a digit separator is not taken for the start
//  of a character literal
//
class cpp_scanner
{
    std::string_view text;
    std::size_t      i = 0;
    source_position  pos;

    //  The last two characters of code seen, ignoring whitespace and comments
    char prev1 = ' ';
    char prev2 = ' ';

public:
    cpp_scanner(std::string_view t, source_position start)
        : text{t}
        , pos {start}
    {
    }

    auto done() const -> bool            { return i >= text.size(); }
    auto offset() const -> std::size_t   { return i; }
    auto position() const -> source_position { return pos; }

    auto peek(int num = 0) const
        -> char
    {
        return (i+num < text.size()) ? text[i+num] : '\0';
    }

    auto advance()
        -> void
    {
        assert (!done());
        if (text[i] == '\n') {
            ++pos.lineno;
            pos.colno = 1;
        }
        else {
            ++pos.colno;
        }
        ++i;
    }

    auto advance(std::size_t n)
        -> void
    {
        while (n-- > 0 && !done()) {
            advance();
        }
    }

    //  Is the last code seen a member access or qualification,
    //  so that a following identifier is not a free name
    auto after_member_access() const
        -> bool
    {
        return
            prev1 == '.'
            || (prev1 == '>' && prev2 == '-')
            || (prev1 == ':' && prev2 == ':')
            ;
    }

    //-----------------------------------------------------------------------
    //  skip_space_and_comments: returns whether anything was skipped
    //
    auto skip_space_and_comments()
        -> bool
    {
        auto skipped = false;
        while (!done())
        {
            if (isspace(static_cast<unsigned char>(peek()))) {
                advance();
            }
            else if (peek() == '/' && peek(1) == '/') {
                while (!done() && peek() != '\n') {
                    advance();
                }
            }
            else if (peek() == '/' && peek(1) == '*') {
                advance(2);
                while (!done() && !(peek() == '*' && peek(1) == '/')) {
                    advance();
                }
                advance(2);
            }
            else {
                break;
            }
            skipped = true;
        }
        return skipped;
    }

    //-----------------------------------------------------------------------
    //  next: consumes one unit of code; if it was an identifier, returns it
    //
    auto next()
        -> std::string_view
    {
        if (skip_space_and_comments()) {
            return {};
        }
        if (done()) {
            return {};
        }

        auto c = peek();

        //  Identifier, possibly a literal's encoding prefix
        if (auto j = starts_with_identifier(text.substr(i)); j > 0)
        {
            auto id = text.substr(i, j);
            advance(j);
            if (peek() == '"') {
                if (id == "R" || id == "u8R" || id == "uR" || id == "UR" || id == "LR") {
                    skip_raw_string_literal();
                    note('"');
                    return {};
                }
                if (id == "u8" || id == "u" || id == "U" || id == "L") {
                    skip_quoted('"');
                    note('"');
                    return {};
                }
            }
            else if (
                peek() == '\''
                && (id == "u8" || id == "u" || id == "U" || id == "L")
                )
            {
                skip_quoted('\'');
                note('\'');
                return {};
            }
            note('a');
            return id;
        }

        //  pp-number
        if (
            is_digit(c)
            || (c == '.' && is_digit(peek(1)))
            )
        {
            skip_number();
            note('0');
            return {};
        }

        if (c == '"' || c == '\'') {
            skip_quoted(c);
            note(c);
            return {};
        }

        note(c);
        advance();
        return {};
    }

private:
    auto note(char c)
        -> void
    {
        prev2 = prev1;
        prev1 = c;
    }

    auto skip_quoted(char quote)
        -> void
    {
        assert (peek() == quote);
        advance();
        while (!done() && peek() != quote && peek() != '\n') {
            if (peek() == '\\') {
                advance();
            }
            advance();
        }
        if (peek() == quote) {
            advance();
        }
    }

    auto skip_raw_string_literal()
        -> void
    {
        assert (peek() == '"');
        advance();
        auto paren_pos = text.find('(', i);
        if (paren_pos == text.npos) {
            advance(text.size() - i);
            return;
        }
        auto closing_seq = ")" + std::string{text.substr(i, paren_pos - i)} + "\"";
        auto end_pos = text.find(closing_seq, paren_pos);
        if (end_pos == text.npos) {
            advance(text.size() - i);
            return;
        }
        advance(end_pos + closing_seq.size() - i);
    }

    auto skip_number()
        -> void
    {
        auto prev = '\0';
        while (!done())
        {
            auto c = peek();
            if (
                is_identifier_continue(c)
                || c == '.'
                || (c == '\'' && is_identifier_continue(peek(1)))
                || (
                    (c == '+' || c == '-')
                    && (prev == 'e' || prev == 'E' || prev == 'p' || prev == 'P')
                    )
                )
            {
                prev = c;
                advance();
            }
            else {
                break;
            }
        }
    }
};


//---------------------------------------------------------------------------
//  find_invocations
//
auto find_invocations(
    std::string_view          text,
    source_position           start,
    std::vector<error_entry>& errors
)
    -> std::vector<invocation_site>
{
    auto ret = std::vector<invocation_site>{};
    auto scan = cpp_scanner{text, start};

    while (!scan.done())
    {
        auto member  = scan.after_member_access();
        auto begin   = scan.offset();
        auto begin_pos = scan.position();
        auto id      = scan.next();

        if (id.empty() || member) {
            continue;
        }

        auto kind = invocation_kind{};
        if (id == keyword_of(invocation_kind::assert_constraint)) {
            kind = invocation_kind::assert_constraint;
        }
        else if (id == keyword_of(invocation_kind::wrap_opaque)) {
            kind = invocation_kind::wrap_opaque;
        }
        else {
            continue;
        }

        //  A name not followed by ( is some other use of the name
        scan.skip_space_and_comments();
        if (scan.peek() != '(') {
            continue;
        }
        scan.next();

        auto site       = invocation_site{kind};
        site.begin      = begin;
        site.pos        = begin_pos;
        site.body_begin = scan.offset();
        site.body_pos   = scan.position();

        //  Find the matching )
        auto depth = 1;
        while (!scan.done())
        {
            auto here = scan.offset();
            auto c    = scan.peek();
            scan.next();
            if (scan.offset() != here + 1) {
                continue;   // not a single punctuation character
            }
            if (c == '(') {
                ++depth;
            }
            else if (c == ')') {
                if (--depth == 0) {
                    site.body_end = here;
                    site.end      = scan.offset();
                    break;
                }
            }
        }

        if (depth > 0) {
            errors.emplace_back(
                begin_pos,
                "missing ')' to close " + std::string{id} + " invocation"
            );
            break;
        }

        ret.push_back(site);
    }

    return ret;
}

}
