
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "lex.h"

namespace capcheck {

//-----------------------------------------------------------------------
//  Keywords
//

//G fundamental-type-keyword: one of
//G     'void' 'bool' 'char' 'char8_t' 'char16_t' 'char32_t' 'wchar_t'
//G     'short' 'int' 'long' 'signed' 'unsigned' 'float' 'double'
//G
static auto is_fundamental_type_keyword(std::string_view s)
    -> bool
{
    static constexpr std::string_view keys[] = {
        "void", "bool", "char", "char8_t", "char16_t", "char32_t", "wchar_t",
        "short", "int", "long", "signed", "unsigned", "float", "double"
    };
    return std::find(std::begin(keys), std::end(keys), s) != std::end(keys);
}

//G keyword: one of
//G     'const' 'static' 'true' 'false'
//G
static auto is_keyword(std::string_view s)
    -> bool
{
    static constexpr std::string_view keys[] = {
        "const", "static", "true", "false"
    };
    return std::find(std::begin(keys), std::end(keys), s) != std::end(keys);
}


//-----------------------------------------------------------------------
//
//  lex
//
//-----------------------------------------------------------------------
//
auto lex(
    std::string_view          text,
    source_position           start,
    std::vector<error_entry>& errors
)
    -> std::vector<token>
{
    auto tokens = std::vector<token>{};

    auto i   = std::size_t{0};
    auto pos = start;

    //  Local helper functions for readability
    //
    auto peek = [&](int num) {
        return (i+num < text.size()) ? text[i+num] : '\0';
    };

    auto advance = [&](std::size_t n) {
        while (n-- > 0 && i < text.size()) {
            if (text[i] == '\n') {
                ++pos.lineno;
                pos.colno = 1;
            }
            else {
                ++pos.colno;
            }
            ++i;
        }
    };

    auto store = [&](std::size_t num, lexeme type) {
        tokens.emplace_back( &text[i], num, pos, type );
        advance(num);
    };

    //  Returns the length of a quoted literal starting at i+prefix
    auto quoted_length = [&](std::size_t prefix, char quote) -> std::size_t {
        auto j = i + prefix + 1;
        while (j < text.size() && text[j] != quote && text[j] != '\n') {
            if (text[j] == '\\') {
                ++j;
            }
            ++j;
        }
        if (j >= text.size() || text[j] != quote) {
            errors.emplace_back(
                pos,
                quote == '"'
                    ? "string literal is missing its closing \""
                    : "character literal is missing its closing '"
            );
            return std::min(j, text.size()) - i;
        }
        return j + 1 - i;
    };

    auto raw_string_length = [&](std::size_t prefix) -> std::size_t {
        auto open = i + prefix + 1;
        auto paren_pos = text.find('(', open);
        if (paren_pos != text.npos) {
            auto closing_seq = ")" + std::string{text.substr(open, paren_pos - open)} + "\"";
            if (auto end_pos = text.find(closing_seq, paren_pos);
                end_pos != text.npos
                )
            {
                return end_pos + closing_seq.size() - i;
            }
        }
        errors.emplace_back(
            pos,
            "raw string literal is missing its closing delimiter"
        );
        return text.size() - i;
    };

    auto number_length = [&]() -> std::size_t {
        auto j    = i;
        auto prev = '\0';
        while (j < text.size())
        {
            auto c    = text[j];
            auto next = (j+1 < text.size()) ? text[j+1] : '\0';
            if (
                is_identifier_continue(c)
                || c == '.'
                || (c == '\'' && is_identifier_continue(next))
                || (
                    (c == '+' || c == '-')
                    && (prev == 'e' || prev == 'E' || prev == 'p' || prev == 'P')
                    )
                )
            {
                prev = c;
                ++j;
            }
            else {
                break;
            }
        }
        return j - i;
    };

    while (i < text.size())
    {
        auto c = peek(0);

        //  Whitespace and comments
        //
        if (isspace(static_cast<unsigned char>(c))) {
            advance(1);
            continue;
        }
        if (c == '/' && peek(1) == '/') {
            while (i < text.size() && peek(0) != '\n') {
                advance(1);
            }
            continue;
        }
        if (c == '/' && peek(1) == '*') {
            auto end_pos = text.find("*/", i+2);
            if (end_pos == text.npos) {
                errors.emplace_back(
                    pos,
                    "comment is missing its closing */"
                );
                break;
            }
            advance(end_pos + 2 - i);
            continue;
        }

        //  Identifiers, keywords, and literals with an encoding prefix
        //
        if (auto j = starts_with_identifier(text.substr(i)); j > 0)
        {
            auto id = text.substr(i, j);
            auto after = peek(j);

            if (
                after == '"'
                && (id == "R" || id == "u8R" || id == "uR" || id == "UR" || id == "LR")
                )
            {
                store(raw_string_length(j), lexeme::StringLiteral);
            }
            else if (
                (after == '"' || after == '\'')
                && (id == "u8" || id == "u" || id == "U" || id == "L")
                )
            {
                store(quoted_length(j, after), after == '"' ? lexeme::StringLiteral : lexeme::CharacterLiteral);
            }
            else if (is_fundamental_type_keyword(id))
            {
                //  Multi-word types like 'unsigned long int' are one token
                auto end = __as<std::size_t>(j);
                auto k   = i + end;
                while (true) {
                    while (k < text.size() && isspace(static_cast<unsigned char>(text[k]))) {
                        ++k;
                    }
                    auto n = starts_with_identifier(text.substr(k));
                    if (
                        n == 0
                        || !is_fundamental_type_keyword(text.substr(k, n))
                        )
                    {
                        break;
                    }
                    k  += n;
                    end = k - i;
                }
                store(end, lexeme::FundamentalType);
            }
            else if (is_keyword(id)) {
                store(j, lexeme::Keyword);
            }
            else {
                store(j, lexeme::Identifier);
            }
            continue;
        }

        //  Numbers
        //
        if (
            is_digit(c)
            || (c == '.' && is_digit(peek(1)))
            )
        {
            auto n = number_length();
            auto s = text.substr(i, n);
            auto hex = s.starts_with("0x") || s.starts_with("0X");
            auto is_float =
                s.find('.') != s.npos
                || (!hex && s.find_first_of("eE") != s.npos)
                || (hex && s.find_first_of("pP") != s.npos);
            store(n, is_float ? lexeme::FloatLiteral : lexeme::IntegerLiteral);
            continue;
        }

        //  Punctuators
        //
        switch (c)
        {
        break;case '"':
            store(quoted_length(0, '"'), lexeme::StringLiteral);

        break;case '\'':
            store(quoted_length(0, '\''), lexeme::CharacterLiteral);

        break;case '=':
            if (peek(1) == '>') {
                store(2, lexeme::FatArrow);
            }
            else if (peek(1) == '=') {
                store(2, lexeme::Other);
            }
            else {
                store(1, lexeme::Other);
            }

        break;case '>':
            if (peek(1) == '=') {
                store(2, lexeme::GreaterEq);
            }
            else {
                store(1, lexeme::Greater);
            }

        break;case '<':
            if (peek(1) == '=' && peek(2) == '>') {
                store(3, lexeme::Other);
            }
            else if (peek(1) == '<' || peek(1) == '=') {
                store(2, lexeme::Other);
            }
            else {
                store(1, lexeme::Less);
            }

        break;case '+':
            if (peek(1) == '+' || peek(1) == '=') {
                store(2, lexeme::Other);
            }
            else {
                store(1, lexeme::Plus);
            }

        break;case '&':
            if (peek(1) == '&') {
                store(2, lexeme::LogicalAnd);
            }
            else if (peek(1) == '=') {
                store(2, lexeme::Other);
            }
            else {
                store(1, lexeme::Ampersand);
            }

        break;case '*':
            if (peek(1) == '=') {
                store(2, lexeme::Other);
            }
            else {
                store(1, lexeme::Multiply);
            }

        break;case ':':
            if (peek(1) == ':') {
                store(2, lexeme::Scope);
            }
            else {
                store(1, lexeme::Colon);
            }

        break;case '.':
            if (peek(1) == '.' && peek(2) == '.') {
                store(3, lexeme::Other);
            }
            else {
                store(1, lexeme::Dot);
            }

        break;case '-':
            if (peek(1) == '>' || peek(1) == '-' || peek(1) == '=') {
                store(2, lexeme::Other);
            }
            else {
                store(1, lexeme::Other);
            }

        break;case '{': store(1, lexeme::LeftBrace);
        break;case '}': store(1, lexeme::RightBrace);
        break;case '(': store(1, lexeme::LeftParen);
        break;case ')': store(1, lexeme::RightParen);
        break;case '[': store(1, lexeme::LeftBracket);
        break;case ']': store(1, lexeme::RightBracket);
        break;case ';': store(1, lexeme::Semicolon);
        break;case ',': store(1, lexeme::Comma);

        break;default:
            store(1, lexeme::Other);
        }
    }

    return tokens;
}

}
