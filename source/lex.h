
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.


//===========================================================================
//  Lexer
//===========================================================================

#ifndef __CAPCHECK_LEX
#define __CAPCHECK_LEX

#include "io.h"


namespace capcheck {

//-----------------------------------------------------------------------
//
//  lexeme: represents the type of a token
//
//  Only the tokens a bound list is made of are told apart; everything
//  else an expression may contain is Other
//
//-----------------------------------------------------------------------
//

enum class lexeme : std::int8_t {
    FatArrow,
    GreaterEq,
    Greater,
    Less,
    Plus,
    LogicalAnd,
    Ampersand,
    Multiply,
    LeftBrace,
    RightBrace,
    LeftParen,
    RightParen,
    LeftBracket,
    RightBracket,
    Scope,
    Colon,
    Semicolon,
    Comma,
    Dot,
    IntegerLiteral,
    FloatLiteral,
    StringLiteral,
    CharacterLiteral,
    Keyword,
    FundamentalType,
    Identifier,
    Other,
    None = 127
};

template<typename T>
    requires std::is_same_v<T, std::string>
auto __as(lexeme l)
    -> std::string
{
    switch (l) {
    break;case lexeme::FatArrow:            return "FatArrow";
    break;case lexeme::GreaterEq:           return "GreaterEq";
    break;case lexeme::Greater:             return "Greater";
    break;case lexeme::Less:                return "Less";
    break;case lexeme::Plus:                return "Plus";
    break;case lexeme::LogicalAnd:          return "LogicalAnd";
    break;case lexeme::Ampersand:           return "Ampersand";
    break;case lexeme::Multiply:            return "Multiply";
    break;case lexeme::LeftBrace:           return "LeftBrace";
    break;case lexeme::RightBrace:          return "RightBrace";
    break;case lexeme::LeftParen:           return "LeftParen";
    break;case lexeme::RightParen:          return "RightParen";
    break;case lexeme::LeftBracket:         return "LeftBracket";
    break;case lexeme::RightBracket:        return "RightBracket";
    break;case lexeme::Scope:               return "Scope";
    break;case lexeme::Colon:               return "Colon";
    break;case lexeme::Semicolon:           return "Semicolon";
    break;case lexeme::Comma:               return "Comma";
    break;case lexeme::Dot:                 return "Dot";
    break;case lexeme::IntegerLiteral:      return "IntegerLiteral";
    break;case lexeme::FloatLiteral:        return "FloatLiteral";
    break;case lexeme::StringLiteral:       return "StringLiteral";
    break;case lexeme::CharacterLiteral:    return "CharacterLiteral";
    break;case lexeme::Keyword:             return "Keyword";
    break;case lexeme::FundamentalType:     return "FundamentalType";
    break;case lexeme::Identifier:          return "Identifier";
    break;case lexeme::Other:               return "Other";
    break;case lexeme::None:                return "(NONE)";
    break;default:                          return "INTERNAL-ERROR";
    }
};


//-----------------------------------------------------------------------
//
//  token: a lexeme and its location in the source text
//
//-----------------------------------------------------------------------
//
class token
{
public:
    token(
        char const*     start,
        auto            count,
        source_position pos,
        lexeme          type
    )
      : sv      {start, __as<std::size_t>(count)}
      , pos     {pos}
      , lex_type{type}
    {
    }

    auto as_string_view() const
        -> std::string_view
    {
        assert (sv.data());
        return sv;
    }

    operator std::string_view() const
    {
        return as_string_view();
    }

    auto operator== (token const& t) const
        -> bool
    {
        return operator std::string_view() == t.operator std::string_view();
    }

    auto operator== (std::string_view s) const
        -> bool
    {
        return s == this->operator std::string_view();
    }

    auto to_string() const
        -> std::string
    {
        return std::string{sv};
    }

    friend auto operator<< (auto& o, token const& t)
        -> auto&
    {
        return o << std::string_view(t);
    }

    auto position() const -> source_position { return pos;       }

    auto type    () const -> lexeme          { return lex_type;  }

    auto visit(auto& v, int depth) const
        -> void
    {
        v.start(*this, depth);
    }

private:
    std::string_view sv;
    source_position  pos;
    lexeme           lex_type;
};

//-----------------------------------------------------------------------
//
//  lex: tokenize the text of an invocation body
//
//  text        the text to tokenize; tokens refer into it
//  start       source position of text[0]
//  errors      error list
//
//  Comments are dropped. A '>' is always its own token (except in '>='),
//  so that 'A<B<C>>' closes two template argument lists.
//
//-----------------------------------------------------------------------
//
auto lex(
    std::string_view          text,
    source_position           start,
    std::vector<error_entry>& errors
)
    -> std::vector<token>;

}

#endif
