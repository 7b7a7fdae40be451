
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
//  Parser
//===========================================================================

#ifndef __CAPCHECK_PARSE
#define __CAPCHECK_PARSE

#include "parse_tree.h"
#include <memory>
#include <variant>
#include <iostream>

namespace capcheck {

//-----------------------------------------------------------------------
//
//  parser: parses the body of one invocation
//
//-----------------------------------------------------------------------
//
class parser
{
    std::vector<error_entry>& errors;

    std::vector<token> const* tokens = {};
    int pos = 0;
    std::string parse_kind = {};

    //  Where to report a problem when there is no token to point at
    source_position fallback_pos = {};

public:
    //-----------------------------------------------------------------------
    //  Constructor
    //
    //  errors      error list
    //
    parser( std::vector<error_entry>& errors_ );

    //-----------------------------------------------------------------------
    //  parse
    //
    //  site        the invocation being parsed
    //  body        the text between the invocation's parentheses
    //  tokens      the tokens of body
    //
    //  Returns the invocation's parse tree, or null if there were errors
    //
    auto parse(
        invocation_site const&    site,
        std::string_view          body,
        std::vector<token> const& tokens_
    )
        -> std::unique_ptr<invocation_node>;

private:
    //-----------------------------------------------------------------------
    //  Error reporting: Fed into the supplied this->errors object
    //
    //  msg                 message to be printed
    //
    //  include_curr_token  whether to show the token we stopped at
    //
    auto error(
        char const*     msg,
        bool            include_curr_token = true,
        source_position err_pos            = {},
        bool            fallback           = false
    ) const
        -> void;

    auto error(
        std::string const& msg,
        bool               include_curr_token = true,
        source_position    err_pos            = {},
        bool               fallback           = false
    ) const
        -> void;


    //-----------------------------------------------------------------------
    //  Token navigation: Only these functions should access this->token_
    //
    auto curr() const
        -> token const&;

    auto peek(int num) const
        -> token const*;

    auto done() const
        -> bool;

    auto next(int num = 1)
        -> void;

    //  Is the current token of type l, without running off the end
    auto at(lexeme l) const
        -> bool;


    //-----------------------------------------------------------------------
    //  Parsers for bounds
    //

    //G qualified-name:
    //G     '::'? identifier
    //G     qualified-name '.' identifier
    //G     qualified-name '::' identifier
    //G
    auto qualified_name()
        -> std::unique_ptr<qualified_name_node>;

    //G template-args:
    //G     '<' type-arg-list '>'
    //G
    //G type-arg-list:
    //G     type-arg
    //G     type-arg-list ',' type-arg
    //G
    auto template_args(bound_node& n)
        -> bool;

    //G type-arg:
    //G     'const'* type-arg-name declarator*
    //G     integer-literal
    //G     'true'
    //G     'false'
    //G
    //G type-arg-name:
    //G     fundamental-type-keyword+
    //G     qualified-name template-args?
    //G
    //G declarator: one of
    //G     '*' '&' '&&' 'const'
    //G
    auto type_arg()
        -> std::unique_ptr<type_arg_node>;

    //G bound:
    //G     qualified-name template-args?
    //G
    auto bound()
        -> std::unique_ptr<bound_node>;

    //G bound-list:
    //G     bound
    //G     bound-list '+' bound
    //G
    auto bound_list()
        -> std::unique_ptr<bound_list_node>;

    //G scope-clause:
    //G     ';' 'static'
    //G     ';' qualified-name
    //G
    auto scope_clause()
        -> std::unique_ptr<scope_node>;

    //  The first '=>' not nested in (), [] or {}, or -1
    auto find_fat_arrow() const
        -> int;
};

}

#endif
