
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "parse.h"

namespace capcheck {

parser::parser( std::vector<error_entry>& errors_ )
    : errors{ errors_ }
{ }


//-----------------------------------------------------------------------
//  parse
//
//G invocation:
//G     invocation-keyword '(' expression '=>' bound-list scope-clause? ')'
//G
//G invocation-keyword: one of
//G     'assertConstraint' 'wrapOpaque'
//G
auto parser::parse(
    invocation_site const&    site,
    std::string_view          body,
    std::vector<token> const& tokens_
)
    -> std::unique_ptr<invocation_node>
{
    parse_kind   = std::string{keyword_of(site.kind)} + " invocation";
    fallback_pos = site.pos;

    //  Set per-parse state for the duration of this call
    tokens = &tokens_;
    pos    = 0;

    auto n = std::make_unique<invocation_node>();
    n->kind           = site.kind;
    n->pos            = site.pos;
    n->expression_pos = site.body_pos;

    //  The expression is everything up to the '=>', kept as written
    auto arrow = find_fat_arrow();
    if (arrow < 0) {
        error(
            "missing '=>' between the expression and its capability bounds in " + parse_kind,
            false,
            site.pos
        );
        return {};
    }

    //  The expression ends with its last token, so a comment before
    //  the '=>' is not part of it
    n->fat_arrow = &(*tokens)[arrow];
    if (arrow > 0) {
        auto last = (*tokens)[arrow-1].as_string_view();
        n->expression = body.substr(
            0,
            __as<std::size_t>(last.data() + last.size() - body.data())
        );
    }
    if (trim(n->expression).empty()) {
        error(
            "missing expression before '=>' in " + parse_kind,
            false,
            n->fat_arrow->position()
        );
        return {};
    }

    pos = arrow + 1;
    fallback_pos = n->fat_arrow->position();

    n->bounds = bound_list();
    if (!n->bounds) {
        return {};
    }

    if (at(lexeme::Semicolon))
    {
        if (site.kind == invocation_kind::assert_constraint) {
            error(
                "a scope qualifier is only allowed in wrapOpaque, not in assertConstraint",
                false,
                curr().position()
            );
            return {};
        }
        n->scope = scope_clause();
        if (!n->scope) {
            return {};
        }
    }

    if (!done())
    {
        if (at(lexeme::Greater)) {
            error("unbalanced '>' after the capability bounds");
        }
        else if (n->scope) {
            error("unexpected text after the scope qualifier");
        }
        else {
            error("unexpected text after the capability bounds");
        }
        return {};
    }

    return n;
}


//-----------------------------------------------------------------------
//  Error reporting: Fed into the supplied this->errors object
//
//  msg                 message to be printed
//
//  include_curr_token  whether to show the token we stopped at
//
auto parser::error(
    char const*     msg,
    bool            include_curr_token,
    source_position err_pos,
    bool            fallback
) const
    -> void
{
    auto m = std::string{msg};
    auto i = done() ? -1 : 0;
    auto t = peek(i);
    if (include_curr_token && t) {
        if (i < 0) {
            m += std::string(" (after '") + t->to_string() + "')";
        }
        else {
            m += std::string(" (at '") + t->to_string() + "')";
        }
    }
    if (
        err_pos == source_position{}
    ) {
        err_pos = t ? t->position() : fallback_pos;
    }
    errors.emplace_back( err_pos, m, false, fallback );
}

auto parser::error(
    std::string const& msg,
    bool               include_curr_token,
    source_position    err_pos,
    bool               fallback
) const
    -> void
{
    error( msg.c_str(), include_curr_token, err_pos, fallback );
}


//-----------------------------------------------------------------------
//  Token navigation: Only these functions should access this->token_
//
auto parser::curr() const
    -> token const&
{
    if (done()) {
        throw std::runtime_error("unexpected end of " + parse_kind);
    }

    return (*tokens)[pos];
}

auto parser::peek(int num) const
    -> token const*
{
    assert (tokens);
    if (
        pos + num >= 0
        && pos + num < std::ssize(*tokens)
        )
    {
        return &(*tokens)[pos + num];
    }
    return {};
}

auto parser::done() const
    -> bool
{
    assert (tokens);
    assert (pos <= std::ssize(*tokens));
    return pos == std::ssize(*tokens);
}

auto parser::next(int num)
    -> void
{
    assert (tokens);
    pos = std::min( pos+num, __as<int>(std::ssize(*tokens)) );
}

auto parser::at(lexeme l) const
    -> bool
{
    return
        !done()
        && curr().type() == l
        ;
}


auto parser::find_fat_arrow() const
    -> int
{
    assert (tokens);
    auto depth = 0;
    for (auto i = 0; i < std::ssize(*tokens); ++i)
    {
        switch ((*tokens)[i].type()) {
        break;case lexeme::LeftParen:
              case lexeme::LeftBracket:
              case lexeme::LeftBrace:
            ++depth;
        break;case lexeme::RightParen:
              case lexeme::RightBracket:
              case lexeme::RightBrace:
            --depth;
        break;case lexeme::FatArrow:
            if (depth == 0) {
                return i;
            }
        break;default:
            ;
        }
    }
    return -1;
}


//-----------------------------------------------------------------------
//  Parsers for bounds
//

//G qualified-name:
//G     '::'? identifier
//G     qualified-name '.' identifier
//G     qualified-name '::' identifier
//G
auto parser::qualified_name()
    -> std::unique_ptr<qualified_name_node>
{
    auto n = std::make_unique<qualified_name_node>();

    //  Handle initial :: if present, else the first scope_op will be null
    token const* scope_op = {};
    if (at(lexeme::Scope)) {
        scope_op = &curr();
        next();
        if (!at(lexeme::Identifier)) {
            error("expected a name after '::'");
            return {};
        }
    }

    if (!at(lexeme::Identifier)) {
        return {};
    }
    n->ids.emplace_back( scope_op, &curr() );
    next();

    while (
        at(lexeme::Dot)
        || at(lexeme::Scope)
        )
    {
        auto op = &curr();
        next();
        if (!at(lexeme::Identifier)) {
            error("expected a name after '" + op->to_string() + "'");
            return {};
        }
        n->ids.emplace_back( op, &curr() );
        next();
    }

    return n;
}


//G template-args:
//G     '<' type-arg-list '>'
//G
//G type-arg-list:
//G     type-arg
//G     type-arg-list ',' type-arg
//G
auto parser::template_args(bound_node& n)
    -> bool
{
    assert (at(lexeme::Less));
    assert (n.name);

    auto missing_close = [&]{
        error(
            "missing '>' to close the template argument list of '" + n.name->to_string() + "'",
            false,
            n.open_angle
        );
    };

    n.open_angle = curr().position();
    next();

    if (done()) {
        missing_close();
        return false;
    }
    if (at(lexeme::Greater)) {
        error("empty template argument list for '" + n.name->to_string() + "'", false, n.open_angle);
        return false;
    }

    auto term = template_argument{};

    do {
        if (done()) {
            missing_close();
            return false;
        }

        auto errors_size = std::ssize(errors);
        term.arg = type_arg();
        if (!term.arg) {
            if (std::ssize(errors) == errors_size) {
                error("expected a template argument for '" + n.name->to_string() + "'");
            }
            return false;
        }

        n.template_args.push_back( std::move(term) );
        term = template_argument{};
    }
    //  Use the lambda trick to jam in a "next" clause
    while (
        at(lexeme::Comma)
        && [&]{term.comma = curr().position(); next(); return true;}()
    );

    if (done()) {
        missing_close();
        return false;
    }
    if (!at(lexeme::Greater)) {
        error("expected ',' or '>' in the template argument list of '" + n.name->to_string() + "'");
        return false;
    }

    n.close_angle = curr().position();
    next();
    return true;
}


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
auto parser::type_arg()
    -> std::unique_ptr<type_arg_node>
{
    auto n = std::make_unique<type_arg_node>();

    while (
        at(lexeme::Keyword)
        && curr() == "const"
        )
    {
        n->cv_qualifiers.push_back( &curr() );
        next();
    }

    if (done()) {
        return {};
    }

    //  Non-type arguments
    if (
        curr().type() == lexeme::IntegerLiteral
        || curr() == "true"
        || curr() == "false"
        )
    {
        if (!n->cv_qualifiers.empty()) {
            error("a literal template argument cannot be 'const'");
            return {};
        }
        n->type = &curr();
        next();
        return n;
    }

    if (curr().type() == lexeme::FundamentalType) {
        n->type = &curr();
        next();
    }
    else if (auto b = bound()) {
        n->type = std::move(b);
    }
    else {
        return {};
    }

    while (
        at(lexeme::Multiply)
        || at(lexeme::Ampersand)
        || at(lexeme::LogicalAnd)
        || (at(lexeme::Keyword) && curr() == "const")
        )
    {
        n->declarators.push_back( &curr() );
        next();
    }

    return n;
}


//G bound:
//G     qualified-name template-args?
//G
auto parser::bound()
    -> std::unique_ptr<bound_node>
{
    auto name = qualified_name();
    if (!name) {
        return {};
    }

    auto n = std::make_unique<bound_node>();
    n->name = std::move(name);

    if (
        at(lexeme::Less)
        && !template_args(*n)
        )
    {
        return {};
    }

    return n;
}


//G bound-list:
//G     bound
//G     bound-list '+' bound
//G
auto parser::bound_list()
    -> std::unique_ptr<bound_list_node>
{
    auto n = std::make_unique<bound_list_node>();

    auto term = bound_list_node::term{nullptr};

    auto errors_size = std::ssize(errors);
    term.bound = bound();
    if (!term.bound) {
        if (std::ssize(errors) == errors_size) {
            error("expected a capability bound after '=>'", !done(), done() ? fallback_pos : source_position{});
        }
        return {};
    }
    n->terms.push_back( std::move(term) );

    while (at(lexeme::Plus))
    {
        auto term = bound_list_node::term{ &curr() };
        next();

        errors_size = std::ssize(errors);
        term.bound = bound();
        if (!term.bound) {
            if (std::ssize(errors) == errors_size) {
                error("expected a capability bound after '+'", !done(), done() ? term.op->position() : source_position{});
            }
            return {};
        }
        n->terms.push_back( std::move(term) );
    }

    return n;
}


//G scope-clause:
//G     ';' 'static'
//G     ';' qualified-name
//G
auto parser::scope_clause()
    -> std::unique_ptr<scope_node>
{
    assert (at(lexeme::Semicolon));

    auto n = std::make_unique<scope_node>();
    n->semicolon = &curr();
    next();

    if (
        at(lexeme::Keyword)
        && curr() == "static"
        )
    {
        n->static_kw = &curr();
        next();
        return n;
    }

    auto errors_size = std::ssize(errors);
    n->name = qualified_name();
    if (!n->name) {
        if (std::ssize(errors) == errors_size) {
            error("expected 'static' or a scope name after ';'", !done(), done() ? n->semicolon->position() : source_position{});
        }
        return {};
    }

    return n;
}

}
