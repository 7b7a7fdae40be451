
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef __CAPCHECK_PARSE_TREE
#define __CAPCHECK_PARSE_TREE

#include "lex.h"
#include <memory>
#include <variant>
#include <iostream>

namespace capcheck {
//-----------------------------------------------------------------------
//
//  Parse tree node types
//
//-----------------------------------------------------------------------
//

//-----------------------------------------------------------------------
//  try_visit
//
//  Helper to visit whatever is in a variant where each
//  alternative is a smart pointer
//
template <int I>
auto try_visit(auto& variant, auto& visitor, int depth)
    -> void
{
    if (variant.index() == I) {
        auto const& s = std::get<I>(variant);
        assert (s);
        s->visit(visitor, depth+1);
    }
}


struct type_arg_node;
struct template_args_tag { };


//  One argument of a template argument list; comma is the position of
//  the ',' before it, or empty for the first argument
//
struct template_argument
{
    source_position                comma;
    std::unique_ptr<type_arg_node> arg;

    auto to_string() const
        -> std::string;
};


//-----------------------------------------------------------------------
//  qualified_name_node: a dotted name, 'a.b.c' or 'a::b::c'
//
struct qualified_name_node
{
    struct term {
        token const* scope_op;      // '.' or '::', null for a first term without a leading '::'
        token const* identifier;

        term( token const* o, token const* id ) : scope_op{o}, identifier{id} { }
    };
    std::vector<term> ids;

    //  A plain name like 'eq', with no qualification at all
    auto is_single_identifier() const
        -> bool
    {
        return
            std::ssize(ids) == 1
            && !ids.front().scope_op
            ;
    }

    auto get_first_token() const
        -> token const*
    {
        assert (
            !ids.empty()
            && ids.front().identifier
        );
        return ids.front().identifier;
    }

    auto to_string() const
        -> std::string;

    auto position() const
        -> source_position
    {
        assert (!ids.empty());
        if (ids.front().scope_op) {
            return ids.front().scope_op->position();
        }
        else {
            assert (ids.front().identifier);
            return ids.front().identifier->position();
        }
    }

    auto visit(auto& v, int depth)
        -> void
    {
        v.start(*this, depth);
        for (auto const& x : ids) {
            if (x.scope_op) {
                x.scope_op->visit(v, depth+1);
            }
            assert(x.identifier);
            x.identifier->visit(v, depth+1);
        }
        v.end(*this, depth);
    }
};


//-----------------------------------------------------------------------
//  bound_node: a capability name and its template arguments
//
struct bound_node
{
    std::unique_ptr<qualified_name_node> name;

    // These are used only if it has template arguments
    source_position open_angle  = {};
    source_position close_angle = {};

    std::vector<template_argument> template_args;

    auto has_template_args() const
        -> bool
    {
        return open_angle != source_position{};
    }

    auto to_string() const
        -> std::string;

    auto position() const
        -> source_position
    {
        assert (name);
        return name->position();
    }

    auto visit(auto& v, int depth)
        -> void;
};


//-----------------------------------------------------------------------
//  type_arg_node: one template argument
//
//      const std::vector<int> const*
//      unsigned long
//      42
//
struct type_arg_node
{
    std::vector<token const*> cv_qualifiers;    // leading 'const'
    std::vector<token const*> declarators;      // trailing '*', '&', '&&', 'const'

    enum active { empty=0, named, keyword };
    std::variant<
        std::monostate,
        std::unique_ptr<bound_node>,
        token const*                            // fundamental type, integer literal, 'true', 'false'
    > type;

    auto is_named() const
        -> bool
    {
        return type.index() == named;
    }

    auto get_keyword() const
        -> token const*
    {
        if (type.index() == keyword) {
            return std::get<keyword>(type);
        }
        return {};
    }

    auto to_string() const
        -> std::string;

    auto position() const
        -> source_position;

    auto visit(auto& v, int depth)
        -> void
    {
        v.start(*this, depth);
        for (auto q : cv_qualifiers) {
            assert (q);
            q->visit(v, depth+1);
        }
        try_visit<named>(type, v, depth);
        if (auto k = get_keyword()) {
            k->visit(v, depth+1);
        }
        for (auto d : declarators) {
            assert (d);
            d->visit(v, depth+1);
        }
        v.end(*this, depth);
    }
};


auto bound_node::visit(auto& v, int depth)
    -> void
{
    v.start(*this, depth);
    assert (name);
    name->visit(v, depth+1);

    if (has_template_args()) {
        //  Inform the visitor that this is a template args list
        v.start(template_args_tag{}, depth);
        assert(close_angle != source_position{});
        assert(template_args.empty()
               || template_args.front().comma == source_position{});
        for (auto& a : template_args) {
            assert (a.arg);
            a.arg->visit(v, depth+1);
        }
        v.end(template_args_tag{}, depth);
    }

    v.end(*this, depth);
}


//-----------------------------------------------------------------------
//  bound_list_node: bounds joined by '+'
//
struct bound_list_node
{
    struct term {
        token const*                op;     // '+', null for the first bound
        std::unique_ptr<bound_node> bound;

        term( token const* o ) : op{o} { }
    };
    std::vector<term> terms;

    auto size() const
        -> int
    {
        return __as<int>(std::ssize(terms));
    }

    auto to_string() const
        -> std::string;

    auto position() const
        -> source_position
    {
        assert (
            !terms.empty()
            && terms.front().bound
        );
        return terms.front().bound->position();
    }

    auto visit(auto& v, int depth)
        -> void
    {
        v.start(*this, depth);
        for (auto const& x : terms) {
            if (x.op) {
                x.op->visit(v, depth+1);
            }
            assert (x.bound);
            x.bound->visit(v, depth+1);
        }
        v.end(*this, depth);
    }
};


//-----------------------------------------------------------------------
//  scope_node: '; static' or '; some.scope'
//
struct scope_node
{
    token const*                         semicolon  = {};
    token const*                         static_kw  = {};
    std::unique_ptr<qualified_name_node> name;

    auto is_static() const
        -> bool
    {
        return static_kw != nullptr;
    }

    auto to_string() const
        -> std::string;

    auto position() const
        -> source_position
    {
        assert (semicolon);
        return semicolon->position();
    }

    auto visit(auto& v, int depth)
        -> void
    {
        v.start(*this, depth);
        if (static_kw) {
            static_kw->visit(v, depth+1);
        }
        else {
            assert (name);
            name->visit(v, depth+1);
        }
        v.end(*this, depth);
    }
};


//-----------------------------------------------------------------------
//  invocation_node: one assertConstraint or wrapOpaque
//
struct invocation_node
{
    invocation_kind                  kind = invocation_kind::assert_constraint;
    source_position                  pos;
    std::string_view                 expression;    // up to the last token before '=>', as written
    source_position                  expression_pos;
    token const*                     fat_arrow = {};
    std::unique_ptr<bound_list_node> bounds;
    std::unique_ptr<scope_node>      scope;         // optional

    auto to_string() const
        -> std::string;

    auto position() const
        -> source_position
    {
        return pos;
    }

    auto visit(auto& v, int depth)
        -> void
    {
        v.start(*this, depth);
        assert (fat_arrow);
        fat_arrow->visit(v, depth+1);
        assert (bounds);
        bounds->visit(v, depth+1);
        if (scope) {
            scope->visit(v, depth+1);
        }
        v.end(*this, depth);
    }
};

}

#endif
