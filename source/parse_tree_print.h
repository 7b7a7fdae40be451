
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef __CAPCHECK_PARSE_TREE_PRINTER
#define __CAPCHECK_PARSE_TREE_PRINTER

#include "lex.h"
#include "parse_tree.h"

#include <memory>
#include <variant>
#include <iostream>

namespace capcheck {

//-----------------------------------------------------------------------
//
//  pretty_print_visualize: prints an invocation back as source, with
//  the bound list normalized
//
//-----------------------------------------------------------------------
//
auto pretty_print_visualize(token const& n, int indent)
    -> std::string;
auto pretty_print_visualize(qualified_name_node const& n, int indent)
    -> std::string;
auto pretty_print_visualize(bound_node const& n, int indent)
    -> std::string;
auto pretty_print_visualize(type_arg_node const& n, int indent)
    -> std::string;
auto pretty_print_visualize(bound_list_node const& n, int indent)
    -> std::string;
auto pretty_print_visualize(scope_node const& n, int indent)
    -> std::string;
auto pretty_print_visualize(invocation_node const& n, int indent)
    -> std::string;


//-----------------------------------------------------------------------
//  pre: Get an indentation prefix
//
inline static int         indent_spaces  = 2;
inline static std::string indent_str     = std::string( 1024, ' ' );    // "1K should be enough for everyone"

auto pre(int indent)
    -> std::string_view;


//-----------------------------------------------------------------------
//
//  Common parts for printing visitors
//
//-----------------------------------------------------------------------
//
struct printing_visitor
{
    //-----------------------------------------------------------------------
    //  Constructor: remember a stream to write to
    //
    std::ostream& o;

    printing_visitor(std::ostream& out) : o{out} { indent_spaces = 2; }
};


//-----------------------------------------------------------------------
//
//  Visitor for printing a parse tree
//
//-----------------------------------------------------------------------
//
class parse_tree_printer : printing_visitor
{
    using printing_visitor::printing_visitor;

public:
    auto start(token const& n, int indent) -> void
    {
        o << pre(indent) << __as<std::string>(n.type()) << ": " << n.to_string() << "\n";
    }

    auto start(qualified_name_node const&, int indent) -> void
    {
        o << pre(indent) << "qualified-name\n";
    }

    auto start(bound_node const&, int indent) -> void
    {
        o << pre(indent) << "bound\n";
    }

    auto start(template_args_tag const&, int indent) -> void
    {
        o << pre(indent) << "template-args\n";
    }

    auto start(type_arg_node const&, int indent) -> void
    {
        o << pre(indent) << "type-arg\n";
    }

    auto start(bound_list_node const& n, int indent) -> void
    {
        o << pre(indent) << "bound-list - " << n.size() << " bound" << (n.size() == 1 ? "" : "s") << "\n";
    }

    auto start(scope_node const& n, int indent) -> void
    {
        o << pre(indent) << "scope-clause";
        if (n.is_static()) {
            o << " - unbounded";
        }
        o << "\n";
    }

    auto start(invocation_node const& n, int indent) -> void
    {
        o << pre(indent) << __as<std::string>(n.kind) << " " << n.pos.to_string() << "\n";
        o << pre(indent+1) << "expression: " << trim(n.expression) << "\n";
    }

    auto start(auto const&, int indent) -> void
    {
        o << pre(indent) << "UNRECOGNIZED -- FIXME\n";
    }

    auto end(auto const&, int) -> void
    {
        //  Ignore other node types because they don't need
        //  any special handling
    }
};

}

#endif
