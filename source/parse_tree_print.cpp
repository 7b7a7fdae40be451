
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "parse_tree_print.h"

namespace capcheck {

auto pretty_print_visualize(token const& t, int)
    -> std::string
{
    return t.to_string();
}


auto pretty_print_visualize(qualified_name_node const& n, int)
    -> std::string
{
    auto ret = std::string{};

    for (auto& id : n.ids) {
        if (id.scope_op) { ret += id.scope_op->as_string_view(); }
        assert (id.identifier);
        ret += id.identifier->as_string_view();
    }

    return ret;
}


auto pretty_print_visualize(bound_node const& n, int indent)
    -> std::string
{
    assert (n.name);
    auto ret = pretty_print_visualize(*n.name, indent);

    if (n.has_template_args())
    {
        ret += "<";
        for (bool first = true; auto& arg : n.template_args)
        {
            if (!first) {
                ret += ", ";
            }
            first = false;
            assert (arg.arg);
            ret += pretty_print_visualize(*arg.arg, indent);
        }
        ret += ">";
    }

    return ret;
}


auto pretty_print_visualize(type_arg_node const& n, int)
    -> std::string
{
    return n.to_string();
}


auto pretty_print_visualize(bound_list_node const& n, int indent)
    -> std::string
{
    auto ret = std::string{};

    for (auto& term : n.terms) {
        if (term.op) {
            ret += " + ";
        }
        assert (term.bound);
        ret += pretty_print_visualize(*term.bound, indent);
    }

    return ret;
}


auto pretty_print_visualize(scope_node const& n, int indent)
    -> std::string
{
    if (n.is_static()) {
        return "static";
    }
    assert (n.name);
    return pretty_print_visualize(*n.name, indent);
}


auto pretty_print_visualize(invocation_node const& n, int indent)
    -> std::string
{
    auto ret = std::string{pre(indent)};
    ret += keyword_of(n.kind);
    ret += "(";
    ret += trim(n.expression);
    ret += " => ";

    assert (n.bounds);
    ret += pretty_print_visualize(*n.bounds, indent);

    if (n.scope) {
        ret += "; " + pretty_print_visualize(*n.scope, indent);
    }

    ret += ")";
    return ret;
}


auto pre(int indent)
    -> std::string_view
{
    assert (indent >= 0);
    return {
        indent_str.c_str(),
        __as<size_t>( std::min( indent*indent_spaces, __as<int>(std::ssize(indent_str))) )
    };
}

}
