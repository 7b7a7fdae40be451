
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "parse_tree.h"

namespace capcheck {

//  Multi-word fundamental types keep single spaces between their words
//
static auto normalize_spaces(std::string_view s)
    -> std::string
{
    auto ret = std::string{};
    auto in_space = false;
    for (auto c : s) {
        if (isspace(static_cast<unsigned char>(c))) {
            in_space = true;
        }
        else {
            if (in_space && !ret.empty()) {
                ret += ' ';
            }
            in_space = false;
            ret += c;
        }
    }
    return ret;
}


auto template_argument::to_string() const
    -> std::string
{
    assert (arg);
    return arg->to_string();
}


auto qualified_name_node::to_string() const
    -> std::string
{
    auto ret = std::string{};
    for (auto& term : ids) {
        if (term.scope_op) {
            ret += term.scope_op->as_string_view();
        }
        assert (term.identifier);
        ret += term.identifier->as_string_view();
    }
    return ret;
}


auto bound_node::to_string() const
    -> std::string
{
    assert (name);
    auto ret = name->to_string();

    if (has_template_args())
    {
        ret += "<";
        for (bool first = true; auto& arg : template_args)
        {
            if (!first) {
                ret += ", ";
            }
            first = false;
            ret += arg.to_string();
        }
        ret += ">";
    }

    return ret;
}


auto type_arg_node::to_string() const
    -> std::string
{
    auto ret = std::string{};

    for (auto q : cv_qualifiers) {
        assert (q);
        ret += q->as_string_view();
        ret += " ";
    }

    switch (type.index()) {
    break;case named:
        assert (std::get<named>(type));
        ret += std::get<named>(type)->to_string();

    break;case keyword:
        assert (std::get<keyword>(type));
        ret += normalize_spaces(std::get<keyword>(type)->as_string_view());

    break;default:
        assert (!"ICE: type_arg_node has no type");
    }

    for (auto d : declarators) {
        assert (d);
        if (*d == "const") {
            ret += " ";
        }
        ret += d->as_string_view();
    }

    return ret;
}


auto type_arg_node::position() const
    -> source_position
{
    if (!cv_qualifiers.empty()) {
        return cv_qualifiers.front()->position();
    }
    switch (type.index()) {
    break;case named:
        return std::get<named>(type)->position();
    break;case keyword:
        return std::get<keyword>(type)->position();
    break;default:
        return {};
    }
}


auto bound_list_node::to_string() const
    -> std::string
{
    auto ret = std::string{};
    for (auto& term : terms) {
        if (term.op) {
            ret += " ";
            ret += term.op->as_string_view();
            ret += " ";
        }
        assert (term.bound);
        ret += term.bound->to_string();
    }
    return ret;
}


auto scope_node::to_string() const
    -> std::string
{
    if (static_kw) {
        return static_kw->to_string();
    }
    assert (name);
    return name->to_string();
}


auto invocation_node::to_string() const
    -> std::string
{
    auto ret = std::string{keyword_of(kind)};
    ret += "(";
    ret += trim(expression);
    ret += " => ";
    assert (bounds);
    ret += bounds->to_string();
    if (scope) {
        ret += "; ";
        ret += scope->to_string();
    }
    ret += ")";
    return ret;
}

}
