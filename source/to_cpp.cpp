
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "to_cpp.h"

namespace capcheck {

//-----------------------------------------------------------------------
//  Names the support header provides
//
static auto is_library_capability(std::string_view s)
    -> bool
{
    static constexpr std::string_view names[] = {
        "capability", "self",
        "partial_eq", "eq", "partial_ord", "ord",
        "printable", "hashable", "cloneable", "callable",
        "iterable", "sized", "nominal"
    };
    return std::find(std::begin(names), std::end(names), s) != std::end(names);
}

//  Library capabilities whose template parameters all have defaults
static auto is_defaulted_template(qualified_name_node const& n)
    -> bool
{
    if (!n.is_single_identifier()) {
        return false;
    }
    auto name = n.get_first_token()->as_string_view();
    return
        name == "partial_eq"
        || name == "partial_ord"
        ;
}

static auto is_library_scope(std::string_view s)
    -> bool
{
    return
        s == "unbounded"
        || s == "local"
        ;
}

static auto emit_qualified(qualified_name_node const& n)
    -> std::string
{
    auto ret = std::string{};
    for (auto& term : n.ids) {
        if (term.scope_op) {
            ret += "::";
        }
        assert (term.identifier);
        ret += term.identifier->as_string_view();
    }
    return ret;
}


//-----------------------------------------------------------------------
//
//  Emitting the pieces of an invocation
//
//-----------------------------------------------------------------------
//
auto emit_name(qualified_name_node const& n)
    -> std::string
{
    if (
        n.is_single_identifier()
        && is_library_capability(n.get_first_token()->as_string_view())
        )
    {
        return "capcheck::" + n.get_first_token()->to_string();
    }
    return emit_qualified(n);
}


auto emit_bound(bound_node const& n)
    -> std::string
{
    assert (n.name);
    auto ret = emit_name(*n.name);

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
            ret += emit_type_arg(*arg.arg);
        }
        ret += ">";
    }
    else if (is_defaulted_template(*n.name)) {
        ret += "<>";
    }

    return ret;
}


auto emit_type_arg(type_arg_node const& n)
    -> std::string
{
    //  Fundamental types and literals print as themselves
    if (!n.is_named()) {
        return n.to_string();
    }

    auto ret = std::string{};

    for (auto q : n.cv_qualifiers) {
        ret += q->as_string_view();
        ret += " ";
    }

    assert (std::get<type_arg_node::named>(n.type));
    ret += emit_bound(*std::get<type_arg_node::named>(n.type));

    for (auto d : n.declarators) {
        if (*d == "const") {
            ret += " ";
        }
        ret += d->as_string_view();
    }

    return ret;
}


auto emit_scope(scope_node const* n)
    -> std::string
{
    if (
        !n
        || n->is_static()
        )
    {
        return "capcheck::scope::unbounded";
    }

    assert (n->name);
    if (
        n->name->is_single_identifier()
        && is_library_scope(n->name->get_first_token()->as_string_view())
        )
    {
        return "capcheck::scope::" + n->name->get_first_token()->to_string();
    }
    return emit_qualified(*n->name);
}


//-----------------------------------------------------------------------
//  emit_invocation
//
//  assertConstraint(E => B1 + B2) becomes
//
//      capcheck::defer(
//          [&] { return E; },
//          []<typename CAPCHECK_T>(CAPCHECK_T const&)
//              requires capcheck::bound<CAPCHECK_T, B1> && capcheck::bound<CAPCHECK_T, B2>
//          { })
//
//  wrapOpaque(E => B1 + B2; S) becomes
//
//      []<typename CAPCHECK_T>(CAPCHECK_T&& capcheck_value)
//          -> capcheck::opaque<std::decay_t<CAPCHECK_T>, S, B1, B2>
//          requires capcheck::within<std::decay_t<CAPCHECK_T>, S>
//                && capcheck::bound<std::decay_t<CAPCHECK_T>, B1> && ...
//      {
//          return capcheck::opaque<std::decay_t<CAPCHECK_T>, S, B1, B2>(
//              std::forward<CAPCHECK_T>(capcheck_value));
//      }(E)
//
//  all on one line, so that only E's own newlines are kept
//
auto emit_invocation(
    invocation_node const& n,
    std::string_view       expression
)
    -> std::string
{
    assert (n.bounds);

    //  Trailing whitespace from lowering is dropped; the caller restores its newlines
    while (
        !expression.empty()
        && isspace(static_cast<unsigned char>(expression.back()))
        )
    {
        expression.remove_suffix(1);
    }

    auto bounds = std::vector<std::string>{};
    for (auto& term : n.bounds->terms) {
        assert (term.bound);
        bounds.push_back( emit_bound(*term.bound) );
    }

    auto ret = std::string{};

    if (n.kind == invocation_kind::assert_constraint)
    {
        assert (!n.scope);
        ret += "capcheck::defer([&] { return ";
        ret += expression;
        ret += "; }, []<typename CAPCHECK_T>(CAPCHECK_T const&) requires ";
        for (bool first = true; auto const& b : bounds) {
            if (!first) {
                ret += " && ";
            }
            first = false;
            ret += "capcheck::bound<CAPCHECK_T, " + b + ">";
        }
        ret += " { })";
    }

    else
    {
        auto checked = std::string{"std::decay_t<CAPCHECK_T>"};
        auto opaque  = "capcheck::opaque<" + checked + ", " + emit_scope(n.scope.get());
        for (auto const& b : bounds) {
            opaque += ", " + b;
        }
        opaque += ">";

        ret += "[]<typename CAPCHECK_T>(CAPCHECK_T&& capcheck_value) -> " + opaque;
        ret += " requires capcheck::within<" + checked + ", " + emit_scope(n.scope.get()) + ">";
        for (auto const& b : bounds) {
            ret += " && capcheck::bound<" + checked + ", " + b + ">";
        }
        ret += " { return " + opaque + "(std::forward<CAPCHECK_T>(capcheck_value)); }(";
        ret += expression;
        ret += ")";
    }

    return ret;
}


//-----------------------------------------------------------------------
//
//  lowerer
//
//-----------------------------------------------------------------------
//
auto lowerer::lower(
    std::string_view text,
    source_position  start
)
    -> std::string
{
    auto ret   = std::string{};
    auto sites = find_invocations(text, start, errors);

    auto last = std::size_t{0};
    for (auto const& site : sites)
    {
        assert (site.begin >= last);
        ret += text.substr(last, site.begin - last);
        ret += lower_invocation(text, site);
        last = site.end;
    }
    ret += text.substr(last);

    return ret;
}


auto lowerer::lower_invocation(
    std::string_view       text,
    invocation_site const& site
)
    -> std::string
{
    auto original = text.substr(site.begin, site.end - site.begin);
    auto body     = site.body(text);

    auto errors_size = std::ssize(errors);
    auto tokens = lex(body, site.body_pos, errors);
    if (std::ssize(errors) != errors_size) {
        return std::string{original};
    }

    auto n = parser{errors}.parse(site, body, tokens);
    if (!n) {
        return std::string{original};
    }

    if (debug) {
        *debug << pretty_print_visualize(*n, 0) << "\n";
        auto printer = parse_tree_printer{*debug};
        n->visit(printer, 1);
        *debug << "\n";
    }

    //  Invocations inside the expression go first
    auto expression = lower(n->expression, n->expression_pos);

    auto ret = emit_invocation(*n, expression);
    if (n->kind == invocation_kind::assert_constraint) {
        ++asserts;
    }
    else {
        ++wraps;
    }

    //  Keep the following text on its original line
    auto missing = count_newlines(original) - count_newlines(ret);
    assert (missing >= 0);
    ret.append( __as<std::size_t>(std::max(missing, 0)), '\n' );

    return ret;
}


//-----------------------------------------------------------------------
//
//  translator
//
//-----------------------------------------------------------------------
//
translator::translator(
    std::string const&         filename,
    translation_options const& options_
)
    : sourcefile{ filename }
    , options   { options_ }
    , src       { errors }
{
    if (!sourcefile.ends_with(".capc"))
    {
        errors.emplace_back(
            source_position{},
            "source filename must end with .capc: " + sourcefile
        );
        return;
    }

    source_loaded = src.load(sourcefile);
}


auto translator::default_output_name(std::string const& filename)
    -> std::string
{
    auto name = filename;
    if (name.ends_with(".capc")) {
        name.erase(name.size() - 5);
    }
    return name + ".cpp";
}


auto translator::lower_to_cpp()
    -> void
{
    if (!source_loaded) {
        return;
    }

    auto l = lowerer{ errors, options.debug ? &debug_text : nullptr };
    try {
        lowered = l.lower(src.get_text(), source_position{1, 1});
    }
    catch (std::runtime_error& e) {
        errors.emplace_back(
            source_position{},
            e.what()
        );
    }
    asserts = l.assert_count();
    wraps   = l.wrap_count();
}


auto translator::result() const
    -> std::string
{
    auto ret = "#include \"" + options.header + "\"\n";
    if (options.line_directives) {
        auto name = sourcefile;
        replace_all(name, "\\", "\\\\");
        replace_all(name, "\"", "\\\"");
        ret += "#line 1 \"" + name + "\"\n";
    }
    ret += lowered;
    return ret;
}


auto translator::write_output(std::string const& outfile)
    -> bool
{
    if (!had_no_errors()) {
        return false;
    }

    if (outfile == "-") {
        std::cout << result();
        return true;
    }

    auto out = std::ofstream{ outfile, std::ios::binary };
    if (!out.is_open()) {
        errors.emplace_back(
            source_position{},
            "could not open output file " + outfile
        );
        return false;
    }
    out << result();
    out.close();
    if (!out) {
        errors.emplace_back(
            source_position{},
            "could not write output file " + outfile
        );
        return false;
    }
    return true;
}


auto translator::debug_print()
    -> void
{
    auto out = std::ofstream{ sourcefile + "-parse.txt" };
    out << "parse trees for " << sourcefile << "\n\n";
    out << debug_text.str();
    out << "\n" << asserts << " assertConstraint, " << wraps << " wrapOpaque\n";
}


auto translator::print_stats(std::ostream& o) const
    -> void
{
    o << "    " << asserts << " assertConstraint, " << wraps << " wrapOpaque";
    if (source_loaded) {
        o << ", " << src.line_count() << " lines";
    }
    o << "\n";
}


auto translator::print_errors()
    -> void
{
    if (errors.empty()) {
        return;
    }

    //  Only keep fallback messages if there is nothing better
    if (
        std::any_of(errors.begin(), errors.end(), [](auto const& e) { return !e.fallback; })
        )
    {
        std::erase_if( errors, [](auto const& e) { return e.fallback; } );
    }

    std::stable_sort(
        errors.begin(),
        errors.end(),
        [](auto const& a, auto const& b) { return a.where < b.where; }
    );
    errors.erase( std::unique(errors.begin(), errors.end()), errors.end() );

    for (auto const& error : errors) {
        error.print(std::cerr, strip_path(sourcefile));
    }
}

}
