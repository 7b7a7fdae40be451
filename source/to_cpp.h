
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
//  Lowering to C++
//===========================================================================

#ifndef __CAPCHECK_TO_CPP
#define __CAPCHECK_TO_CPP

#include "parse.h"
#include "parse_tree_print.h"

namespace capcheck {

//-----------------------------------------------------------------------
//
//  Emitting the pieces of an invocation
//
//-----------------------------------------------------------------------
//

//  A capability or other type name, with '.' as '::' and library
//  capability names qualified with capcheck::
auto emit_name(qualified_name_node const& n)
    -> std::string;

auto emit_bound(bound_node const& n)
    -> std::string;

auto emit_type_arg(type_arg_node const& n)
    -> std::string;

//  'static' or no scope at all is capcheck::scope::unbounded
auto emit_scope(scope_node const* n)
    -> std::string;

//  expression is the invocation's expression, already lowered
auto emit_invocation(
    invocation_node const& n,
    std::string_view       expression
)
    -> std::string;


//-----------------------------------------------------------------------
//
//  lowerer: rewrites every invocation in a piece of text
//
//-----------------------------------------------------------------------
//
class lowerer
{
    std::vector<error_entry>& errors;
    std::ostream*             debug = {};

    int asserts = 0;
    int wraps   = 0;

public:
    //-----------------------------------------------------------------------
    //  Constructor
    //
    //  errors      error list
    //  debug       if not null, where to print each invocation's parse tree
    //
    lowerer(
        std::vector<error_entry>& errors_,
        std::ostream*             debug_ = {}
    )
        : errors{ errors_ }
        , debug { debug_ }
    {
    }

    //-----------------------------------------------------------------------
    //  lower: returns text with each invocation replaced by its C++
    //
    //  text        the text to lower
    //  start       source position of text[0]
    //
    //  Each replacement spans no more lines than the invocation did, and
    //  is followed by enough newlines that the text after it stays on
    //  the same line
    //
    auto lower(
        std::string_view text,
        source_position  start
    )
        -> std::string;

    auto assert_count() const -> int { return asserts; }
    auto wrap_count  () const -> int { return wraps;   }

private:
    auto lower_invocation(
        std::string_view       text,
        invocation_site const& site
    )
        -> std::string;
};


//-----------------------------------------------------------------------
//
//  translator: translates one .capc file to a .cpp file
//
//-----------------------------------------------------------------------
//
struct translation_options
{
    bool        line_directives = true;
    std::string header          = "capcheck.h";
    bool        debug           = false;
};


class translator
{
    std::string              sourcefile;
    translation_options      options;
    std::vector<error_entry> errors;
    source                   src;
    bool                     source_loaded = false;

    std::string              lowered;
    std::stringstream        debug_text;
    int                      asserts = 0;
    int                      wraps   = 0;

public:
    //-----------------------------------------------------------------------
    //  Constructor
    //
    //  filename    the .capc source file to be processed
    //  options     how to write the result
    //
    translator(
        std::string const&         filename,
        translation_options const& options_
    );

    //-----------------------------------------------------------------------
    //  default_output_name: 'a/b.capc' -> 'a/b.cpp'
    //
    static auto default_output_name(std::string const& filename)
        -> std::string;

    //-----------------------------------------------------------------------
    //  lower_to_cpp: rewrite the invocations; errors are collected
    //
    auto lower_to_cpp()
        -> void;

    //-----------------------------------------------------------------------
    //  result: the complete generated file
    //
    auto result() const
        -> std::string;

    //-----------------------------------------------------------------------
    //  write_output: write result() to outfile, or stdout for "-"
    //
    auto write_output(std::string const& outfile)
        -> bool;

    //-----------------------------------------------------------------------
    //  debug_print: write the parse trees next to the source file
    //
    auto debug_print()
        -> void;

    auto print_stats(std::ostream& o) const
        -> void;

    auto had_no_errors() const
        -> bool
    {
        return errors.empty();
    }

    auto get_errors() const
        -> std::vector<error_entry> const&
    {
        return errors;
    }

    //-----------------------------------------------------------------------
    //  print_errors: write the diagnostics to std::cerr, skipping
    //  fallback messages when there is a better one
    //
    auto print_errors()
        -> void;
};

}

#endif
