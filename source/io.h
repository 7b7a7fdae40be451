
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
//  Source loader and invocation scanner
//===========================================================================

#ifndef __CAPCHECK_IO
#define __CAPCHECK_IO

#include "common.h"
#include <fstream>
#include <sstream>


namespace capcheck {

//-----------------------------------------------------------------------
//
//  invocation_kind: which of the two forms a site uses
//
//-----------------------------------------------------------------------
//
enum class invocation_kind : std::int8_t {
    assert_constraint,
    wrap_opaque
};

auto keyword_of(invocation_kind k)
    -> std::string_view;

template<typename T>
    requires std::is_same_v<T, std::string>
auto __as(invocation_kind k)
    -> std::string
{
    switch (k) {
    break;case invocation_kind::assert_constraint: return "assert_constraint";
    break;case invocation_kind::wrap_opaque:       return "wrap_opaque";
    break;default:                                 return "INTERNAL_ERROR";
    }
}


//-----------------------------------------------------------------------
//
//  invocation_site: where an invocation sits in the text
//
//      assertConstraint ( x => eq )
//      ^                 ^       ^^
//      begin    body_begin  body_end end
//
//-----------------------------------------------------------------------
//
struct invocation_site
{
    invocation_kind kind;
    std::size_t     begin      = 0;
    std::size_t     body_begin = 0;
    std::size_t     body_end   = 0;
    std::size_t     end        = 0;
    source_position pos;
    source_position body_pos;

    auto body(std::string_view text) const
        -> std::string_view
    {
        return text.substr(body_begin, body_end - body_begin);
    }
};


//-----------------------------------------------------------------------
//
//  find_invocations: locates the outermost invocation sites in text,
//  skipping comments and string, character and raw string literals
//
//  text        text to scan
//  start       source position of text[0]
//  errors      error list
//
//  Invocations nested inside a site's parentheses are not reported;
//  scan the site's body again to find them
//
auto find_invocations(
    std::string_view          text,
    source_position           start,
    std::vector<error_entry>& errors
)
    -> std::vector<invocation_site>;


//-----------------------------------------------------------------------
//
//  source: Represents a program source file
//
//-----------------------------------------------------------------------
//
class source
{
    std::vector<error_entry>& errors;
    std::string               text;
    lineno_t                  lines = 0;

public:
    //-----------------------------------------------------------------------
    //  Constructor
    //
    //  errors      error list
    //
    source(
        std::vector<error_entry>& errors_
    )
        : errors{ errors_ }
    {
    }


    //-----------------------------------------------------------------------
    //  load: Read a file into the source text
    //
    //  filename    the source file to be loaded
    //
    auto load(
        std::string const& filename
    )
        -> bool
    {
        std::ifstream in{ filename, std::ios::binary };
        if (!in.is_open()) {
            errors.emplace_back(
                source_position{},
                "could not open input file " + filename
            );
            return false;
        }

        std::stringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            errors.emplace_back(
                source_position{},
                "could not read input file " + filename
            );
            return false;
        }

        set_text(buffer.str());
        return true;
    }


    //-----------------------------------------------------------------------
    //  set_text: Use the given text as the source, for input not from a file
    //
    auto set_text(std::string_view t)
        -> void
    {
        text = t;
        replace_all(text, "\r\n", "\n");
        lines = count_newlines(text) + 1;
    }


    auto get_text() const
        -> std::string const&
    {
        return text;
    }

    auto line_count() const
        -> lineno_t
    {
        return lines;
    }

    //  No copying
    //
    source(source const&) = delete;
    void operator=(source const&) = delete;
};

}

#endif
