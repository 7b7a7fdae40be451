
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
//  Common types and helpers for the translator
//===========================================================================

#ifndef __CAPCHECK_COMMON
#define __CAPCHECK_COMMON

#include <algorithm>
#include <cassert>
#include <cctype>
#include <compare>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#define CAPCHECK_VERSION "v0.3.0"

namespace capcheck {

//-----------------------------------------------------------------------
//
//  Source positions
//
//-----------------------------------------------------------------------
//
using lineno_t = std::int32_t;
using colno_t  = std::int32_t;

struct source_position
{
    lineno_t lineno;    // one-based offset into program source
    colno_t  colno;     // one-based offset into line

    source_position(lineno_t l = 0, colno_t c = 0 )
        : lineno{ l }, colno{ c }
    {
    }

    auto operator<=>(source_position const&) const = default;

    auto to_string() const
        -> std::string
    {
        return "(" + std::to_string(lineno) + "," + std::to_string(colno) + ")";
    }
};


//-----------------------------------------------------------------------
//
//  error_entry: one diagnostic
//
//-----------------------------------------------------------------------
//
struct error_entry
{
    source_position where;
    std::string     msg;
    bool            internal = false;
    bool            fallback = false;   // only emit this message if there was nothing better

    error_entry(
        source_position  w,
        std::string_view m,
        bool             i = false,
        bool             f = false
    )
        : where{w}
        , msg{m}
        , internal{i}
        , fallback{f}
    { }

    auto operator==(error_entry const& that) const
        -> bool
    {
        return
            where == that.where
            && msg == that.msg
            ;
    }

    auto print(std::ostream& o, std::string const& file) const
        -> void;
};


//-----------------------------------------------------------------------
//
//  Narrowing helpers
//
//-----------------------------------------------------------------------
//
template<typename T>
    requires std::is_arithmetic_v<T>
constexpr auto __as(auto x)
    -> T
{
    return static_cast<T>(x);
}


//-----------------------------------------------------------------------
//
//  Character and identifier classification
//
//-----------------------------------------------------------------------
//
auto is_digit(char c)
    -> bool;

auto is_nondigit(char c)
    -> bool;

auto is_identifier_start(char c)
    -> bool;

auto is_identifier_continue(char c)
    -> bool;

auto starts_with_identifier(std::string_view s)
    -> int;


//-----------------------------------------------------------------------
//
//  Misc helpers
//
//-----------------------------------------------------------------------
//
auto strip_path(std::string const& file)
    -> std::string;

auto replace_all(std::string& s, std::string_view what, std::string_view with)
    -> std::string;

auto trim(std::string_view s)
    -> std::string_view;

auto count_newlines(std::string_view s)
    -> int;


//-----------------------------------------------------------------------
//
//  Command line handling
//
//-----------------------------------------------------------------------
//
class cmdline_processor
{
    bool help_requested = false;
    bool bad_flags      = false;

    struct arg
    {
        int pos;
        std::string text;

        arg(int p, char* t) : pos{p}, text{t} { }
    };
    std::vector<arg> args;

    using callback0 = void (*)();
    using callback1 = void (*)(std::string const&);
    struct flag
    {
        int         group = 0;
        std::string name;
        int         unique_prefix = 0;
        std::string description;
        callback0   handler0;
        callback1   handler1;
        std::string synonym;

        flag(int g, std::string_view n, std::string_view d, callback0 h0, callback1 h1, std::string_view s)
            : group{g}, name{n}, description{d}, handler0{h0}, handler1{h1}, synonym{s}
        { }
    };
    std::vector<flag> flags;
    int max_flag_length = 0;

    std::vector<std::pair<int, std::string>> labels = {
        { 0, "General" },
        { 1, "Output" },
        { 2, "Diagnostics" }
    };

    auto print(std::string_view, int width = 0)
        -> void;

public:
    auto process_flags()
        -> void;

    auto print_help()
        -> void;

    auto print_version()
        -> void;

    auto add_flag(
        int              group,
        std::string_view name,
        std::string_view description,
        callback0        handler0,
        callback1        handler1,
        std::string_view synonym
    )
        -> void;

    struct register_flag
    {
        register_flag(
            int              group,
            std::string_view name,
            std::string_view description,
            callback0        handler0,
            callback1        handler1 = {},
            std::string_view synonym  = {}
        );
    };

    auto set_args(
        int   argc,
        char* argv[]
    )
        -> void
    {
        for (auto i = 1; i < argc; ++i) {
            args.emplace_back( i, argv[i] );
        }
    }

    auto help_was_requested()
        -> bool
    {
        return help_requested;
    }

    auto had_bad_flags()
        -> bool
    {
        return bad_flags;
    }

    auto arguments()
        -> std::vector<arg>&
    {
        return args;
    }
};

//  Flags register themselves from static objects in several translation
//  units, so the processor is created on first use
auto cmdline()
    -> cmdline_processor&;

}

#endif
