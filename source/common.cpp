
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "common.h"

#include <iomanip>

namespace capcheck {

//-----------------------------------------------------------------------
//
//  error_entry
//
//-----------------------------------------------------------------------
//
auto error_entry::print(
    std::ostream&      o,
    std::string const& file
) const
    -> void
{
    o << file ;
    if (where.lineno > 0) {
        o << "("<< (where.lineno);
        if (where.colno >= 0) {
            o << "," << where.colno;
        }
        o  << ")";
    }
    o << ":";
    if (internal) {
        o << " internal compiler";
    }
    o << " error: " << msg << "\n";
}


//-----------------------------------------------------------------------
//
//  Digit and identifier classification
//
//-----------------------------------------------------------------------
//

//G digit: one of
//G     '0' '1' '2' '3' '4' '5' '6' '7' '8' '9'
//G
auto is_digit(char c)
    -> bool
{
    return isdigit(static_cast<unsigned char>(c));
}

//G nondigit:
//G     one of 'a'..'z'
//G     one of 'A'..'Z'
//G     _
//G
auto is_nondigit(char c)
    -> bool
{
    return
        isalpha(static_cast<unsigned char>(c))
        || c == '_'
        ;
};

//G identifier-start:
//G     nondigit
//G
auto is_identifier_start(char c)
    -> bool
{
    return is_nondigit(c);
}

//G identifier-continue:
//G     digit
//G     nondigit
//G
auto is_identifier_continue(char c)
    -> bool
{
    return
        is_digit(c)
        || is_nondigit(c)
        ;
}

//G identifier:
//G     identifier-start
//G     identifier identifier-continue
//G
auto starts_with_identifier(std::string_view s)
    -> int
{
    if (
        !s.empty()
        && is_identifier_start(s[0])
        )
    {
        auto j = 1;
        while (
            j < std::ssize(s)
            && is_identifier_continue(s[j])
            )
        {
            ++j;
        }
        return j;
    }
    return 0;
};


//  String path prefix from filename
//
auto strip_path(std::string const& file)
    -> std::string
{
    auto i = std::ssize(file)-1;
    while (
        i >= 0
        && file[i] != '\\'
        && file[i] != '/'
        )
    {
        --i;
    }
    return {file, __as<size_t>(i+1)};
}


//-----------------------------------------------------------------------
//
//  Misc helpers
//
//-----------------------------------------------------------------------
//
auto replace_all(std::string& s, std::string_view what, std::string_view with)
    -> std::string
{
    for (
        std::string::size_type pos{};
        s.npos != (pos = s.find(what.data(), pos, what.length()));
        pos += with.length()
        )
    {
        s.replace(pos, what.length(), with.data(), with.length());
    }
    return s;
}


auto trim(std::string_view s)
    -> std::string_view
{
    while (!s.empty() && isspace(static_cast<unsigned char>(s.front()))) { s.remove_prefix(1); }
    while (!s.empty() && isspace(static_cast<unsigned char>(s.back())))  { s.remove_suffix(1); }
    return s;
}


auto count_newlines(std::string_view s)
    -> int
{
    return __as<int>(std::count(s.begin(), s.end(), '\n'));
}


//-----------------------------------------------------------------------
//
//  cmdline_processor
//
//-----------------------------------------------------------------------
//
auto cmdline_processor::print(std::string_view s, int width)
    -> void
{
    if (width > 0) {
        std::cout << std::setw(width) << std::left;
    }
    std::cout << s;
}


auto cmdline_processor::process_flags()
    -> void
{
    constexpr auto processed = -1;

    //  Calculate the unique prefixes
    for (auto flag1 = flags.begin(); flag1 != flags.end(); ++flag1) {
        for (auto flag2 = flag1+1; flag2 != flags.end(); ++flag2) {
            auto i = 0;
            while (
                i < std::ssize(flag1->name)
                && i < std::ssize(flag2->name)
                && flag1->name[i] != ' '
                && flag2->name[i] != ' '
                && flag1->name[i] == flag2->name[i]
                )
            {
                ++i;
            }
            //  Record that we found the unique prefix must be at least this long
            flag1->unique_prefix = std::max( flag1->unique_prefix, i+1 );
            flag2->unique_prefix = std::max( flag2->unique_prefix, i+1 );
        }
    }

    //  Look for matches
    for (auto arg = args.begin(); arg != args.end(); ++arg)
    {
        //  The arg should never be empty, but we're going to do a [0]
        //  subscript next so we should either check or assert
        if (arg->text.empty()) {
            continue;
        }

        //  Provide a way to ignore the rest of the command line
        //  for the purpose of looking for switches
        if (arg->text == "--") {
            arg->pos = processed;
            break;
        }

        //  A lone '-' is a file name (standard input)
        if (
            arg->text[0] != '-'
            || arg->text == "-"
            )
        {
            continue;
        }

        auto name = std::string_view{arg->text}.substr(1);
        auto found = false;
        for (auto& flag : flags)
        {
            auto length_to_match = std::max(flag.unique_prefix, __as<int>(std::ssize(name)));

            //  Allow a switch to be specified by its unique prefix or its synonym
            if (
                flag.name.substr(0, length_to_match) == name
                || (!flag.synonym.empty() && flag.synonym == name)
                )
            {
                assert(flag.handler0 || flag.handler1);
                arg->pos = processed;
                found = true;

                if (flag.handler0) {
                    flag.handler0();
                }
                else {
                    //  A flag that takes a value consumes the next argument
                    if (arg+1 == args.end()) {
                        print("Missing argument to option " + arg->text + " - try -help\n");
                        bad_flags = true;
                        break;
                    }
                    ++arg;
                    arg->pos = processed;
                    flag.handler1(arg->text);
                }
                break;
            }
        }

        if (!found) {
            print("Unknown option: " + arg->text + " - try -help\n");
            bad_flags = true;
        }
    }

    std::erase_if( args, [=](auto& arg){ return arg.pos == processed; } );
}


auto cmdline_processor::print_help()
    -> void
{
    help_requested = true;

    std::sort(
        flags.begin(),
        flags.end(),
        [](auto& a, auto& b){ return a.group < b.group || (a.group == b.group && a.name < b.name); }
    );

    print_version();
    print("Usage: capcheck [options] file ...\n");

    auto last_group = -1;
    for (auto& flag : flags) {
        //  Skip hidden flags
        if (flag.name.front() == '_') {
            continue;
        }

        if (last_group != flag.group) {
            auto label = std::find_if(
                labels.begin(),
                labels.end(),
                [&](auto const& l) { return l.first == flag.group; }
            );
            assert (label != labels.end());
            print("\n" + label->second + " options:\n");
            last_group = flag.group;
        }

        print("  -");
        auto n = flag.name.substr(0, flag.unique_prefix);
        if (flag.unique_prefix < std::ssize(flag.name)) {
            n += "[";
            n += flag.name.substr(flag.unique_prefix);
            n += "]";
        }
        if (!flag.synonym.empty()) {
            n += ", -" + flag.synonym;
        }
        print(n, max_flag_length + 3);
        print(flag.description);
        print("\n");
    }
}


auto cmdline_processor::print_version()
    -> void
{
    help_requested = true;
    print("\ncapcheck compiler " CAPCHECK_VERSION);
    print("\nCopyright(c) Herb Sutter All rights reserved\n");
    print("\nSPDX-License-Identifier: CC-BY-NC-ND-4.0\n");
    print("  No commercial use\n");
    print("  No forks/derivatives\n\n");
}


auto cmdline_processor::add_flag(
    int              group,
    std::string_view name,
    std::string_view description,
    callback0        handler0,
    callback1        handler1,
    std::string_view synonym
)
    -> void
{
    flags.emplace_back( group, name, description, handler0, handler1, synonym );
    auto length = std::ssize(name);
    if (!synonym.empty()) {
        length += std::ssize(synonym) + 3;
    }
    max_flag_length = std::max( max_flag_length, __as<int>(length) );
}


auto cmdline()
    -> cmdline_processor&
{
    static cmdline_processor processor;
    return processor;
}

cmdline_processor::register_flag::register_flag(
    int              group,
    std::string_view name,
    std::string_view description,
    callback0        handler0,
    callback1        handler1,
    std::string_view synonym
)
{
    cmdline().add_flag( group, name, description, handler0, handler1, synonym );
}

static cmdline_processor::register_flag cmd_help   (
    0,
    "help",
    "Print help",
    []{ cmdline().print_help(); },
    nullptr,
    "?"
);

static cmdline_processor::register_flag cmd_version(
    0,
    "version",
    "Print version information",
    []{ cmdline().print_version(); }
);

}
