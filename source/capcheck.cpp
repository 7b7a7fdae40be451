
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
//  capcheck: translates .capc files to C++
//===========================================================================

#include "to_cpp.h"

#include <cstdlib>

using namespace capcheck;

static auto flag_output = std::string{};
static cmdline_processor::register_flag cmd_output(
    1,
    "output",
    "Output filename, or '-' for stdout (single input file only)",
    nullptr,
    [](std::string const& name){ flag_output = name; }
);

static auto flag_clean_cpp = false;
static cmdline_processor::register_flag cmd_clean_cpp(
    1,
    "clean-cpp",
    "Emit clean C++ without #line directives",
    []{ flag_clean_cpp = true; }
);

static auto flag_include_header = std::string{"capcheck.h"};
static cmdline_processor::register_flag cmd_include_header(
    1,
    "include-header",
    "Header to include at the top of the output (default capcheck.h)",
    nullptr,
    [](std::string const& name){ flag_include_header = name; }
);

static auto flag_quiet = false;
static cmdline_processor::register_flag cmd_quiet(
    2,
    "quiet",
    "Print nothing on success",
    []{ flag_quiet = true; }
);

static auto flag_verbose = false;
static cmdline_processor::register_flag cmd_verbose(
    2,
    "verbose",
    "Print statistics for each file",
    []{ flag_verbose = true; }
);

static auto flag_debug = false;
static cmdline_processor::register_flag cmd_debug(
    2,
    "debug",
    "Write the parse trees to <file>.capc-parse.txt",
    []{ flag_debug = true; }
);


auto main(
    int   argc,
    char* argv[]
)
    -> int
{
    cmdline().set_args(argc, argv);
    cmdline().process_flags();

    if (cmdline().had_bad_flags()) {
        return EXIT_FAILURE;
    }

    if (cmdline().help_was_requested()) {
        return EXIT_SUCCESS;
    }

    if (cmdline().arguments().empty()) {
        std::cerr << "capcheck: error: no input files - try -help\n";
        return EXIT_FAILURE;
    }

    if (
        !flag_output.empty()
        && std::ssize(cmdline().arguments()) > 1
        )
    {
        std::cerr << "capcheck: error: -output can only be used with a single input file\n";
        return EXIT_FAILURE;
    }

    //  Progress messages would end up in the generated code
    if (flag_output == "-") {
        flag_quiet   = true;
        flag_verbose = false;
    }

    auto options = translation_options{};
    options.line_directives = !flag_clean_cpp;
    options.header          = flag_include_header;
    options.debug           = flag_debug;

    auto exit_status = EXIT_SUCCESS;
    for (auto const& arg : cmdline().arguments())
    {
        auto const& file = arg.text;
        if (!flag_quiet) {
            std::cout << file << "...";
        }

        auto t = translator{ file, options };
        t.lower_to_cpp();

        if (flag_debug) {
            t.debug_print();
        }

        auto outfile = flag_output.empty()
            ? translator::default_output_name(file)
            : flag_output;

        if (
            t.had_no_errors()
            && t.write_output(outfile)
            )
        {
            if (!flag_quiet) {
                std::cout << " ok (wrote " << outfile << ")\n";
            }
            if (flag_verbose) {
                t.print_stats(std::cout);
            }
        }
        else
        {
            if (!flag_quiet) {
                std::cout << "\n";
            }
            t.print_errors();
            exit_status = EXIT_FAILURE;
        }
    }

    return exit_status;
}
