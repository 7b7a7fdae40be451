
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef __CAPCHECK_TEST_UTILS
#define __CAPCHECK_TEST_UTILS

#include "to_cpp.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace capcheck::tests {

struct TestCase {
  const char* name;
  bool (*fn)();
};

struct TestSection {
  const char* name;
  const TestCase* tests;
  size_t count;
};

struct TestResult {
  size_t total = 0;
  size_t failed = 0;
};

// Prints got/expected to std::cerr when they differ.
bool ExpectEqual(std::string_view got, std::string_view expected, const char* name);

// True when some error message contains text.
bool HasError(const std::vector<error_entry>& errors, std::string_view text);

// Scans text as one whole file starting at (1,1).
std::vector<invocation_site> FindSites(std::string_view text, std::vector<error_entry>& errors);

// Scans text for its single invocation and parses it; tokens must outlive the result.
std::unique_ptr<invocation_node> ParseSingle(std::string_view text,
                                             std::vector<token>& tokens,
                                             std::vector<error_entry>& errors);

// Expects ParseSingle to fail with a message containing text.
bool ExpectParseError(std::string_view source, std::string_view text);

// Lowers text as one whole file.
std::string Lower(std::string_view text, std::vector<error_entry>& errors);

TestResult RunSection(const TestSection& section);
TestResult RunAllSections(const TestSection* sections, size_t count);

}  // namespace capcheck::tests

#endif
