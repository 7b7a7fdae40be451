
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <cstdlib>
#include <iostream>
#include <vector>

#include "test_utils.h"

namespace capcheck::tests {

const TestSection* GetIoSections(size_t* count);
const TestSection* GetLexSections(size_t* count);
const TestSection* GetParseSections(size_t* count);
const TestSection* GetToCppSections(size_t* count);
const TestSection* GetTranslatorSections(size_t* count);
const TestSection* GetSupportSections(size_t* count);
const TestSection* GetTranslatedSections(size_t* count);

}  // namespace capcheck::tests

int main() {
  using namespace capcheck::tests;

  using SectionGetter = const TestSection* (*)(size_t*);
  const SectionGetter getters[] = {
      GetIoSections,
      GetLexSections,
      GetParseSections,
      GetToCppSections,
      GetTranslatorSections,
      GetSupportSections,
      GetTranslatedSections,
  };

  std::vector<TestSection> sections;
  for (SectionGetter get : getters) {
    size_t count = 0;
    const TestSection* got = get(&count);
    sections.insert(sections.end(), got, got + count);
  }

  TestResult result = RunAllSections(sections.data(), sections.size());
  return result.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
