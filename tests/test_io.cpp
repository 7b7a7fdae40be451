
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "test_utils.h"

namespace capcheck::tests {
namespace {

bool FindsBothForms() {
  std::vector<error_entry> errors;
  std::string_view text =
      "auto a = assertConstraint(x => eq);\n"
      "auto b = wrapOpaque(y => ord);\n";
  auto sites = FindSites(text, errors);
  if (!errors.empty() || sites.size() != 2) return false;
  if (sites[0].kind != invocation_kind::assert_constraint) return false;
  if (sites[1].kind != invocation_kind::wrap_opaque) return false;
  if (sites[0].pos != source_position{1, 10}) return false;
  if (sites[1].pos != source_position{2, 10}) return false;
  if (sites[0].body_pos != source_position{1, 27}) return false;
  return ExpectEqual(sites[0].body(text), "x => eq", "assert body") &&
         ExpectEqual(sites[1].body(text), "y => ord", "wrap body");
}

bool SkipsComments() {
  std::vector<error_entry> errors;
  auto sites = FindSites(
      "// assertConstraint(x => eq)\n"
      "/* wrapOpaque(y => eq) */ int z;\n",
      errors);
  return errors.empty() && sites.empty();
}

bool SkipsLiterals() {
  std::vector<error_entry> errors;
  auto sites = FindSites(
      "auto s = \"assertConstraint(x => eq)\";\n"
      "auto r = R\"(wrapOpaque(y => eq))\";\n"
      "auto u = u8\"wrapOpaque(\";\n"
      "char c = '(';\n",
      errors);
  return errors.empty() && sites.empty();
}

bool IgnoresMemberAccess() {
  std::vector<error_entry> errors;
  auto sites = FindSites(
      "obj.assertConstraint(x => eq);\n"
      "p->wrapOpaque(y => eq);\n"
      "ns::assertConstraint(z => eq);\n",
      errors);
  return errors.empty() && sites.empty();
}

bool IgnoresNameWithoutParen() {
  std::vector<error_entry> errors;
  auto sites = FindSites(
      "auto assertConstraint = 1;\n"
      "int assertConstraintX(int);\n"
      "int wrapOpaque_(int);\n",
      errors);
  return errors.empty() && sites.empty();
}

bool AllowsSpaceBeforeParen() {
  std::vector<error_entry> errors;
  std::string_view text = "wrapOpaque /* note */ (v => eq)";
  auto sites = FindSites(text, errors);
  return errors.empty() && sites.size() == 1 &&
         ExpectEqual(sites[0].body(text), "v => eq", "body");
}

bool ReportsOutermostOnly() {
  std::vector<error_entry> errors;
  std::string_view text = "f(wrapOpaque(assertConstraint(v => eq) => cloneable));";
  auto sites = FindSites(text, errors);
  if (!errors.empty() || sites.size() != 1) return false;
  return sites[0].kind == invocation_kind::wrap_opaque &&
         ExpectEqual(sites[0].body(text), "assertConstraint(v => eq) => cloneable", "outer body");
}

bool BalancesParentheses() {
  std::vector<error_entry> errors;
  std::string_view text = "assertConstraint(g(1, (2)) => eq) + h()";
  auto sites = FindSites(text, errors);
  if (!errors.empty() || sites.size() != 1) return false;
  return ExpectEqual(sites[0].body(text), "g(1, (2)) => eq", "body") &&
         ExpectEqual(text.substr(sites[0].end), " + h()", "rest");
}

bool IgnoresParenInsideLiteral() {
  std::vector<error_entry> errors;
  std::string_view text = "assertConstraint(s(\")\", ')') => eq);";
  auto sites = FindSites(text, errors);
  return errors.empty() && sites.size() == 1 &&
         ExpectEqual(sites[0].body(text), "s(\")\", ')') => eq", "body");
}

bool DigitSeparatorIsNotACharLiteral() {
  std::vector<error_entry> errors;
  auto sites = FindSites("int n = 1'000; assertConstraint(n => eq); char c = 'x';", errors);
  return errors.empty() && sites.size() == 1;
}

bool MultilineBodyPosition() {
  std::vector<error_entry> errors;
  std::string_view text = "int x;\n  wrapOpaque(\n    v => eq\n  );\n";
  auto sites = FindSites(text, errors);
  if (!errors.empty() || sites.size() != 1) return false;
  return sites[0].pos == source_position{2, 3} &&
         sites[0].body_pos == source_position{2, 14} &&
         ExpectEqual(text.substr(sites[0].end), ";\n", "rest");
}

bool ReportsUnterminatedInvocation() {
  std::vector<error_entry> errors;
  auto sites = FindSites("int x = assertConstraint(v => eq;\n", errors);
  return sites.empty() && errors.size() == 1 &&
         errors[0].where == source_position{1, 9} &&
         HasError(errors, "missing ')' to close assertConstraint invocation");
}

bool SourceNormalizesLineEndings() {
  std::vector<error_entry> errors;
  source src{errors};
  src.set_text("a\r\nb\r\n");
  return errors.empty() && src.get_text() == "a\nb\n" && src.line_count() == 3;
}

bool SourceReportsMissingFile() {
  std::vector<error_entry> errors;
  source src{errors};
  return !src.load("no/such/dir/input.capc") &&
         HasError(errors, "could not open input file no/such/dir/input.capc");
}

const TestCase kIoTests[] = {
  {"find_both_forms", FindsBothForms},
  {"skip_comments", SkipsComments},
  {"skip_literals", SkipsLiterals},
  {"ignore_member_access", IgnoresMemberAccess},
  {"ignore_name_without_paren", IgnoresNameWithoutParen},
  {"allow_space_before_paren", AllowsSpaceBeforeParen},
  {"report_outermost_only", ReportsOutermostOnly},
  {"balance_parentheses", BalancesParentheses},
  {"ignore_paren_inside_literal", IgnoresParenInsideLiteral},
  {"digit_separator", DigitSeparatorIsNotACharLiteral},
  {"multiline_body_position", MultilineBodyPosition},
  {"unterminated_invocation", ReportsUnterminatedInvocation},
  {"source_line_endings", SourceNormalizesLineEndings},
  {"source_missing_file", SourceReportsMissingFile},
};

}  // namespace

static const TestSection kIoSections[] = {
  {"io", kIoTests, sizeof(kIoTests) / sizeof(kIoTests[0])},
};

const TestSection* GetIoSections(size_t* count) {
  if (count) {
    *count = sizeof(kIoSections) / sizeof(kIoSections[0]);
  }
  return kIoSections;
}

}  // namespace capcheck::tests
