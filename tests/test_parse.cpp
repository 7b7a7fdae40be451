
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

#include <iostream>

namespace capcheck::tests {
namespace {

// Parses source and compares the normalized invocation with expected.
bool ExpectParsesAs(std::string_view source, std::string_view expected) {
  std::vector<error_entry> errors;
  std::vector<token> tokens;
  auto n = ParseSingle(source, tokens, errors);
  if (!n) {
    std::cerr << "failed to parse: " << source << "\n";
    for (const auto& e : errors) {
      std::cerr << "  " << e.where.to_string() << " " << e.msg << "\n";
    }
    return false;
  }
  return ExpectEqual(n->to_string(), expected, "parse");
}

bool ParsesConcreteScenario() {
  std::vector<error_entry> errors;
  std::vector<token> tokens;
  auto n = ParseSingle("assertConstraint(unitValue => eq + ord)", tokens, errors);
  if (!n || !errors.empty()) return false;
  return n->kind == invocation_kind::assert_constraint &&
         n->bounds->size() == 2 &&
         !n->scope &&
         n->pos == source_position{1, 1} &&
         ExpectEqual(n->expression, "unitValue", "expression") &&
         ExpectEqual(n->bounds->terms[0].bound->to_string(), "eq", "first bound") &&
         ExpectEqual(n->bounds->terms[1].bound->to_string(), "ord", "second bound");
}

bool ParsesTemplateArguments() {
  return ExpectParsesAs("assertConstraint(f => callable<int, const std::string&>)",
                        "assertConstraint(f => callable<int, const std::string&>)") &&
         ExpectParsesAs("assertConstraint(p => points_to<int const*>)",
                        "assertConstraint(p => points_to<int const*>)") &&
         ExpectParsesAs("assertConstraint(a => fixed<3, true>)",
                        "assertConstraint(a => fixed<3, true>)");
}

bool ParsesNestedTemplateArguments() {
  return ExpectParsesAs("wrapOpaque(m => iterable<std::pair<int, long   long>>+sized; local)",
                        "wrapOpaque(m => iterable<std::pair<int, long long>> + sized; local)");
}

bool ParsesQualifiedNames() {
  return ExpectParsesAs("assertConstraint(v => traits.reviewed + ::lib::audited)",
                        "assertConstraint(v => traits.reviewed + ::lib::audited)");
}

bool ParsesStaticScope() {
  std::vector<error_entry> errors;
  std::vector<token> tokens;
  auto n = ParseSingle("wrapOpaque(v => eq; static)", tokens, errors);
  return n && n->kind == invocation_kind::wrap_opaque && n->scope && n->scope->is_static();
}

bool KeepsExpressionAsWritten() {
  std::vector<error_entry> errors;
  std::vector<token> tokens;
  auto n = ParseSingle("assertConstraint(a > b ? f(x, [] { return 1; }) : g()\n    => eq)", tokens, errors);
  return n &&
         ExpectEqual(trim(n->expression), "a > b ? f(x, [] { return 1; }) : g()", "expression") &&
         n->expression_pos == source_position{1, 18};
}

bool EndsExpressionAtLastToken() {
  std::vector<error_entry> errors;
  std::vector<token> tokens;
  auto n = ParseSingle("wrapOpaque(f(a) /* a */ // b\n  => eq)", tokens, errors);
  return n && ExpectEqual(n->expression, "f(a)", "expression");
}

bool ReportsNodePositions() {
  std::vector<error_entry> errors;
  std::vector<token> tokens;
  auto n = ParseSingle("wrapOpaque(v => eq + ::lib::cap<int>; local)", tokens, errors);
  if (!n) return false;
  const auto& second = *n->bounds->terms[1].bound;
  return n->position() == source_position{1, 1} &&
         n->bounds->position() == source_position{1, 17} &&
         second.position() == source_position{1, 22} &&
         second.template_args[0].arg->position() == source_position{1, 33} &&
         n->scope->position() == source_position{1, 37};
}

bool RejectsEmptyBoundList() {
  return ExpectParseError("assertConstraint(x => )", "expected a capability bound after '=>'");
}

bool RejectsDanglingPlus() {
  return ExpectParseError("assertConstraint(x => eq + )", "expected a capability bound after '+'") &&
         ExpectParseError("assertConstraint(x => + eq)", "expected a capability bound after '=>' (at '+')");
}

bool ReportsDanglingPlusPosition() {
  std::vector<error_entry> errors;
  std::vector<token> tokens;
  auto n = ParseSingle("assertConstraint(x => eq + )", tokens, errors);
  return !n && errors.size() == 1 &&
         errors[0].where == source_position{1, 26} &&
         ExpectEqual(errors[0].msg, "expected a capability bound after '+'", "message");
}

bool RejectsUnbalancedTemplateArguments() {
  return ExpectParseError("assertConstraint(x => A<B)", "missing '>' to close the template argument list of 'A'") &&
         ExpectParseError("assertConstraint(x => A<B>>)", "unbalanced '>' after the capability bounds") &&
         ExpectParseError("assertConstraint(x => A<>)", "empty template argument list for 'A'") &&
         ExpectParseError("assertConstraint(x => A<B; C>)", "expected ',' or '>' in the template argument list of 'A'") &&
         ExpectParseError("assertConstraint(x => A<,>)", "expected a template argument for 'A'");
}

bool RejectsConstLiteral() {
  return ExpectParseError("assertConstraint(x => fixed<const 3>)", "a literal template argument cannot be 'const'");
}

bool RejectsIncompleteNames() {
  return ExpectParseError("assertConstraint(x => std::)", "expected a name after '::'") &&
         ExpectParseError("assertConstraint(x => traits.)", "expected a name after '.'");
}

bool RejectsMissingArrow() {
  return ExpectParseError("assertConstraint(x eq)",
                          "missing '=>' between the expression and its capability bounds in assertConstraint invocation") &&
         ExpectParseError("wrapOpaque(x)",
                          "missing '=>' between the expression and its capability bounds in wrapOpaque invocation");
}

bool RejectsMissingExpression() {
  return ExpectParseError("assertConstraint( => eq)", "missing expression before '=>' in assertConstraint invocation");
}

bool RejectsScopeOnAssert() {
  return ExpectParseError("assertConstraint(x => eq; static)",
                          "a scope qualifier is only allowed in wrapOpaque, not in assertConstraint");
}

bool RejectsBadScope() {
  return ExpectParseError("wrapOpaque(x => eq; )", "expected 'static' or a scope name after ';'") &&
         ExpectParseError("wrapOpaque(x => eq; local extra)", "unexpected text after the scope qualifier");
}

bool RejectsTrailingText() {
  return ExpectParseError("assertConstraint(x => eq ord)", "unexpected text after the capability bounds (at 'ord')");
}

const TestCase kParseTests[] = {
  {"concrete_scenario", ParsesConcreteScenario},
  {"template_arguments", ParsesTemplateArguments},
  {"nested_template_arguments", ParsesNestedTemplateArguments},
  {"qualified_names", ParsesQualifiedNames},
  {"static_scope", ParsesStaticScope},
  {"expression_as_written", KeepsExpressionAsWritten},
  {"expression_ends_at_last_token", EndsExpressionAtLastToken},
  {"node_positions", ReportsNodePositions},
};

const TestCase kParseErrorTests[] = {
  {"empty_bound_list", RejectsEmptyBoundList},
  {"dangling_plus", RejectsDanglingPlus},
  {"dangling_plus_position", ReportsDanglingPlusPosition},
  {"unbalanced_template_arguments", RejectsUnbalancedTemplateArguments},
  {"const_literal", RejectsConstLiteral},
  {"incomplete_names", RejectsIncompleteNames},
  {"missing_arrow", RejectsMissingArrow},
  {"missing_expression", RejectsMissingExpression},
  {"scope_on_assert", RejectsScopeOnAssert},
  {"bad_scope", RejectsBadScope},
  {"trailing_text", RejectsTrailingText},
};

}  // namespace

static const TestSection kParseSections[] = {
  {"parse", kParseTests, sizeof(kParseTests) / sizeof(kParseTests[0])},
  {"parse_errors", kParseErrorTests, sizeof(kParseErrorTests) / sizeof(kParseErrorTests[0])},
};

const TestSection* GetParseSections(size_t* count) {
  if (count) {
    *count = sizeof(kParseSections) / sizeof(kParseSections[0]);
  }
  return kParseSections;
}

}  // namespace capcheck::tests
