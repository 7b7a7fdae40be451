
//  Copyright (c) Herb Sutter
//  SPDX-License-Identifier: CC-BY-NC-ND-4.0

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "capcheck.h"
#include "test_utils.h"

#include <cmath>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_set>

namespace capcheck::tests::support_fixtures {

struct unit {
  int v = 0;
  auto operator<=>(const unit&) const = default;
};

struct marker : capcheck::nominal<marker> {};

}  // namespace capcheck::tests::support_fixtures

namespace capcheck {
template <>
inline constexpr bool implements<tests::support_fixtures::marker, tests::support_fixtures::unit> = true;
}  // namespace capcheck

namespace capcheck::tests {
namespace {

using support_fixtures::marker;
using support_fixtures::unit;

// Capabilities over plain types.
static_assert(bound<int, eq>);
static_assert(!bound<double, eq>);
static_assert(bound<double, partial_ord<>>);
static_assert(!bound<double, ord>);
static_assert(bound<unit, ord>);
static_assert(bound<const unit&, ord>);
static_assert(!bound<std::vector<double>, eq>);
static_assert(bound<std::vector<int>, ord>);
static_assert(bound<long, partial_eq<int>>);
static_assert(bound<std::string, hashable>);
static_assert(!bound<std::vector<int>, hashable>);
static_assert(!bound<std::unique_ptr<int>, cloneable>);
static_assert(bound<int (*)(int), callable<int, int>>);
static_assert(!bound<int (*)(int), callable<int, std::string>>);
static_assert(bound<std::vector<int>, iterable<int>> && bound<std::vector<int>, sized>);
static_assert(!bound<int, iterable<int>>);

// Indirection is checked as itself.
static_assert(bound<unit, marker>);
static_assert(!bound<unit*, marker>);
static_assert(!bound<std::reference_wrapper<unit>, marker>);
static_assert(!bound<std::optional<unit>, marker>);

// Scopes.
static_assert(within<std::string, scope::unbounded>);
static_assert(within<int (*)(int), scope::unbounded>);
static_assert(!within<std::string_view, scope::unbounded>);
static_assert(!within<int*, scope::unbounded>);
static_assert(!within<std::pair<int, std::span<int>>, scope::unbounded>);
static_assert(within<std::string_view, scope::local>);

// An opaque value has its capabilities and nothing else.
using ordered = opaque<int, scope::unbounded, ord, printable>;
using equal_only = opaque<int, scope::unbounded, eq>;

template <typename T>
concept less_comparable = requires(const T& a) { a < a; };

static_assert(bound<ordered, ord>);
static_assert(bound<ordered, eq>);
static_assert(bound<ordered, printable>);
static_assert(!bound<ordered, hashable>);
static_assert(!bound<ordered, cloneable>);
static_assert(!std::is_copy_constructible_v<ordered>);
static_assert(std::is_move_constructible_v<ordered>);
static_assert(less_comparable<int>);
static_assert(!less_comparable<equal_only>);
static_assert(!bound<equal_only, printable>);
static_assert(!bound<equal_only, partial_eq<int>>);
static_assert(bound<opaque<unit, scope::unbounded, marker>, marker>);
static_assert(!bound<opaque<unit, scope::unbounded, ord>, marker>);
static_assert(!within<opaque<std::string_view, scope::local, eq>, scope::unbounded>);

bool AssertionIsDeferred() {
  int evaluations = 0;
  auto check = assert_bound<eq, ord>([&] {
    ++evaluations;
    return unit{4};
  });
  if (evaluations != 0) return false;
  unit a = check();
  unit b = check();
  return evaluations == 2 && a == b && a.v == 4;
}

bool WrapIsEager() {
  int evaluations = 0;
  auto make = [&] {
    ++evaluations;
    return unit{1};
  };
  auto w = as_trait<ord>(make());
  return evaluations == 1 && w == as_trait<ord>(unit{1});
}

bool ConcreteScenario() {
  unit unitValue{7};
  auto check = assert_bound<eq, ord>([&] { return unitValue; });
  unit checked = check();
  return checked == unitValue;
}

bool OrdersOpaqueValues() {
  auto a = as_trait<ord>(unit{1});
  auto b = as_trait<ord>(unit{2});
  return a < b && b > a && a <= a && a != b &&
         (a <=> b) == std::weak_ordering::less &&
         (b <=> a) == std::weak_ordering::greater;
}

bool KeepsPartialOrder() {
  auto x = as_trait<partial_ord<>>(std::nan(""));
  auto y = as_trait<partial_ord<>>(1.0);
  return !(x == x) && (x <=> x) == std::partial_ordering::unordered &&
         (y <=> y) == std::partial_ordering::equivalent;
}

bool ComparesAgainstOtherType() {
  auto w = as_trait<partial_ord<int>>(5L);
  return w == 5 && w != 4 && w < 6 && 6 > w && 5 == w;
}

bool PrintsOpaqueValue() {
  auto p = as_trait<printable>(std::string("hello"));
  std::ostringstream out;
  out << p;
  return out.str() == "hello";
}

bool HashesOpaqueValue() {
  auto h = as_trait<hashable, eq>(std::string("key"));
  bool same = std::hash<decltype(h)>{}(h) == std::hash<std::string>{}("key");
  std::unordered_set<decltype(h)> set;
  set.insert(std::move(h));
  set.insert(as_trait<hashable, eq>(std::string("key")));
  return same && set.size() == 1;
}

bool CallsOpaqueValue() {
  auto twice = as_trait<callable<int, int>>([](int x) { return 2 * x; });
  int hits = 0;
  auto bump = as_trait<callable<void>>([&hits] { ++hits; });
  bump();
  bump();
  return twice(21) == 42 && hits == 2;
}

bool IteratesOpaqueValue() {
  auto xs = as_trait<iterable<int>, sized>(std::vector<int>{1, 2, 3});
  int sum = 0;
  for (int x : xs) sum += x;
  const auto& cxs = xs;
  for (int x : cxs) sum += x;
  return sum == 12 && xs.size() == 3;
}

bool ClonesOnlyWhenCloneable() {
  auto a = as_trait<cloneable, eq>(std::string("x"));
  auto b = a;
  b = a;
  return a == b;
}

bool WrapsBorrowedValueLocally() {
  std::string owner = "abc";
  auto v = as_trait_in<scope::local, eq>(std::string_view{owner});
  return v == as_trait_in<scope::local, eq>(std::string_view{"abc"});
}

bool ReassertsOpaqueValue() {
  auto w = as_trait<ord, cloneable>(unit{3});
  auto again = assert_bound<ord>([&] { return w; });
  return again() == w;
}

bool MacrosMatchFunctions() {
  auto d = CAPCHECK_ASSERT_BOUND(40 + 2, capcheck::ord);
  auto w = CAPCHECK_AS_TRAIT(d(), capcheck::ord);
  return d() == 42 && w == CAPCHECK_AS_TRAIT(42, capcheck::ord);
}

const TestCase kSupportTests[] = {
  {"assertion_deferred", AssertionIsDeferred},
  {"wrap_eager", WrapIsEager},
  {"concrete_scenario", ConcreteScenario},
  {"order_opaque_values", OrdersOpaqueValues},
  {"partial_order", KeepsPartialOrder},
  {"compare_other_type", ComparesAgainstOtherType},
  {"print", PrintsOpaqueValue},
  {"hash", HashesOpaqueValue},
  {"call", CallsOpaqueValue},
  {"iterate", IteratesOpaqueValue},
  {"clone", ClonesOnlyWhenCloneable},
  {"local_scope", WrapsBorrowedValueLocally},
  {"reassert_opaque", ReassertsOpaqueValue},
  {"macros", MacrosMatchFunctions},
};

}  // namespace

static const TestSection kSupportSections[] = {
  {"support", kSupportTests, sizeof(kSupportTests) / sizeof(kSupportTests[0])},
};

const TestSection* GetSupportSections(size_t* count) {
  if (count) {
    *count = sizeof(kSupportSections) / sizeof(kSupportSections[0]);
  }
  return kSupportSections;
}

}  // namespace capcheck::tests
