
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
//  capcheck support header: included by every file the translator writes
//===========================================================================

#ifndef CAPCHECK_CAPCHECK_H
#define CAPCHECK_CAPCHECK_H

#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#define CAPCHECK_FORWARD(x) std::forward<decltype(x)>(x)


namespace capcheck {

//-----------------------------------------------------------------------
//
//  self: stands for the checked type itself in a capability's arguments,
//        so partial_eq<self> compares a value with its own type
//
//-----------------------------------------------------------------------
//
struct self { };

template<typename Rhs, typename T>
using resolve_self_t = std::conditional_t<std::is_same_v<Rhs, self>, T, Rhs>;


//-----------------------------------------------------------------------
//
//  op: the operations a capability can grant on an opaque value
//
//-----------------------------------------------------------------------
//
namespace op {
    template<typename Rhs>
    struct equal { };

    template<typename Rhs>
    struct order { };

    struct total_equal { };
    struct total_order { };
    struct print       { };
    struct hash        { };
    struct clone       { };
    struct iterate     { };
    struct size        { };

    template<typename... Args>
    struct call { };
}


//-----------------------------------------------------------------------
//
//  capability: base of every capability type
//
//  A capability C says which types it admits (C::admits<T>) and which
//  operations it grants on an opaque value (C::grants<Op>). Derived
//  capabilities hide these two members with their own.
//
//-----------------------------------------------------------------------
//
struct capability
{
    template<typename T>
    static constexpr bool admits = false;

    template<typename Op>
    static constexpr bool grants = false;
};


//  bound: T satisfies capability Cap
//
//  T is checked exactly as given, after dropping cv-ref qualification only;
//  pointers and reference_wrappers are never looked through
//
template<typename T, typename Cap>
concept bound =
    std::is_base_of_v<capability, Cap>
    && Cap::template admits<std::remove_cvref_t<T>>;

template<typename T, typename... Caps>
concept satisfies = (bound<T, Caps> && ...);


//-----------------------------------------------------------------------
//  Customization points
//

//  Types whose equality is not an equivalence relation (floating point
//  has NaN) are not totally comparable
template<typename T>
inline constexpr bool enable_total_equality = !std::is_floating_point_v<T>;

template<typename A, typename B>
inline constexpr bool enable_total_equality<std::pair<A, B>> =
    enable_total_equality<A> && enable_total_equality<B>;

template<typename... Ts>
inline constexpr bool enable_total_equality<std::tuple<Ts...>> =
    (enable_total_equality<Ts> && ...);

template<typename T>
inline constexpr bool enable_total_equality<std::optional<T>> = enable_total_equality<T>;

template<typename T, std::size_t N>
inline constexpr bool enable_total_equality<std::array<T, N>> = enable_total_equality<T>;

template<typename T, typename Alloc>
inline constexpr bool enable_total_equality<std::vector<T, Alloc>> = enable_total_equality<T>;

template<typename T>
inline constexpr bool enable_total_order = enable_total_equality<T>;


//  Types that refer to data they do not own
template<typename T>
inline constexpr bool enable_borrowed = false;

template<typename T>
concept borrowing =
    std::is_reference_v<T>
    || (std::is_pointer_v<T> && !std::is_function_v<std::remove_pointer_t<T>>)
    || enable_borrowed<std::remove_cv_t<T>>;

template<typename T>
inline constexpr bool enable_borrowed<std::reference_wrapper<T>> = true;

template<typename CharT, typename Traits>
inline constexpr bool enable_borrowed<std::basic_string_view<CharT, Traits>> = true;

template<typename T, std::size_t Extent>
inline constexpr bool enable_borrowed<std::span<T, Extent>> = true;

template<typename R>
inline constexpr bool enable_borrowed<std::ranges::ref_view<R>> = true;

template<typename A, typename B>
inline constexpr bool enable_borrowed<std::pair<A, B>> = borrowing<A> || borrowing<B>;

template<typename... Ts>
inline constexpr bool enable_borrowed<std::tuple<Ts...>> = (borrowing<Ts> || ...);

template<typename T>
inline constexpr bool enable_borrowed<std::optional<T>> = borrowing<T>;


//  Nominal capabilities: a type has one only where it is declared to,
//  by specializing implements<Cap, Type> to true
template<typename Cap, typename T>
inline constexpr bool implements = false;


namespace detail {

template<typename B>
concept boolean_testable = std::convertible_to<B, bool>;

template<typename T, typename U>
concept equality_comparable_with =
    requires (T const& t, U const& u) {
        { t == u } -> boolean_testable;
        { t != u } -> boolean_testable;
    };

template<typename T, typename U>
concept partially_ordered_with =
    requires (T const& t, U const& u) {
        { t <  u } -> boolean_testable;
        { t >  u } -> boolean_testable;
        { t <= u } -> boolean_testable;
        { t >= u } -> boolean_testable;
    };

template<typename T, typename Item>
concept range_of =
    std::ranges::input_range<T>
    && std::convertible_to<std::ranges::range_reference_t<T>, Item>;

//  grants_rhs: is Op (an op::equal or op::order) covered by a
//  capability declared against Rhs
//
template<typename Op, template<typename> class Tag, typename Rhs>
inline constexpr bool grants_rhs = false;

template<template<typename> class Tag, typename R, typename Rhs>
inline constexpr bool grants_rhs<Tag<R>, Tag, Rhs> =
    std::is_same_v<R, Rhs>
    || (
        !std::is_same_v<Rhs, self>
        && !std::is_same_v<R, self>
        && std::is_convertible_v<R const&, Rhs>
        );

template<typename... Ts>
struct type_list { };

template<typename... Params, typename... Args>
consteval auto arguments_convert(type_list<Params...>, type_list<Args...>)
    -> bool
{
    if constexpr (sizeof...(Params) != sizeof...(Args)) {
        return false;
    }
    else {
        return (std::is_convertible_v<Args, Params> && ...);
    }
}

template<typename Op, typename... Params>
inline constexpr bool grants_call = false;

template<typename... Args, typename... Params>
inline constexpr bool grants_call<op::call<Args...>, Params...> =
    arguments_convert(type_list<Params...>{}, type_list<Args...>{});

//  first_granting: the first of Caps that grants Op
//
template<typename Op, typename... Caps>
struct first_granting { };

template<typename Op, typename Cap, typename... Rest>
struct first_granting<Op, Cap, Rest...>
    : std::conditional_t<
        Cap::template grants<Op>,
        std::type_identity<Cap>,
        first_granting<Op, Rest...>
    >
{ };

template<typename Op, typename... Caps>
using call_result_t = typename first_granting<Op, Caps...>::type::result_type;

//  Builds a three-way result out of the two-way comparisons a capability
//  actually vouches for
//
template<typename Ordering, typename L, typename R>
constexpr auto synthesize_ordering(L const& l, R const& r)
    -> Ordering
{
    if (static_cast<bool>(l == r)) { return Ordering::equivalent; }
    if (static_cast<bool>(l <  r)) { return Ordering::less;       }
    if (static_cast<bool>(l >  r)) { return Ordering::greater;    }
    if constexpr (std::is_same_v<Ordering, std::partial_ordering>) {
        return Ordering::unordered;
    }
    else {
        return Ordering::equivalent;
    }
}

}


//-----------------------------------------------------------------------
//
//  Library capabilities
//
//-----------------------------------------------------------------------
//

//  partial_eq<Rhs>: t == r and t != r
//
template<typename Rhs = self>
struct partial_eq : capability
{
    template<typename T>
    static constexpr bool admits =
        detail::equality_comparable_with<T, resolve_self_t<Rhs, T>>;

    template<typename Op>
    static constexpr bool grants = detail::grants_rhs<Op, op::equal, Rhs>;
};


//  eq: equality that is an equivalence relation
//
struct eq : capability
{
    template<typename T>
    static constexpr bool admits =
        partial_eq<>::admits<T>
        && enable_total_equality<T>;

    template<typename Op>
    static constexpr bool grants =
        partial_eq<>::grants<Op>
        || std::is_same_v<Op, op::total_equal>;
};


//  partial_ord<Rhs>: partial_eq<Rhs> plus < > <= >=
//
template<typename Rhs = self>
struct partial_ord : capability
{
    template<typename T>
    static constexpr bool admits =
        partial_eq<Rhs>::template admits<T>
        && detail::partially_ordered_with<T, resolve_self_t<Rhs, T>>;

    template<typename Op>
    static constexpr bool grants =
        partial_eq<Rhs>::template grants<Op>
        || detail::grants_rhs<Op, op::order, Rhs>;
};


//  ord: a total order over T
//
struct ord : capability
{
    template<typename T>
    static constexpr bool admits =
        eq::admits<T>
        && std::totally_ordered<T>
        && enable_total_order<T>;

    template<typename Op>
    static constexpr bool grants =
        eq::grants<Op>
        || std::is_same_v<Op, op::order<self>>
        || std::is_same_v<Op, op::total_order>;
};


struct printable : capability
{
    template<typename T>
    static constexpr bool admits =
        requires (std::ostream& o, T const& t) {
            { o << t } -> std::convertible_to<std::ostream&>;
        };

    template<typename Op>
    static constexpr bool grants = std::is_same_v<Op, op::print>;
};


struct hashable : capability
{
    template<typename T>
    static constexpr bool admits =
        requires (T const& t) {
            { std::hash<T>{}(t) } -> std::convertible_to<std::size_t>;
        };

    template<typename Op>
    static constexpr bool grants = std::is_same_v<Op, op::hash>;
};


struct cloneable : capability
{
    template<typename T>
    static constexpr bool admits = std::copy_constructible<T>;

    template<typename Op>
    static constexpr bool grants = std::is_same_v<Op, op::clone>;
};


//  callable<R, Args...>: can be called with Args... for a result
//  convertible to R
//
template<typename R, typename... Args>
struct callable : capability
{
    using result_type = R;

    template<typename T>
    static constexpr bool admits = std::is_invocable_r_v<R, T&, Args...>;

    template<typename Op>
    static constexpr bool grants = detail::grants_call<Op, Args...>;
};


template<typename Item>
struct iterable : capability
{
    template<typename T>
    static constexpr bool admits = detail::range_of<T, Item>;

    template<typename Op>
    static constexpr bool grants = std::is_same_v<Op, op::iterate>;
};


struct sized : capability
{
    template<typename T>
    static constexpr bool admits =
        requires (T const& t) {
            std::ranges::size(t);
        };

    template<typename Op>
    static constexpr bool grants = std::is_same_v<Op, op::size>;
};


//  nominal<Cap>: base for marker capabilities, e.g.
//
//      struct reviewed : capcheck::nominal<reviewed> { };
//      template<> inline constexpr bool capcheck::implements<reviewed, widget> = true;
//
template<typename Cap>
struct nominal : capability
{
    template<typename T>
    static constexpr bool admits = implements<Cap, T>;
};


//-----------------------------------------------------------------------
//
//  Scope qualifiers
//
//-----------------------------------------------------------------------
//
namespace scope {

//  The whole run of the program: the value must own what it refers to
struct unbounded
{
    template<typename T>
    static constexpr bool admits = !borrowing<T>;
};

//  The enclosing scope: borrowed data is allowed
struct local
{
    template<typename T>
    static constexpr bool admits = true;
};

}

template<typename T, typename Scope>
concept within = Scope::template admits<std::remove_cvref_t<T>>;


//-----------------------------------------------------------------------
//
//  deferred: a zero-argument callable that evaluates an expression on
//            each invocation, checking its type against a verifier
//
//-----------------------------------------------------------------------
//
template<typename Thunk, typename Verifier>
class deferred
{
public:
    using value_type = std::invoke_result_t<Thunk const&>;

private:
    Thunk    thunk;
    Verifier verifier;

public:
    constexpr deferred(Thunk t, Verifier v)
        : thunk   (std::move(t))
        , verifier(std::move(v))
    { }

    constexpr auto operator()() const
        -> value_type
    {
        auto&& value = std::invoke(thunk);
        std::invoke(verifier, std::as_const(value));
        return std::forward<value_type>(value);
    }
};


//  defer: pairs an unevaluated expression with the verifier generated for
//  it. The verifier is only named in an unevaluated operand here, so an
//  unsatisfied bound fails compilation even if the result is never called.
//
template<typename Thunk, typename Verifier>
    requires std::invocable<Thunk const&>
constexpr auto defer(Thunk thunk, Verifier verifier)
    -> deferred<Thunk, Verifier>
{
    using checked = std::remove_reference_t<std::invoke_result_t<Thunk const&>>;
    static_assert(
        std::is_void_v<decltype(verifier(std::declval<checked const&>()))>,
        "a capcheck verifier returns nothing"
    );
    return { std::move(thunk), std::move(verifier) };
}


//-----------------------------------------------------------------------
//
//  opaque: a value whose only visible properties are its capabilities
//
//  T          the wrapped type, never observable through the opaque value
//  Scope      how long the value may be used for
//  Caps...    the capabilities it exposes
//
//-----------------------------------------------------------------------
//
template<typename T, typename Scope, typename... Caps>
class opaque
{
    static_assert(sizeof...(Caps) > 0, "an opaque type exposes at least one capability");
    static_assert(std::is_same_v<T, std::decay_t<T>>, "an opaque type wraps a decayed value type");
    static_assert(within<T, Scope>, "the wrapped type does not live as long as the opaque type's scope");
    static_assert(satisfies<T, Caps...>, "the wrapped type lacks a capability the opaque type exposes");

    T held;

    friend struct std::hash<opaque>;

public:
    template<typename Op>
    static constexpr bool granted = (Caps::template grants<Op> || ...);

private:
    using order_category = std::conditional_t<
        granted<op::total_order>,
        std::weak_ordering,
        std::partial_ordering
    >;

public:
    constexpr explicit opaque(T value)
        : held(std::move(value))
    { }

    opaque(opaque const&) requires granted<op::clone> = default;
    opaque(opaque&&) = default;
    auto operator=(opaque const&) -> opaque& requires granted<op::clone> = default;
    auto operator=(opaque&&) -> opaque& = default;


    //-------------------------------------------------------------------
    //  Comparisons
    //
    friend constexpr auto operator==(opaque const& l, opaque const& r)
        -> bool
        requires granted<op::equal<self>>
    {
        return static_cast<bool>(l.held == r.held);
    }

    template<typename Rhs>
        requires (!std::is_same_v<Rhs, opaque>) && granted<op::equal<Rhs>>
    friend constexpr auto operator==(opaque const& l, Rhs const& r)
        -> bool
    {
        return static_cast<bool>(l.held == r);
    }

    friend constexpr auto operator<=>(opaque const& l, opaque const& r)
        -> order_category
        requires granted<op::order<self>>
    {
        return detail::synthesize_ordering<order_category>(l.held, r.held);
    }

    template<typename Rhs>
        requires (!std::is_same_v<Rhs, opaque>) && granted<op::order<Rhs>>
    friend constexpr auto operator<=>(opaque const& l, Rhs const& r)
        -> std::partial_ordering
    {
        return detail::synthesize_ordering<std::partial_ordering>(l.held, r);
    }


    //-------------------------------------------------------------------
    //  Printing
    //
    friend auto operator<<(std::ostream& o, opaque const& x)
        -> std::ostream&
        requires granted<op::print>
    {
        return o << x.held;
    }


    //-------------------------------------------------------------------
    //  Calling
    //
    template<typename... Args>
        requires granted<op::call<Args&&...>>
    constexpr auto operator()(Args&&... args)
        -> detail::call_result_t<op::call<Args&&...>, Caps...>
    {
        using result = detail::call_result_t<op::call<Args&&...>, Caps...>;
        if constexpr (std::is_void_v<result>) {
            std::invoke(held, std::forward<Args>(args)...);
        }
        else {
            return std::invoke(held, std::forward<Args>(args)...);
        }
    }


    //-------------------------------------------------------------------
    //  Ranges
    //
    constexpr auto begin()
        requires granted<op::iterate>
    {
        return std::ranges::begin(held);
    }

    constexpr auto end()
        requires granted<op::iterate>
    {
        return std::ranges::end(held);
    }

    constexpr auto begin() const
        requires granted<op::iterate> && std::ranges::range<T const>
    {
        return std::ranges::begin(held);
    }

    constexpr auto end() const
        requires granted<op::iterate> && std::ranges::range<T const>
    {
        return std::ranges::end(held);
    }

    constexpr auto size() const
        requires granted<op::size>
    {
        return std::ranges::size(held);
    }
};


//  An opaque value keeps exactly the properties its capabilities vouch for
//
template<typename T, typename S, typename... Caps>
inline constexpr bool enable_total_equality<opaque<T, S, Caps...>> =
    opaque<T, S, Caps...>::template granted<op::total_equal>;

template<typename T, typename S, typename... Caps>
inline constexpr bool enable_total_order<opaque<T, S, Caps...>> =
    opaque<T, S, Caps...>::template granted<op::total_order>;

template<typename T, typename S, typename... Caps>
inline constexpr bool enable_borrowed<opaque<T, S, Caps...>> = borrowing<T>;

template<typename Cap, typename T, typename S, typename... Caps>
inline constexpr bool implements<Cap, opaque<T, S, Caps...>> =
    (std::is_same_v<Cap, Caps> || ...);


//-----------------------------------------------------------------------
//
//  Direct interface, for code that is not run through the translator
//
//-----------------------------------------------------------------------
//
template<typename... Caps, typename Thunk>
constexpr auto assert_bound(Thunk thunk)
{
    return defer(
        std::move(thunk),
        []<typename T>(T const&) requires satisfies<T, Caps...> { }
    );
}

template<typename Scope, typename... Caps, typename T>
    requires within<std::decay_t<T>, Scope> && satisfies<std::decay_t<T>, Caps...>
constexpr auto as_trait_in(T&& value)
    -> opaque<std::decay_t<T>, Scope, Caps...>
{
    return opaque<std::decay_t<T>, Scope, Caps...>(CAPCHECK_FORWARD(value));
}

template<typename... Caps, typename T>
constexpr auto as_trait(T&& value)
    -> opaque<std::decay_t<T>, scope::unbounded, Caps...>
{
    return as_trait_in<scope::unbounded, Caps...>(CAPCHECK_FORWARD(value));
}

}


namespace std {

template<typename T, typename S, typename... Caps>
    requires capcheck::opaque<T, S, Caps...>::template granted<capcheck::op::hash>
struct hash<capcheck::opaque<T, S, Caps...>>
{
    auto operator()(capcheck::opaque<T, S, Caps...> const& o) const
        -> std::size_t
    {
        return std::hash<T>{}(o.held);
    }
};

}


//  The expression must not contain a top-level comma
#define CAPCHECK_ASSERT_BOUND(expr, ...) ::capcheck::assert_bound<__VA_ARGS__>([&] { return (expr); })
#define CAPCHECK_AS_TRAIT(expr, ...)     ::capcheck::as_trait<__VA_ARGS__>(expr)

#endif
