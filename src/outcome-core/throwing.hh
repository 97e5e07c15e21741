#pragma once

#include <outcome-core/allocation.hh>
#include <outcome-core/assert.hh>
#include <outcome-core/errors.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// Throwing functional types
// =========================================================================================================
//
// oc::throwing<R(Args...), X> is a move-only owning callable that declares the failure type X it may throw.
// The callable lives in an oc::any_allocation from oc::default_memory_resource, or from a custom
// resource via create_from.
// The declaration is not enforced at runtime, it lets outcomes check at compile time
// that a callback stays within their catching ceiling.
//
// Shapes:
//   t_supplier<T, X>              T()
//   t_function<T, R, X>           R(T const&)
//   t_consumer<T, X>              void(T const&)
//   t_runnable<X>                 void()
//   t_predicate<T, X>             bool(T const&)
//   t_comparator<T, X>            int(T const&, T const&), negative/zero/positive
//   t_bi_function<T, U, R, X>     R(T const&, U const&)
//   t_bi_consumer<T, U, X>        void(T const&, U const&)
//   t_bi_predicate<T, U, X>       bool(T const&, U const&)
//   t_unary_operator<T, X>        T(T const&)
//   t_binary_operator<T, X>       T(T const&, T const&)
//
// Composition consumes the receiver and declares widened_failure_t of both failure types:
//   f.and_then(after)             functions, bi-functions: after(f(args...)); consumers: f(args...), after(args...)
//   f.compose(before)             functions: f(before(v))
//   p.and_(q), p.or_(q)           predicates, short-circuiting
//   p.negate()                    predicates
//   c.reversed()                  comparators, swapped arguments
//   c.then_comparing(d)           comparators, d decides ties of c
//   identity()                    unary operators
//   min_by(c), max_by(c)          binary operators choosing by a comparator
//
// Failure widening (widened_failure_t<X, Y>):
//   same type                     -> X
//   one derives from the other    -> the base
//   both derive from std::exception -> std::exception
//   otherwise                     -> oc::any_failure
//

namespace oc
{
namespace impl
{
template <class X, class Y>
auto widened_failure_of()
{
    if constexpr (std::is_same_v<X, Y> || std::is_base_of_v<X, Y>)
        return std::type_identity<X>{};
    else if constexpr (std::is_base_of_v<Y, X>)
        return std::type_identity<Y>{};
    else if constexpr (std::is_base_of_v<std::exception, X> && std::is_base_of_v<std::exception, Y>)
        return std::type_identity<std::exception>{};
    else
        return std::type_identity<any_failure>{};
}

template <class... Args>
struct first_arg
{
    using type = void;
};
template <class A, class... Rest>
struct first_arg<A, Rest...>
{
    using type = std::remove_cvref_t<A>;
};
template <class... Args>
using first_arg_t = typename first_arg<Args...>::type;

template <class F>
struct declared_failure
{
};
template <class F>
    requires requires { typename F::failure_type; }
struct declared_failure<F>
{
    using type = typename F::failure_type;
};

template <class T>
struct is_throwing_t : std::false_type
{
};
template <class Signature, class X>
struct is_throwing_t<throwing<Signature, X>> : std::true_type
{
};
} // namespace impl

/// Smallest declared failure type covering both X and Y
template <class X, class Y>
using widened_failure_t = typename decltype(impl::widened_failure_of<X, Y>())::type;

/// True iff a callable declaring Y may be used where X is declared
template <class X, class Y>
constexpr bool failure_covers = std::is_same_v<widened_failure_t<X, Y>, X>;

/// True iff F declares its failure type via a failure_type member
template <class F>
constexpr bool declares_failure = requires { typename std::remove_cvref_t<F>::failure_type; };

/// The failure type declared by F, or Default for plain callables
template <class F, class Default>
using declared_failure_or = typename std::conditional_t<declares_failure<F>,
                                                        impl::declared_failure<std::remove_cvref_t<F>>,
                                                        std::type_identity<Default>>::type;

template <class T>
constexpr bool is_throwing = impl::is_throwing_t<std::remove_cvref_t<T>>::value;

// shape aliases
template <class T, class X = std::exception>
using t_supplier = throwing<T(), X>;
template <class T, class R, class X = std::exception>
using t_function = throwing<R(T const&), X>;
template <class T, class X = std::exception>
using t_consumer = throwing<void(T const&), X>;
template <class X = std::exception>
using t_runnable = throwing<void(), X>;
template <class T, class X = std::exception>
using t_predicate = throwing<bool(T const&), X>;
template <class T, class X = std::exception>
using t_comparator = throwing<int(T const&, T const&), X>;
template <class T, class U, class R, class X = std::exception>
using t_bi_function = throwing<R(T const&, U const&), X>;
template <class T, class U, class X = std::exception>
using t_bi_consumer = throwing<void(T const&, U const&), X>;
template <class T, class U, class X = std::exception>
using t_bi_predicate = throwing<bool(T const&, U const&), X>;
template <class T, class X = std::exception>
using t_unary_operator = throwing<T(T const&), X>;
template <class T, class X = std::exception>
using t_binary_operator = throwing<T(T const&, T const&), X>;
} // namespace oc

/// Move-only owning callable with signature R(Args...) that may throw failures of type X
/// Like unique_ptr<int>, const-ness of this object does not imply constness of the wrapped callable!
template <class R, class... Args, class X>
struct oc::throwing<R(Args...), X>
{
    using failure_type = X;
    using result_type = R;

public:
    R operator()(Args... args) const
    {
        OC_ASSERT(is_valid(), "cannot call an invalid oc::throwing");
        return _thunk(_payload.ptr, oc::forward<Args>(args)...);
    }

    [[nodiscard]] bool is_valid() const { return _payload.is_valid(); }
    explicit operator bool() const { return _payload.is_valid(); }

    // construction
public:
    throwing() = default;

    /// Wraps any callable invocable with Args... whose result converts to R
    /// A throwing callable is only accepted if its declared failure type is covered by X
    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, throwing>)
    throwing(F&& f) // NOLINT
    {
        using Fn = std::decay_t<F>;

        static_assert(oc::is_invocable_r<R, Fn&, Args...>, "F must be callable with Args... and return R");
        static_assert(std::is_constructible_v<Fn, F>, "cannot copy/move the callable into oc::throwing");
        if constexpr (declares_failure<Fn>)
            static_assert(failure_covers<X, typename Fn::failure_type>,
                          "the callable declares a failure type that is not covered by X");

        _payload = oc::any_allocation::create_from<Fn>(*oc::default_memory_resource, oc::forward<F>(f));
        _thunk = &invoke_payload<Fn>;
    }

    /// Constructs an F in place in memory from resource
    template <class F, class... FArgs>
    [[nodiscard]] static throwing create_from(oc::memory_resource const& resource, FArgs&&... args)
    {
        static_assert(oc::is_invocable_r<R, F&, Args...>, "F must be callable with Args... and return R");
        if constexpr (declares_failure<F>)
            static_assert(failure_covers<X, typename F::failure_type>,
                          "the callable declares a failure type that is not covered by X");

        throwing t;
        t._payload = oc::any_allocation::create_from<F>(resource, oc::forward<FArgs>(args)...);
        t._thunk = &invoke_payload<F>;
        return t;
    }

    throwing(throwing&&) = default;
    throwing& operator=(throwing&&) = default;
    throwing(throwing const&) = delete;
    throwing& operator=(throwing const&) = delete;

    ~throwing() = default;

    // composition
public:
    /// functions: after(f(args...)), consumers and runnables: f(args...) then after(args...)
    template <class F>
    [[nodiscard]] auto and_then(F after) &&
    {
        using W = widened_failure_t<X, declared_failure_or<F, X>>;
        if constexpr (std::is_void_v<R>)
        {
            return throwing<void(Args...), W>(
                [first = oc::move(*this), after = oc::move(after)](Args... args) mutable
                {
                    first(args...);
                    oc::invoke(after, args...);
                });
        }
        else
        {
            using V = std::decay_t<oc::invoke_result<F&, R>>;
            return throwing<V(Args...), W>([first = oc::move(*this), after = oc::move(after)](Args... args) mutable -> V
                                           { return oc::invoke(after, first(oc::forward<Args>(args)...)); });
        }
    }

    /// functions: f(before(v))
    template <class V, class Y>
        requires(sizeof...(Args) == 1)
    [[nodiscard]] auto compose(throwing<impl::first_arg_t<Args...>(V), Y> before) &&
    {
        return throwing<R(V), widened_failure_t<X, Y>>([second = oc::move(*this), before = oc::move(before)](V v) mutable -> R
                                                        { return second(before(oc::forward<V>(v))); });
    }

    /// functions: f(before(v)) for plain callables, V names the parameter of before
    template <class V, class F>
        requires(sizeof...(Args) == 1 && !is_throwing<F>)
    [[nodiscard]] auto compose(F before) &&
    {
        using W = widened_failure_t<X, declared_failure_or<F, X>>;
        return throwing<R(V), W>([second = oc::move(*this), before = oc::move(before)](V v) mutable -> R
                                 { return second(oc::invoke(before, oc::forward<V>(v))); });
    }

    /// predicates: short-circuiting conjunction
    template <class F>
        requires std::is_same_v<R, bool>
    [[nodiscard]] auto and_(F other) &&
    {
        using W = widened_failure_t<X, declared_failure_or<F, X>>;
        return throwing<bool(Args...), W>([first = oc::move(*this), other = oc::move(other)](Args... args) mutable -> bool
                                          { return first(args...) && bool(oc::invoke(other, args...)); });
    }

    /// predicates: short-circuiting disjunction
    template <class F>
        requires std::is_same_v<R, bool>
    [[nodiscard]] auto or_(F other) &&
    {
        using W = widened_failure_t<X, declared_failure_or<F, X>>;
        return throwing<bool(Args...), W>([first = oc::move(*this), other = oc::move(other)](Args... args) mutable -> bool
                                          { return first(args...) || bool(oc::invoke(other, args...)); });
    }

    [[nodiscard]] throwing negate() &&
        requires std::is_same_v<R, bool>
    {
        return throwing([p = oc::move(*this)](Args... args) mutable -> bool { return !p(oc::forward<Args>(args)...); });
    }

    /// comparators: compares (b, a) instead of (a, b)
    [[nodiscard]] throwing reversed() &&
        requires(std::is_same_v<R, int> && sizeof...(Args) == 2)
    {
        return throwing([c = oc::move(*this)](Args... args) mutable -> int { return reversed_compare(c, args...); });
    }

    /// comparators: other decides when this compares equal
    template <class F>
        requires(std::is_same_v<R, int> && sizeof...(Args) == 2)
    [[nodiscard]] auto then_comparing(F other) &&
    {
        using W = widened_failure_t<X, declared_failure_or<F, X>>;
        return throwing<int(Args...), W>(
            [first = oc::move(*this), other = oc::move(other)](Args... args) mutable -> int
            {
                auto const r = first(args...);
                return r != 0 ? r : int(oc::invoke(other, args...));
            });
    }

    // factories
public:
    /// unary operators: returns its argument
    [[nodiscard]] static throwing identity()
        requires(sizeof...(Args) == 1 && std::is_same_v<R, impl::first_arg_t<Args...>>)
    {
        return throwing([](Args... args) mutable -> R { return R(oc::forward<Args>(args)...); });
    }

    /// binary operators: the lesser of both arguments according to comparator, the first one on ties
    template <class F>
        requires(sizeof...(Args) == 2)
    [[nodiscard]] static throwing min_by(F comparator)
    {
        static_assert(failure_covers<X, declared_failure_or<F, X>>, "comparator may throw failures not covered by X");
        return throwing([c = oc::move(comparator)](Args... args) mutable -> R { return select_by(c, true, args...); });
    }

    /// binary operators: the greater of both arguments according to comparator, the first one on ties
    template <class F>
        requires(sizeof...(Args) == 2)
    [[nodiscard]] static throwing max_by(F comparator)
    {
        static_assert(failure_covers<X, declared_failure_or<F, X>>, "comparator may throw failures not covered by X");
        return throwing([c = oc::move(comparator)](Args... args) mutable -> R { return select_by(c, false, args...); });
    }

private:
    template <class C, class A, class B>
    static int reversed_compare(C& c, A&& a, B&& b)
    {
        return int(oc::invoke(c, oc::forward<B>(b), oc::forward<A>(a)));
    }

    template <class C, class A, class B>
    static R select_by(C& c, bool pick_min, A&& a, B&& b)
    {
        auto const r = int(oc::invoke(c, a, b));
        if (pick_min)
            return r <= 0 ? R(oc::forward<A>(a)) : R(oc::forward<B>(b));
        return r >= 0 ? R(oc::forward<A>(a)) : R(oc::forward<B>(b));
    }

    template <class Fn>
    static R invoke_payload(void* p, Args... args)
    {
        return oc::invoke(*static_cast<Fn*>(p), oc::forward<Args>(args)...);
    }

    // member
private:
    oc::any_allocation _payload;
    oc::function_ptr<R(void*, Args...)> _thunk = nullptr;
};
