#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/errors.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/throwing.hh>
#include <outcome-core/utility.hh>

#include <exception>
#include <type_traits>

// =========================================================================================================
// Catching disciplines
// =========================================================================================================
//
// The ceiling of an outcome decides which thrown objects become failures and which escape.
//
//   catch_checked   captures a thrown object iff it can be caught as the cause type X and is not unchecked
//                   everything else (programming errors, non-std throws) escapes unchanged
//   catch_all       captures every thrown object, the cause type is std::exception_ptr
//
// Each discipline provides:
//   attempt<X>(computation, on_captured)   - runs computation, routes a captured failure to on_captured
//   accepts_cause_type<X>                  - X is a valid cause type under this discipline
//   within_ceiling<Y>                      - a callback declaring Y may be attempted at all
//   accepts_callback<X, F>                 - F may be used where failures of type X are captured
//   cause_holder<X>                        - storage of a captured cause
//
// Causes are always held as std::exception_ptr, so the dynamic type of the thrown object is preserved
// and rethrowing throws the original object.
//

namespace oc::impl
{
struct success_tag
{
};
struct failure_tag
{
};

template <class T>
constexpr bool is_basic_try = false;
template <class T, class X, class Ceiling>
constexpr bool is_basic_try<oc::basic_try<T, X, Ceiling>> = true;

/// Cause of a checked outcome
/// The X view is only lent out during with_view: rethrowing may hand out a copy of the held object,
/// so no reference into the exception outlives the handler that produced it
template <class X>
struct checked_cause
{
    using view_type = X const&;

    /// Precondition: p is non-null and holds an X
    [[nodiscard]] static checked_cause of(std::exception_ptr p)
    {
        OC_ASSERT(p != nullptr, "a failure requires a non-null cause");
        OC_ASSERT(oc::holds_exception<X>(p), "the cause does not hold an exception of the declared cause type");
        return checked_cause(oc::move(p));
    }

    /// Upcast from a cause of a derived type
    template <class Y>
        requires(std::is_base_of_v<X, Y> && !std::is_same_v<X, Y>)
    checked_cause(checked_cause<Y> const& rhs) // NOLINT
      : _ptr(rhs.ptr())
    {
    }

    /// Returns f(cause as X)
    template <class F>
    decltype(auto) with_view(F&& f) const
    {
        try
        {
            std::rethrow_exception(_ptr);
        }
        catch (X const& e)
        {
            return oc::invoke(f, e);
        }
    }

    [[nodiscard]] std::exception_ptr const& ptr() const { return _ptr; }

    [[noreturn]] void rethrow() const { std::rethrow_exception(_ptr); }

    /// Same exception object, or equal as X if X supports it
    [[nodiscard]] friend bool operator==(checked_cause const& lhs, checked_cause const& rhs)
    {
        if (lhs._ptr == rhs._ptr)
            return true;
        if constexpr (requires(X const& x) { bool(x == x); })
            return lhs.with_view([&](X const& a) { return rhs.with_view([&](X const& b) { return bool(a == b); }); });
        else
            return false;
    }

private:
    explicit checked_cause(std::exception_ptr p) : _ptr(oc::move(p)) {}

    std::exception_ptr _ptr;
};

/// Cause of a catch-all outcome, which is the exception_ptr itself
struct any_cause
{
    using view_type = std::exception_ptr const&;

    /// Precondition: p is non-null
    [[nodiscard]] static any_cause of(std::exception_ptr p)
    {
        OC_ASSERT(p != nullptr, "a failure requires a non-null cause");
        return any_cause(oc::move(p));
    }

    template <class F>
    decltype(auto) with_view(F&& f) const
    {
        return oc::invoke(f, _ptr);
    }

    [[nodiscard]] std::exception_ptr const& ptr() const { return _ptr; }

    [[noreturn]] void rethrow() const { std::rethrow_exception(_ptr); }

    [[nodiscard]] friend bool operator==(any_cause const& lhs, any_cause const& rhs) { return lhs._ptr == rhs._ptr; }

private:
    explicit any_cause(std::exception_ptr p) : _ptr(oc::move(p)) {}

    std::exception_ptr _ptr;
};

/// True iff a and b are the same (most derived) object
template <class A, class B>
[[nodiscard]] bool same_object(A const& a, B const& b)
{
    if constexpr (std::is_polymorphic_v<A> && std::is_polymorphic_v<B>)
        return dynamic_cast<void const*>(&a) == dynamic_cast<void const*>(&b);
    else
        return static_cast<void const*>(&a) == static_cast<void const*>(&b);
}

/// Returns v, throws null_dereference_error if v is null
template <class V>
V&& non_null(V&& v, char const* what)
{
    if (oc::is_null(v))
        throw oc::null_dereference_error(what);
    return oc::forward<V>(v);
}

/// Throws cause_transformation(cause)
/// An exception_ptr is rethrown. A reference to the cause itself rethrows the original exception object,
/// any other object is thrown as is.
template <class Holder, class G>
[[noreturn]] void throw_transformed(Holder const& cause, G& cause_transformation)
{
    using view_t = typename Holder::view_type;

    cause.with_view(
        [&](view_t view)
        {
            decltype(auto) e = oc::invoke(cause_transformation, view);
            using E = decltype(e);

            if constexpr (std::is_same_v<std::remove_cvref_t<E>, std::exception_ptr>)
            {
                if (e == nullptr)
                    throw oc::null_dereference_error("cause transformation returned a null exception_ptr");
                std::rethrow_exception(e);
            }
            else
            {
                if constexpr (std::is_lvalue_reference_v<E> && !std::is_same_v<std::remove_cvref_t<view_t>, std::exception_ptr>)
                {
                    if (impl::same_object(e, view))
                        cause.rethrow();
                }
                throw oc::forward<E>(e);
            }
        });

    // not reached, the lambda above always throws
    cause.rethrow();
}
} // namespace oc::impl

/// Checked discipline: only checked-style failures of the cause type are captured
struct oc::catch_checked
{
    template <class X>
    using cause_holder = impl::checked_cause<X>;

    template <class X>
    static constexpr bool accepts_cause_type = is_checked_failure<X>;

    template <class Y>
    static constexpr bool within_ceiling = is_checked_failure<Y>;

    /// Plain callables are always accepted, their failures are classified when thrown
    template <class X, class F>
    static constexpr bool accepts_callback = within_ceiling<declared_failure_or<F, X>>
                                             && std::is_base_of_v<X, declared_failure_or<F, X>>;

    /// Cause type captured while attempting an alternative that declares failures of type Y
    template <class Y>
    using alternative_cause = Y;

    static constexpr char const* value_name = "try_result";
    static constexpr char const* void_name = "try_void";
    static constexpr char const* optional_name = "try_optional";

    template <class X, class F, class OnCaptured>
    static oc::invoke_result<F&> attempt(F&& computation, OnCaptured&& on_captured)
    {
        std::exception_ptr captured;
        try
        {
            return oc::invoke(computation);
        }
        catch (X const&)
        {
            if (oc::is_unchecked(std::current_exception()))
                throw;
            captured = std::current_exception();
        }
        return oc::invoke(on_captured, oc::move(captured));
    }
};

/// Catch-all discipline: every thrown object is captured
struct oc::catch_all
{
    template <class X>
    using cause_holder = impl::any_cause;

    template <class X>
    static constexpr bool accepts_cause_type = std::is_same_v<X, std::exception_ptr>;

    template <class Y>
    static constexpr bool within_ceiling = true;

    template <class X, class F>
    static constexpr bool accepts_callback = true;

    template <class Y>
    using alternative_cause = std::exception_ptr;

    static constexpr char const* value_name = "try_catch_all";
    static constexpr char const* void_name = "try_catch_all_void";
    static constexpr char const* optional_name = "try_catch_all_optional";

    template <class X, class F, class OnCaptured>
    static oc::invoke_result<F&> attempt(F&& computation, OnCaptured&& on_captured)
    {
        std::exception_ptr captured;
        try
        {
            return oc::invoke(computation);
        }
        catch (...)
        {
            captured = std::current_exception();
        }
        return oc::invoke(on_captured, oc::move(captured));
    }
};
