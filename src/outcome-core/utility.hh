#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/fwd.hh>

#include <functional>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Invocation:
//   invoke(f, args...)          - uniform call syntax (functions, lambdas, member pointers)
//   is_invocable_r<R, F, A...>  - true if invoke(f, a...) is valid and converts to R
//   invoke_result<F, A...>      - type of invoke(f, a...)
//
// Callable utilities:
//   identity_function           - callable that returns its argument
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//   is_null_comparable<T>       - true if a T can be compared against nullptr
//   is_null(v)                  - true if v compares equal to nullptr (false for other types)
//

namespace oc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Invocation
// =========================================================================================================

/// Invokes f with the given arguments
/// Accepts everything std::invoke accepts: function pointers, lambdas, functors and member pointers
/// Usage:
///   oc::invoke(supplier);
///   oc::invoke(&S::method, obj, 42);
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    return std::invoke(oc::forward<F>(f), oc::forward<Args>(args)...);
}

/// True iff F can be invoked with Args... and the result converts to R
/// R = void accepts any result
template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

/// Result type of oc::invoke(F, Args...)
template <class F, class... Args>
using invoke_result = std::invoke_result_t<F, Args...>;

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that returns its argument with perfect forwarding
/// Usage:
///   auto const v = t.map(oc::identity_function{}, [](auto const&) { return 0; });
struct identity_function
{
    template <class T>
    constexpr T&& operator()(T&& arg) const noexcept
    {
        return forward<T>(arg);
    }
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   oc::function_ptr<verify_error(uri_syntax_error const&)>  -> verify_error (*)(uri_syntax_error const&)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

/// True for raw pointers, smart pointers, std::function, std::exception_ptr, ...
/// These are the types for which "succeeding with null" is possible
template <class T>
constexpr bool is_null_comparable = requires(T const& v) { bool(v == nullptr); };

/// Returns true iff v is null
/// Always false for types that have no null state
template <class T>
[[nodiscard]] constexpr bool is_null(T const& v)
{
    if constexpr (is_null_comparable<T>)
        return bool(v == nullptr);
    else
        return false;
}

} // namespace oc
