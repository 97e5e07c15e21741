#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/errors.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/utility.hh>

#include <exception>
#include <system_error>
#include <type_traits>

/// Adapts code that may throw EF into contexts that only tolerate unchecked failures
/// An EF thrown by the callback is replaced by wrapper(e), which nests the original EF (see std::nested_exception)
/// Unchecked failures thrown by the callback are rethrown unchanged, even when they also match EF
///
/// Precondition: the callback throws nothing but EF and unchecked failures
/// Other failures propagate unchanged
///
/// Usage:
///   constexpr auto to_illegal_state = oc::unchecker<std::system_error, oc::illegal_state_error>::wrapping_with(
///       [](std::system_error const& e) { return oc::illegal_state_error(e.what()); });
///
///   to_illegal_state.call([&] { connect(address); });
///   auto const size = oc::io_unchecker.get_using([&] { return file_size(path); });
template <class EF, class ET>
struct oc::unchecker
{
    static_assert(std::is_base_of_v<std::exception, EF>, "EF must derive from std::exception");
    static_assert(is_unchecked_failure<ET>, "ET must be an unchecked failure type");

    using wrapper_t = oc::function_ptr<ET(EF const&)>;

    // factories
public:
    [[nodiscard]] static constexpr unchecker wrapping_with(wrapper_t wrapper)
    {
        OC_ASSERT(wrapper != nullptr, "the wrapper must not be null");
        return unchecker(wrapper);
    }

    /// verify_error with the message of the original failure
    [[nodiscard]] static constexpr unchecker converting_to_verify_error()
        requires std::is_same_v<ET, oc::verify_error>
    {
        return unchecker([](EF const& e) { return oc::verify_error(e.what()); });
    }

    // immediate execution
public:
    template <class F>
    void call(F&& runnable) const
    {
        try
        {
            oc::invoke(runnable);
        }
        catch (EF const& e)
        {
            rethrow_wrapped(e);
        }
    }

    template <class F>
    [[nodiscard]] oc::invoke_result<F&> get_using(F&& supplier) const
    {
        try
        {
            return oc::invoke(supplier);
        }
        catch (EF const& e)
        {
            rethrow_wrapped(e);
        }
    }

    // lazy wrapping
    // each returned callable owns a copy of this unchecker and of the callback
    // and applies the wrapping once per invocation
public:
    template <class F>
    [[nodiscard]] auto wrap_runnable(F runnable) const
    {
        return [self = *this, runnable = oc::move(runnable)]() mutable { self.call(runnable); };
    }

    template <class F>
    [[nodiscard]] auto wrap_supplier(F supplier) const
    {
        return [self = *this, supplier = oc::move(supplier)]() mutable -> decltype(auto)
        { return self.get_using(supplier); };
    }

    template <class F>
    [[nodiscard]] auto wrap_function(F function) const
    {
        return wrap_invocable(oc::move(function));
    }

    template <class F>
    [[nodiscard]] auto wrap_predicate(F predicate) const
    {
        return wrap_invocable(oc::move(predicate));
    }

    template <class F>
    [[nodiscard]] auto wrap_consumer(F consumer) const
    {
        return wrap_invocable(oc::move(consumer));
    }

    template <class F>
    [[nodiscard]] auto wrap_bi_consumer(F consumer) const
    {
        return wrap_invocable(oc::move(consumer));
    }

    template <class F>
    [[nodiscard]] auto wrap_bi_function(F function) const
    {
        return wrap_invocable(oc::move(function));
    }

    template <class F>
    [[nodiscard]] auto wrap_comparator(F comparator) const
    {
        return wrap_invocable(oc::move(comparator));
    }

    template <class F>
    [[nodiscard]] auto wrap_binary_operator(F op) const
    {
        return wrap_invocable(oc::move(op));
    }

private:
    constexpr explicit unchecker(wrapper_t wrapper) : _wrapper(wrapper) {}

    template <class F>
    auto wrap_invocable(F f) const
    {
        return [self = *this, f = oc::move(f)](auto&&... args) mutable -> decltype(auto)
        { return self.get_using([&]() -> decltype(auto) { return oc::invoke(f, oc::forward<decltype(args)>(args)...); }); };
    }

    /// Must be called from within the handler that caught e
    [[noreturn]] void rethrow_wrapped(EF const& e) const
    {
        if (oc::is_unchecked(std::current_exception()))
            throw;
        std::throw_with_nested(_wrapper(e));
    }

    // members
private:
    wrapper_t _wrapper = nullptr;
};

namespace oc
{
namespace impl
{
unchecked_io_error wrap_io_error(std::system_error const& e);
verify_error wrap_uri_syntax_error(uri_syntax_error const& e);
} // namespace impl

/// std::system_error (I/O and other OS failures) -> unchecked_io_error, keeping the error code
inline constexpr auto io_unchecker = unchecker<std::system_error, unchecked_io_error>::wrapping_with(&impl::wrap_io_error);

/// uri_syntax_error -> verify_error, for URIs that are known to be well-formed
inline constexpr auto uri_unchecker = unchecker<uri_syntax_error, verify_error>::wrapping_with(&impl::wrap_uri_syntax_error);
} // namespace oc
