#pragma once

#include <outcome-core/basic_try.hh>
#include <outcome-core/ceiling.hh>
#include <outcome-core/errors.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/optional.hh>
#include <outcome-core/try_optional.hh>
#include <outcome-core/utility.hh>

#include <exception>
#include <string>
#include <type_traits>
#include <variant>

/// Success without a value, or failure with a cause of type X
/// Used to sequence side-effecting steps before producing a value
///
/// Use the aliases from fwd.hh:
///   oc::try_void<X>            checked discipline, X defaults to std::exception
///   oc::try_catch_all_void     catch-all discipline, causes are std::exception_ptr
///
/// Unlike basic_try, or_ takes a single runnable and does not merge causes:
/// when the runnable fails too, the result carries the new cause only.
template <class X, class Ceiling>
struct oc::basic_try_void
{
    static_assert(Ceiling::template accepts_cause_type<X>, "X is not a valid cause type for this catching discipline");

    using cause_type = X;
    using ceiling_type = Ceiling;

private:
    using cause_holder = typename Ceiling::template cause_holder<X>;
    using cause_view = typename cause_holder::view_type;

    // factories
public:
    [[nodiscard]] static basic_try_void success() { return basic_try_void(); }

    /// E must derive from X under the checked discipline; any object is accepted under catch-all
    template <class E>
        requires(!std::is_same_v<std::decay_t<E>, std::exception_ptr>
                 && (std::is_same_v<X, std::exception_ptr> || std::is_base_of_v<X, std::decay_t<E>>))
    [[nodiscard]] static basic_try_void failure(E&& cause)
    {
        return basic_try_void(cause_holder::of(std::make_exception_ptr(oc::forward<E>(cause))));
    }

    /// Precondition: cause is non-null and, under the checked discipline, holds an X
    [[nodiscard]] static basic_try_void failure(std::exception_ptr cause)
    {
        return basic_try_void(cause_holder::of(oc::move(cause)));
    }

    /// Success if runnable completes normally, failure with the captured cause otherwise
    template <class F>
    [[nodiscard]] static basic_try_void run(F&& runnable)
    {
        static_assert(Ceiling::template accepts_callback<X, std::remove_cvref_t<F>>,
                      "the runnable declares a failure type outside the catching ceiling of this outcome");

        return Ceiling::template attempt<X>(
            [&]() -> basic_try_void
            {
                oc::invoke(runnable);
                return basic_try_void();
            },
            &basic_try_void::captured);
    }

    // queries
public:
    [[nodiscard]] bool is_success() const { return !_cause.has_value(); }
    [[nodiscard]] bool is_failure() const { return _cause.has_value(); }

    // eliminators
public:
    /// Returns supplier() on success, cause_transformation(cause) on failure
    template <class F, class G>
    [[nodiscard]] auto map(F&& supplier, G&& cause_transformation) const
        -> std::common_type_t<oc::invoke_result<F&>, oc::invoke_result<G&, cause_view>>
    {
        using result_t = std::common_type_t<oc::invoke_result<F&>, oc::invoke_result<G&, cause_view>>;
        if (!_cause.has_value())
            return oc::invoke(supplier);
        return _cause.value().with_view([&](cause_view cause) -> result_t { return oc::invoke(cause_transformation, cause); });
    }

    /// consumer is only invoked on failure
    template <class C>
    void if_failed(C&& consumer) const
    {
        if (_cause.has_value())
            _cause.value().with_view([&](cause_view cause) { oc::invoke(consumer, cause); });
    }

    /// Rethrows the original exception object on failure
    void or_throw() const
    {
        if (_cause.has_value())
            _cause.value().rethrow();
    }

    /// cause_transformation returns the exception object to throw, or an exception_ptr to rethrow
    /// Returning a reference to its argument rethrows the original exception object
    template <class G>
    void or_throw(G&& cause_transformation) const
    {
        if (_cause.has_value())
            impl::throw_transformed(_cause.value(), cause_transformation);
    }

    // fail-fast combinators
public:
    /// get(supplier) on success, a failure with the same cause otherwise
    template <class F>
    [[nodiscard]] auto and_get(F&& supplier) const -> basic_try<std::decay_t<oc::invoke_result<F&>>, X, Ceiling>
    {
        static_assert(Ceiling::template accepts_callback<X, std::remove_cvref_t<F>>,
                      "the supplier declares a failure type outside the catching ceiling of this outcome");

        using result_t = basic_try<std::decay_t<oc::invoke_result<F&>>, X, Ceiling>;
        if (_cause.has_value())
            return result_t(impl::failure_tag{}, _cause.value());
        return result_t::get(supplier);
    }

    /// run(runnable) on success, this failure otherwise
    template <class F>
    [[nodiscard]] basic_try_void and_run(F&& runnable) const
    {
        if (_cause.has_value())
            return *this;
        return run(runnable);
    }

    // recovery combinator
public:
    /// This outcome if it succeeded, run(runnable) otherwise
    template <class F>
    [[nodiscard]] basic_try_void or_(F&& runnable) const
    {
        if (!_cause.has_value())
            return *this;
        return run(runnable);
    }

    // projection
public:
    /// result() is always empty, cause() holds the cause on failure
    [[nodiscard]] basic_try_optional<std::monostate, X, Ceiling> to_optional() const
    {
        return {oc::nullopt, _cause};
    }

    // comparison
public:
    /// Equal iff both succeeded or both failed with equal causes
    [[nodiscard]] friend bool operator==(basic_try_void const& lhs, basic_try_void const& rhs)
    {
        return lhs._cause == rhs._cause;
    }

    /// Debug representation, e.g. try_void{success} or try_void{cause=std::runtime_error: boom}
    /// Not meant for program logic
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::string(Ceiling::void_name);
        if (_cause.has_value())
        {
            s += "{cause=";
            s += oc::describe_exception(_cause.value().ptr());
            s += '}';
        }
        else
            s += "{success}";
        return s;
    }

private:
    basic_try_void() = default;
    explicit basic_try_void(cause_holder cause) : _cause(oc::move(cause)) {}

    [[nodiscard]] static basic_try_void captured(std::exception_ptr cause)
    {
        return basic_try_void(cause_holder::of(oc::move(cause)));
    }

    // members
private:
    /// empty on success
    oc::optional<cause_holder> _cause;
};
