#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/ceiling.hh>
#include <outcome-core/errors.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/optional.hh>
#include <outcome-core/to_debug_string.hh>
#include <outcome-core/try_optional.hh>
#include <outcome-core/utility.hh>

#include <exception>
#include <memory>
#include <string>
#include <type_traits>

// =========================================================================================================
// basic_try<T, X, Ceiling> - success with a T or failure with a cause of type X
// =========================================================================================================
//
// Use the aliases from fwd.hh:
//   oc::try_result<T, X>   checked discipline, X defaults to std::exception
//   oc::try_catch_all<T>   catch-all discipline, causes are std::exception_ptr
//
// Factories:
//   success(v)                          - v must not be null (throws null_dereference_error, never captured)
//   failure(e) / failure(exception_ptr) - e keeps its dynamic type
//   get(supplier)                       - evaluates supplier once, captures failures within the ceiling
//
// Eliminators:
//   map(f, g)                           - f(value) or g(cause), exactly one is invoked
//   or_map_cause(g)                     - value or g(cause)
//   or_consume_cause(c)                 - value, or nullopt after c(cause)
//   or_throw() / or_throw(g)            - value, or throws the cause (optionally transformed)
//
// Fail-fast combinators (a failure is carried through untouched):
//   and_run(r), and_consume(c), and_apply(f), and_(other, merger)
//   and_apply(f) with f returning an outcome flattens it: the result is that outcome, not an outcome of it
//
// Recovery combinator (the alternative is only attempted on failure):
//   or_(alternative, exceptions_merger)
//
// Failures thrown by the primary computation (supplier, runnable, mapper, alternative) are captured
// according to the ceiling. Failures thrown by mergers and cause transformations always propagate.
//
// Outcomes are never mutated by combinators, each combinator returns a new outcome.
//

template <class T, class X, class Ceiling>
struct oc::basic_try
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "T must be a non-reference, non-void object type");
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>, "T must not be cv-qualified");
    static_assert(Ceiling::template accepts_cause_type<X>, "X is not a valid cause type for this catching discipline");

    using value_type = T;
    using cause_type = X;
    using ceiling_type = Ceiling;

private:
    using cause_holder = typename Ceiling::template cause_holder<X>;

    // const& to X, or to std::exception_ptr in the catch-all discipline
    using cause_view = typename cause_holder::view_type;

    // factories
public:
    /// Throws null_dereference_error if value is null
    [[nodiscard]] static basic_try success(T value)
    {
        impl::non_null(value, "an outcome cannot succeed with a null value");
        return basic_try(impl::success_tag{}, oc::move(value));
    }

    /// E must derive from X under the checked discipline; any object is accepted under catch-all
    template <class E>
        requires(!std::is_same_v<std::decay_t<E>, std::exception_ptr>
                 && (std::is_same_v<X, std::exception_ptr> || std::is_base_of_v<X, std::decay_t<E>>))
    [[nodiscard]] static basic_try failure(E&& cause)
    {
        return basic_try(impl::failure_tag{}, cause_holder::of(std::make_exception_ptr(oc::forward<E>(cause))));
    }

    /// Precondition: cause is non-null and, under the checked discipline, holds an X
    [[nodiscard]] static basic_try failure(std::exception_ptr cause)
    {
        return basic_try(impl::failure_tag{}, cause_holder::of(oc::move(cause)));
    }

    /// Success with the supplied value, or failure with the captured cause
    /// A null result is treated as a thrown null_dereference_error
    template <class F>
    [[nodiscard]] static basic_try get(F&& supplier)
    {
        static_assert(Ceiling::template accepts_callback<X, std::remove_cvref_t<F>>,
                      "the supplier declares a failure type outside the catching ceiling of this outcome");
        static_assert(std::is_convertible_v<oc::invoke_result<F&>, T>, "the supplier must return a T");

        return Ceiling::template attempt<X>([&]() -> basic_try { return success(oc::invoke(supplier)); },
                                            &basic_try::captured);
    }

    // queries
public:
    [[nodiscard]] bool is_success() const { return _is_success; }
    [[nodiscard]] bool is_failure() const { return !_is_success; }

    // eliminators
public:
    /// Returns transformation(value) on success, cause_transformation(cause) on failure
    template <class F, class G>
    [[nodiscard]] auto map(F&& transformation, G&& cause_transformation) const
        -> std::common_type_t<oc::invoke_result<F&, T const&>, oc::invoke_result<G&, cause_view>>
    {
        using result_t = std::common_type_t<oc::invoke_result<F&, T const&>, oc::invoke_result<G&, cause_view>>;
        if (_is_success)
            return oc::invoke(transformation, _storage.value);
        return _storage.cause.with_view([&](cause_view cause) -> result_t { return oc::invoke(cause_transformation, cause); });
    }

    template <class G>
    [[nodiscard]] T or_map_cause(G&& cause_transformation) const&
    {
        if (_is_success)
            return _storage.value;
        return _storage.cause.with_view([&](cause_view cause) -> T { return oc::invoke(cause_transformation, cause); });
    }
    template <class G>
    [[nodiscard]] T or_map_cause(G&& cause_transformation) &&
    {
        if (_is_success)
            return oc::move(_storage.value);
        return _storage.cause.with_view([&](cause_view cause) -> T { return oc::invoke(cause_transformation, cause); });
    }

    /// consumer is only invoked on failure
    template <class C>
    oc::optional<T> or_consume_cause(C&& consumer) const&
    {
        if (_is_success)
            return oc::optional<T>(_storage.value);
        _storage.cause.with_view([&](cause_view cause) { oc::invoke(consumer, cause); });
        return oc::nullopt;
    }
    template <class C>
    oc::optional<T> or_consume_cause(C&& consumer) &&
    {
        if (_is_success)
            return oc::optional<T>(oc::move(_storage.value));
        _storage.cause.with_view([&](cause_view cause) { oc::invoke(consumer, cause); });
        return oc::nullopt;
    }

    /// Rethrows the original exception object on failure
    [[nodiscard]] T or_throw() const&
    {
        if (!_is_success)
            _storage.cause.rethrow();
        return _storage.value;
    }
    [[nodiscard]] T or_throw() &&
    {
        if (!_is_success)
            _storage.cause.rethrow();
        return oc::move(_storage.value);
    }

    /// cause_transformation returns the exception object to throw, or an exception_ptr to rethrow
    /// Returning a reference to its argument rethrows the original exception object
    template <class G>
    [[nodiscard]] T or_throw(G&& cause_transformation) const&
    {
        if (!_is_success)
            impl::throw_transformed(_storage.cause, cause_transformation);
        return _storage.value;
    }
    template <class G>
    [[nodiscard]] T or_throw(G&& cause_transformation) &&
    {
        if (!_is_success)
            impl::throw_transformed(_storage.cause, cause_transformation);
        return oc::move(_storage.value);
    }

    // fail-fast combinators
public:
    /// Runs runnable on success, keeping the value unless it throws a captured failure
    template <class F>
    [[nodiscard]] basic_try and_run(F&& runnable) const&
    {
        static_assert(Ceiling::template accepts_callback<X, std::remove_cvref_t<F>>,
                      "the runnable declares a failure type outside the catching ceiling of this outcome");

        if (!_is_success)
            return *this;

        return Ceiling::template attempt<X>(
            [&]() -> basic_try
            {
                oc::invoke(runnable);
                return *this;
            },
            &basic_try::captured);
    }

    template <class C>
    [[nodiscard]] basic_try and_consume(C&& consumer) const&
    {
        static_assert(Ceiling::template accepts_callback<X, std::remove_cvref_t<C>>,
                      "the consumer declares a failure type outside the catching ceiling of this outcome");

        return and_run([&] { oc::invoke(consumer, _storage.value); });
    }

    /// get(mapper(value)) on success, the same failure retyped otherwise
    /// A mapper returning basic_try<U, Y, Ceiling> (Y derived from X) is flattened into basic_try<U, X, Ceiling>
    template <class F>
    [[nodiscard]] auto and_apply(F&& mapper) const&
    {
        static_assert(Ceiling::template accepts_callback<X, std::remove_cvref_t<F>>,
                      "the mapper declares a failure type outside the catching ceiling of this outcome");

        using mapped_t = std::decay_t<oc::invoke_result<F&, T const&>>;
        if constexpr (impl::is_basic_try<mapped_t>)
        {
            static_assert(std::is_same_v<typename mapped_t::ceiling_type, Ceiling>,
                          "the mapper must return an outcome of the same catching discipline");
            static_assert(std::is_same_v<typename mapped_t::cause_type, X>
                              || std::is_base_of_v<X, typename mapped_t::cause_type>,
                          "the cause type of the outcome returned by the mapper must derive from X");

            using result_t = basic_try<typename mapped_t::value_type, X, Ceiling>;
            if (!_is_success)
                return result_t(impl::failure_tag{}, _storage.cause);
            return Ceiling::template attempt<X>([&]() -> result_t { return result_t::flattened(oc::invoke(mapper, _storage.value)); },
                                                &result_t::captured);
        }
        else
        {
            using result_t = basic_try<mapped_t, X, Ceiling>;
            if (!_is_success)
                return result_t(impl::failure_tag{}, _storage.cause);
            return result_t::get([&]() -> decltype(auto) { return oc::invoke(mapper, _storage.value); });
        }
    }

    /// success(merger(value, other value)) if both succeeded
    /// Otherwise the failure of this outcome if it failed, else the failure of other
    /// merger is not captured: whatever it throws propagates
    template <class U, class Y, class M>
    [[nodiscard]] auto and_(basic_try<U, Y, Ceiling> const& other, M&& merger) const
        -> basic_try<std::decay_t<oc::invoke_result<M&, T const&, U const&>>, X, Ceiling>
    {
        static_assert(std::is_same_v<X, Y> || std::is_base_of_v<X, Y>, "the cause type of other must derive from X");

        using result_t = basic_try<std::decay_t<oc::invoke_result<M&, T const&, U const&>>, X, Ceiling>;
        if (!_is_success)
            return result_t(impl::failure_tag{}, _storage.cause);
        if (!other._is_success)
            return result_t(impl::failure_tag{}, cause_holder(other._storage.cause));
        return result_t::success(oc::invoke(merger, _storage.value, other._storage.value));
    }

    // recovery combinator
public:
    /// This outcome if it succeeded
    /// Otherwise attempts alternative: success with its value, or failure with exceptions_merger(cause, new cause)
    /// Y is the failure type captured from alternative, defaulting to its declared failure type or X
    /// A merger returning a reference to one of its arguments keeps that exception object
    /// exceptions_merger is not captured: whatever it throws propagates
    template <class Y = void, class F, class M>
    [[nodiscard]] auto or_(F&& alternative, M&& exceptions_merger) const
    {
        using declared_t = std::conditional_t<std::is_void_v<Y>, declared_failure_or<F, X>, Y>;
        using alternative_cause_t = typename Ceiling::template alternative_cause<declared_t>;
        using alternative_holder = typename Ceiling::template cause_holder<alternative_cause_t>;
        using alternative_view = typename alternative_holder::view_type;
        using merged_t = std::decay_t<oc::invoke_result<M&, cause_view, alternative_view>>;
        using result_t = basic_try<T, merged_t, Ceiling>;

        static_assert(Ceiling::template within_ceiling<declared_t>,
                      "the alternative declares a failure type outside the catching ceiling of this outcome");
        static_assert(!declares_failure<F> || failure_covers<declared_t, declared_failure_or<F, X>>,
                      "the alternative declares a failure type that is not covered by Y");
        static_assert(std::is_convertible_v<oc::invoke_result<F&>, T>, "the alternative must return a T");

        if (_is_success)
            return result_t(impl::success_tag{}, _storage.value);

        return Ceiling::template attempt<alternative_cause_t>(
            [&]() -> result_t { return result_t::success(oc::invoke(alternative)); },
            [&](std::exception_ptr captured) -> result_t
            {
                auto const new_cause = alternative_holder::of(oc::move(captured));
                return _storage.cause.with_view(
                    [&](cause_view first) -> result_t
                    {
                        return new_cause.with_view(
                            [&](alternative_view second) -> result_t
                            {
                                return result_t::merged(oc::invoke(exceptions_merger, first, second), //
                                                        first, _storage.cause.ptr(), second, new_cause.ptr());
                            });
                    });
            });
    }

    // projection
public:
    /// result() holds the value on success, cause() the cause on failure
    [[nodiscard]] basic_try_optional<T, X, Ceiling> to_optional() const&
    {
        if (_is_success)
            return {oc::optional<T>(_storage.value), oc::nullopt};
        return {oc::nullopt, oc::optional<cause_holder>(_storage.cause)};
    }

    // comparison
public:
    /// Equal iff both succeeded with equal values or both failed with equal causes
    /// Causes are equal if they are the same exception object, or compare equal as X
    [[nodiscard]] friend bool operator==(basic_try const& lhs, basic_try const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._is_success != rhs._is_success)
            return false;
        if (lhs._is_success)
            return bool(lhs._storage.value == rhs._storage.value);
        return lhs._storage.cause == rhs._storage.cause;
    }

    /// Debug representation, e.g. try_result{result=5} or try_result{cause=std::runtime_error: boom}
    /// Not meant for program logic
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::string(Ceiling::value_name);
        if (_is_success)
        {
            s += "{result=";
            s += oc::to_debug_string(_storage.value);
        }
        else
        {
            s += "{cause=";
            s += oc::describe_exception(_storage.cause.ptr());
        }
        s += '}';
        return s;
    }

    // special members
public:
    basic_try(basic_try const& rhs)
        requires std::is_copy_constructible_v<T>
      : _is_success(rhs._is_success)
    {
        if (_is_success)
            std::construct_at(&_storage.value, rhs._storage.value);
        else
            std::construct_at(&_storage.cause, rhs._storage.cause);
    }

    basic_try(basic_try&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>) : _is_success(rhs._is_success)
    {
        if (_is_success)
            std::construct_at(&_storage.value, oc::move(rhs._storage.value));
        else
            std::construct_at(&_storage.cause, rhs._storage.cause);
    }

    basic_try& operator=(basic_try const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            auto copy = basic_try(rhs);
            destroy();
            construct_from(oc::move(copy));
        }
        return *this;
    }

    basic_try& operator=(basic_try&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            destroy();
            construct_from(oc::move(rhs));
        }
        return *this;
    }

    ~basic_try() { destroy(); }

private:
    basic_try(impl::success_tag, T&& value) : _is_success(true) { std::construct_at(&_storage.value, oc::move(value)); }
    basic_try(impl::success_tag, T const& value) : _is_success(true) { std::construct_at(&_storage.value, value); }
    basic_try(impl::failure_tag, cause_holder cause) : _is_success(false)
    {
        std::construct_at(&_storage.cause, oc::move(cause));
    }

    [[nodiscard]] static basic_try captured(std::exception_ptr cause)
    {
        return basic_try(impl::failure_tag{}, cause_holder::of(oc::move(cause)));
    }

    template <class Y>
    [[nodiscard]] static basic_try flattened(basic_try<T, Y, Ceiling> inner)
    {
        if (inner._is_success)
            return basic_try(impl::success_tag{}, oc::move(inner._storage.value));
        return basic_try(impl::failure_tag{}, cause_holder(inner._storage.cause));
    }

    /// Failure with the result of an exceptions merger
    /// A reference to one of the merged causes keeps that exception object (first_ptr or second_ptr)
    /// A null exception_ptr is reported as null_dereference_error
    template <class W, class A, class B>
    [[nodiscard]] static basic_try merged(W&& cause,
                                          A const& first,
                                          std::exception_ptr const& first_ptr,
                                          B const& second,
                                          std::exception_ptr const& second_ptr)
    {
        if constexpr (std::is_same_v<std::decay_t<W>, std::exception_ptr>)
        {
            OC_UNUSED(first);
            OC_UNUSED(first_ptr);
            OC_UNUSED(second);
            OC_UNUSED(second_ptr);
            return captured(impl::non_null(oc::forward<W>(cause), "the exceptions merger returned a null cause"));
        }
        else
        {
            if constexpr (std::is_lvalue_reference_v<W>)
            {
                if (impl::same_object(cause, first))
                    return captured(first_ptr);
                if (impl::same_object(cause, second))
                    return captured(second_ptr);
            }
            return failure(oc::forward<W>(cause));
        }
    }

    void construct_from(basic_try&& rhs)
    {
        _is_success = rhs._is_success;
        if (_is_success)
            std::construct_at(&_storage.value, oc::move(rhs._storage.value));
        else
            std::construct_at(&_storage.cause, rhs._storage.cause);
    }

    void destroy()
    {
        if (_is_success)
            _storage.value.~T();
        else
            _storage.cause.~cause_holder();
    }

    template <class, class, class>
    friend struct oc::basic_try;
    template <class, class>
    friend struct oc::basic_try_void;

    // members
private:
    union storage
    {
        storage() {}
        ~storage() {}

        T value;
        cause_holder cause;
    };

    storage _storage;
    bool _is_success = false;
};
