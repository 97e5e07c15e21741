#pragma once

#include <outcome-core/ceiling.hh>
#include <outcome-core/errors.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/optional.hh>
#include <outcome-core/to_debug_string.hh>

#include <exception>
#include <string>
#include <type_traits>
#include <variant>

/// Optional projection of an outcome, obtained through basic_try::to_optional or basic_try_void::to_optional
/// result() holds the value of a success and cause() the cause of a failure, the other one is empty.
/// Outcomes without a value project to T = std::monostate, their result() is always empty.
///
/// Use the aliases from fwd.hh:
///   oc::try_optional<T, X>          checked discipline
///   oc::try_catch_all_optional<T>   catch-all discipline
///
/// Equality spans value and void projections of the same cause type and discipline:
///   two successes are equal iff their results are equal, so a void success only equals a void success
///   two failures are equal iff their causes are equal, whatever their result types
template <class T, class X, class Ceiling>
struct oc::basic_try_optional
{
    using value_type = T;
    using cause_type = X;
    using ceiling_type = Ceiling;

private:
    using cause_holder = typename Ceiling::template cause_holder<X>;

    // queries
public:
    [[nodiscard]] bool is_success() const { return !_cause.has_value(); }
    [[nodiscard]] bool is_failure() const { return _cause.has_value(); }

    /// Empty on failure and for void successes
    [[nodiscard]] oc::optional<T> const& result() const { return _result; }

    /// The captured exception, nullptr on success
    [[nodiscard]] std::exception_ptr cause() const
    {
        if (_cause.has_value())
            return _cause.value().ptr();
        return nullptr;
    }

    // comparison
public:
    template <class U>
    [[nodiscard]] bool equals(basic_try_optional<U, X, Ceiling> const& rhs) const
    {
        if (is_failure() || rhs.is_failure())
            return _cause == rhs._cause;

        if constexpr (std::is_same_v<T, U> && requires(T const& v) { bool(v == v); })
            return _result == rhs._result;
        else
            return false;
    }

    template <class U>
    [[nodiscard]] friend bool operator==(basic_try_optional const& lhs, basic_try_optional<U, X, Ceiling> const& rhs)
    {
        return lhs.equals(rhs);
    }

    /// Debug representation, e.g. try_optional{result=5}, try_optional{success} for void successes
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::string(Ceiling::optional_name);
        if (_cause.has_value())
        {
            s += "{cause=";
            s += oc::describe_exception(_cause.value().ptr());
        }
        else if (_result.has_value())
        {
            s += "{result=";
            s += oc::to_debug_string(_result.value());
        }
        else
            s += "{success";
        s += '}';
        return s;
    }

private:
    basic_try_optional(oc::optional<T> result, oc::optional<cause_holder> cause)
      : _result(oc::move(result)), _cause(oc::move(cause))
    {
    }

    template <class, class, class>
    friend struct oc::basic_try_optional;
    template <class, class, class>
    friend struct oc::basic_try;
    template <class, class>
    friend struct oc::basic_try_void;

    // members
private:
    oc::optional<T> _result;
    oc::optional<cause_holder> _cause;
};
