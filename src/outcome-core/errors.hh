#pragma once

#include <outcome-core/fwd.hh>
#include <outcome-core/utility.hh>

#include <exception>
#include <functional>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <typeinfo>
#include <variant>

// =========================================================================================================
// Failure taxonomy
// =========================================================================================================
//
// C++ does not distinguish checked from unchecked exceptions, so outcome-core makes the split explicit:
//
//   unchecked (programming-error class)
//     std::logic_error and subclasses (includes oc::null_dereference_error)
//     oc::unchecked_error and subclasses
//     std::bad_alloc, std::bad_cast, std::bad_typeid, std::bad_function_call,
//     std::bad_optional_access, std::bad_variant_access
//
//   checked-style
//     every other class derived from std::exception,
//     typically the std::runtime_error family (std::system_error, std::ios_base::failure, ...)
//
//   neither
//     objects not derived from std::exception (e.g. "throw 42"), only captured by the catch-all discipline
//
// Compile-time:
//   is_unchecked_failure<E>     - E is in the unchecked family
//   is_checked_failure<E>       - E derives from std::exception and is not unchecked
//
// Runtime, on an already captured std::exception_ptr:
//   is_unchecked(p)             - dynamic type of *p is unchecked
//   holds_exception<E>(p)       - *p can be caught as E
//   visit_exception<E>(p, f)    - f(*p as E) if *p can be caught as E
//   describe_exception(p)       - "<demangled type>: <what>" for diagnostics
//

/// Tag used as declared failure type when a callable may throw anything
/// Never instantiated
struct oc::any_failure
{
    any_failure() = delete;
};

/// Root of the unchecked wrappers
/// Thrown when a checked-style failure is converted into one that callers are not expected to handle
struct oc::unchecked_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Cause of a computation that "succeeded" with null
struct oc::null_dereference_error : std::logic_error
{
    null_dereference_error();
    explicit null_dereference_error(std::string const& what);
};

/// Unchecked counterpart of an I/O failure, keeps the original error code
struct oc::unchecked_io_error : oc::unchecked_error
{
    explicit unchecked_io_error(std::system_error const& cause);
    unchecked_io_error(std::error_code code, std::string const& what);

    [[nodiscard]] std::error_code const& code() const noexcept { return _code; }

private:
    std::error_code _code;
};

/// A verification failed, e.g. a constant input that must be well-formed was not
struct oc::verify_error : oc::unchecked_error
{
    using unchecked_error::unchecked_error;
};

struct oc::illegal_state_error : oc::unchecked_error
{
    using unchecked_error::unchecked_error;
};

/// A string could not be parsed as a URI reference
/// Checked-style: malformed input is a recoverable condition
struct oc::uri_syntax_error : std::runtime_error
{
    /// index is the position of the offending character, -1 if unknown
    uri_syntax_error(std::string input, std::string reason, isize index = -1);

    [[nodiscard]] std::string const& input() const { return _input; }
    [[nodiscard]] std::string const& reason() const { return _reason; }
    [[nodiscard]] isize index() const { return _index; }

private:
    std::string _input;
    std::string _reason;
    isize _index = -1;
};

namespace oc
{
// =========================================================================================================
// Compile-time classification
// =========================================================================================================

template <class E>
constexpr bool is_unchecked_failure = std::is_base_of_v<std::logic_error, E>          //
                                      || std::is_base_of_v<oc::unchecked_error, E>    //
                                      || std::is_base_of_v<std::bad_alloc, E>         //
                                      || std::is_base_of_v<std::bad_cast, E>          //
                                      || std::is_base_of_v<std::bad_typeid, E>        //
                                      || std::is_base_of_v<std::bad_function_call, E> //
                                      || std::is_base_of_v<std::bad_optional_access, E>
                                      || std::is_base_of_v<std::bad_variant_access, E>;

template <class E>
constexpr bool is_checked_failure = std::is_base_of_v<std::exception, E> && !is_unchecked_failure<E>;

// =========================================================================================================
// Inspection of captured exceptions
// =========================================================================================================

/// True iff p holds an exception of the unchecked family
/// Precondition: p != nullptr
[[nodiscard]] bool is_unchecked(std::exception_ptr const& p);

/// Invokes visitor with the exception held by p if it can be caught as E, returns whether it was invoked
/// The reference passed to visitor is only valid during the call: rethrowing may hand out a copy of the held object
template <class E, class F>
bool visit_exception(std::exception_ptr const& p, F&& visitor)
{
    if (p == nullptr)
        return false;

    try
    {
        std::rethrow_exception(p);
    }
    catch (E const& e)
    {
        oc::invoke(visitor, e);
        return true;
    }
    catch (...)
    {
        // not an E, p still holds the exception
        return false;
    }
}

template <class E>
[[nodiscard]] bool holds_exception(std::exception_ptr const& p)
{
    return oc::visit_exception<E>(p, [](E const&) {});
}

/// "<demangled dynamic type>: <what>" for standard exceptions, "<type>" for other thrown objects
/// Intended for diagnostics only
[[nodiscard]] std::string describe_exception(std::exception_ptr const& p);

} // namespace oc
