#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>


namespace oc
{

//
// Primitives
//

// signed size type
// Subtraction on sizes and indices is common and must not wrap around, so they are signed.
using isize = std::int64_t;

//
// Memory
//

struct memory_resource;
struct any_allocation;

//
// Vocabulary
//

struct nullopt_t;
template <class T>
struct optional;

//
// Failure taxonomy
//

struct any_failure;
struct unchecked_error;
struct null_dereference_error;
struct unchecked_io_error;
struct verify_error;
struct illegal_state_error;
struct uri_syntax_error;

//
// Throwing functional types
//

template <class Signature, class X>
struct throwing;

//
// Unchecker
//

template <class EF, class ET>
struct unchecker;

//
// Outcomes
//

struct catch_checked;
struct catch_all;

template <class T, class X, class Ceiling>
struct basic_try;
template <class X, class Ceiling>
struct basic_try_void;
template <class T, class X, class Ceiling>
struct basic_try_optional;

// checked discipline: only checked-style failures of type X are captured
template <class T, class X = std::exception>
using try_result = basic_try<T, X, catch_checked>;
template <class X = std::exception>
using try_void = basic_try_void<X, catch_checked>;

// catch-all discipline: every thrown object is captured
template <class T>
using try_catch_all = basic_try<T, std::exception_ptr, catch_all>;
using try_catch_all_void = basic_try_void<std::exception_ptr, catch_all>;

// optional projections, see try_optional.hh
template <class T, class X = std::exception>
using try_optional = basic_try_optional<T, X, catch_checked>;
template <class T>
using try_catch_all_optional = basic_try_optional<T, std::exception_ptr, catch_all>;

//
// Checked streams
//

template <class T, class X>
struct checked_stream;

} // namespace oc
