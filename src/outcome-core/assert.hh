#pragma once

#include <outcome-core/macros.hh>
#include <outcome-core/source_location.hh>

// =========================================================================================================
// OC_ASSERT(cond, msg) - precondition of the library, msg is a string literal
// =========================================================================================================
//
// Active with OC_ASSERT_ENABLED (debug, relwithdebinfo, or OC_ENABLE_ASSERT_IN_RELEASE).
// A violation is reported to the innermost handler of assert-handler.hh, or printed to stderr,
// then the program breaks into an attached debugger and aborts.
// A handler may throw instead, which is how the tests observe violations.
//
// Assertions guard misuse of outcome-core itself:
//   calling an empty oc::throwing, a failure built from a null or foreign std::exception_ptr,
//   value() of an empty oc::optional, using a consumed oc::checked_stream
//
// Failures of user computations are never asserted on: outcomes capture them or let them escape.
//
// Usage:
//   OC_ASSERT(cause != nullptr, "a failure requires a non-null cause");
//
#define OC_ASSERT(cond, msg) OC_IMPL_ASSERT(cond, msg)

// OC_ASSERT_ALWAYS(cond, msg) - like OC_ASSERT, in every build configuration
#define OC_ASSERT_ALWAYS(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace oc::impl
{
/// Reports the violation and aborts, unless the active handler throws
[[noreturn]] void assertion_failed(char const* expression, char const* message, oc::source_location location);
} // namespace oc::impl

#define OC_IMPL_ASSERT_ALWAYS(cond, msg)                                                \
    do                                                                                  \
    {                                                                                   \
        if (!(cond)) [[unlikely]]                                                       \
            ::oc::impl::assertion_failed(#cond, msg, ::oc::source_location::current()); \
    } while (false)

#if OC_ASSERT_ENABLED
#define OC_IMPL_ASSERT(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)
#else
// arguments still have to compile
#define OC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OC_UNUSED(cond);          \
        OC_UNUSED(msg);           \
    } while (false)
#endif
