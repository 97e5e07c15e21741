#pragma once

#include <outcome-core/source_location.hh>

#include <functional>
#include <string>

namespace oc::impl
{
/// What a handler learns about a violated OC_ASSERT
struct assertion_info
{
    std::string expression;
    std::string message;
    oc::source_location location;

    /// describe_exception of the exception being handled where the assertion fired, empty outside catch blocks
    std::string in_flight;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Installs a handler for OC_ASSERT violations until the end of the scope
/// Handlers nest: the innermost one is called. A handler that returns lets the program abort,
/// a handler that throws unwinds to the caller instead.
/// The handler stack is process-global and not synchronized.
///
/// Usage:
///   auto const guard = oc::impl::scoped_assertion_handler([](oc::impl::assertion_info const& info) {
///       throw precondition_violation(info.message);
///   });
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace oc::impl
