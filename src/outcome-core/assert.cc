#include "assert.hh"

#include <outcome-core/assert-handler.hh>
#include <outcome-core/errors.hh>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#ifdef OC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#else
#include <csignal>
#endif

namespace
{
// innermost handler last
std::vector<oc::impl::assertion_handler> g_handlers;

void print_violation(oc::impl::assertion_info const& info)
{
    std::cerr << "outcome-core: assertion `" << info.expression << "` failed: " << info.message << '\n'
              << "  at " << info.location.file_name() << ':' << info.location.line() << " in "
              << info.location.function_name() << '\n';
    if (!info.in_flight.empty())
        std::cerr << "  while handling " << info.in_flight << '\n';
}

bool debugger_attached()
{
#if defined(OC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(OC_OS_LINUX)
    // "TracerPid:\t<pid>", non-zero under a debugger
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
        if (line.starts_with("TracerPid:"))
            return std::atoi(line.c_str() + 10) != 0;
    return false;
#else
    return false;
#endif
}
} // namespace

oc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    g_handlers.push_back(std::move(handler));
}

oc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    g_handlers.pop_back();
}

void oc::impl::assertion_failed(char const* expression, char const* message, oc::source_location location)
{
    auto const in_flight = std::current_exception();
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
        .in_flight = in_flight ? oc::describe_exception(in_flight) : std::string(),
    };

    if (g_handlers.empty())
        print_violation(info);
    else
        g_handlers.back()(info);

#if defined(OC_COMPILER_MSVC)
    if (debugger_attached())
        __debugbreak();
#elif defined(SIGTRAP)
    if (debugger_attached())
        std::raise(SIGTRAP);
#endif
    std::abort();
}
