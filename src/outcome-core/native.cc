#include "native.hh"

#include <outcome-core/macros.hh>

#include <mutex>

#ifdef OC_COMPILER_POSIX
#include <cxxabi.h>

#include <cstdlib>
#endif

std::string oc::demangle_symbol(std::string_view symbol)
{
    // __cxa_demangle thread-safety is not guaranteed
    static std::mutex demangle_mutex;
    std::lock_guard<std::mutex> lock(demangle_mutex);

#ifdef OC_COMPILER_POSIX
    // __cxa_demangle expects a null-terminated string
    auto const symbol_nt = std::string(symbol);

    int status = 0;
    char* demangled = abi::__cxa_demangle(symbol_nt.c_str(), nullptr, nullptr, &status);

    if (status == 0 && demangled != nullptr)
    {
        auto result = std::string(demangled);
        std::free(demangled);
        return result;
    }

    if (demangled != nullptr)
        std::free(demangled);
    return symbol_nt;

#else
    // typeid names on MSVC are not mangled
    return std::string(symbol);
#endif
}
