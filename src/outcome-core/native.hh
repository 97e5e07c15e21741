#pragma once

#include <outcome-core/fwd.hh>

#include <string>
#include <string_view>

// =========================================================================================================
// Platform-specific native utilities
// =========================================================================================================
//
// Symbol demangling:
//   demangle_symbol(symbol)     - demangle C++ type and symbol names to human-readable format
//

namespace oc
{
/// Demangle a C++ mangled name, e.g. the result of typeid(T).name(), into a human-readable format.
/// GCC/Clang use __cxa_demangle, MSVC type names are already readable and are returned unchanged.
/// If demangling fails, returns the original symbol.
///
/// Usage:
///   auto const name = oc::demangle_symbol(typeid(std::runtime_error).name()); // "std::runtime_error"
[[nodiscard]] std::string demangle_symbol(std::string_view symbol);
} // namespace oc
