#pragma once

#include <source_location>

namespace oc
{
/// Type alias for std::source_location
/// Used by assertions to report where a precondition was violated
using source_location = std::source_location;
} // namespace oc
