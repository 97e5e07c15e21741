#include "errors.hh"

#include <outcome-core/assert.hh>
#include <outcome-core/native.hh>
#include <outcome-core/to_string.hh>

#ifdef OC_COMPILER_POSIX
#include <cxxabi.h>
#endif

namespace
{
std::string uri_syntax_message(std::string const& input, std::string const& reason, oc::isize index)
{
    if (index < 0)
        return reason + ": " + input;
    return reason + " at index " + oc::to_string(index) + ": " + input;
}
} // namespace

oc::null_dereference_error::null_dereference_error() : std::logic_error("null value where a non-null value is required")
{
}

oc::null_dereference_error::null_dereference_error(std::string const& what) : std::logic_error(what) {}

oc::unchecked_io_error::unchecked_io_error(std::system_error const& cause)
  : unchecked_error(cause.what()), _code(cause.code())
{
}

oc::unchecked_io_error::unchecked_io_error(std::error_code code, std::string const& what)
  : unchecked_error(what), _code(code)
{
}

oc::uri_syntax_error::uri_syntax_error(std::string input, std::string reason, isize index)
  : std::runtime_error(uri_syntax_message(input, reason, index)),
    _input(std::move(input)),
    _reason(std::move(reason)),
    _index(index)
{
    OC_ASSERT(index >= -1, "index must be -1 or a valid position");
}

bool oc::is_unchecked(std::exception_ptr const& p)
{
    OC_ASSERT(p != nullptr, "cannot classify a null exception_ptr");

    try
    {
        std::rethrow_exception(p);
    }
    catch (std::logic_error const&)
    {
        return true;
    }
    catch (oc::unchecked_error const&)
    {
        return true;
    }
    catch (std::bad_alloc const&)
    {
        return true;
    }
    catch (std::bad_cast const&)
    {
        return true;
    }
    catch (std::bad_typeid const&)
    {
        return true;
    }
    catch (std::bad_function_call const&)
    {
        return true;
    }
    catch (std::bad_optional_access const&)
    {
        return true;
    }
    catch (std::bad_variant_access const&)
    {
        return true;
    }
    catch (...)
    {
        // checked-style or not a std::exception at all, p still holds it
        return false;
    }
}

std::string oc::describe_exception(std::exception_ptr const& p)
{
    if (p == nullptr)
        return "nullptr";

    try
    {
        std::rethrow_exception(p);
    }
    catch (std::exception const& e)
    {
#ifdef OC_HAS_RTTI
        return oc::demangle_symbol(typeid(e).name()) + ": " + e.what();
#else
        return std::string("std::exception: ") + e.what();
#endif
    }
    catch (...)
    {
#ifdef OC_COMPILER_POSIX
        if (auto const type = abi::__cxa_current_exception_type())
            return oc::demangle_symbol(type->name());
#endif
        return "<unknown exception>";
    }
}
