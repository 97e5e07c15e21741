#include "unchecker.hh"

oc::unchecked_io_error oc::impl::wrap_io_error(std::system_error const& e)
{
    return oc::unchecked_io_error(e);
}

oc::verify_error oc::impl::wrap_uri_syntax_error(uri_syntax_error const& e)
{
    return oc::verify_error(e.what());
}
