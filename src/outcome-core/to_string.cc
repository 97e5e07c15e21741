#include "to_string.hh"

#include <charconv>
#include <cstdint>

namespace
{
template <class T>
std::string chars_of(T v)
{
    char buffer[64];
    auto const [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), v);
    if (ec != std::errc{})
        return "<unrepresentable>";
    return std::string(buffer, end);
}

std::string hex_of(std::uintmax_t v, int min_digits)
{
    char buffer[32];
    auto const [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), v, 16);
    (void)ec; // 32 chars always fit a 64 bit value

    auto s = std::string("0x");
    for (auto digits = int(end - buffer); digits < min_digits; ++digits)
        s += '0';
    for (auto p = buffer; p != end; ++p)
        s += (*p >= 'a' && *p <= 'f') ? char(*p - 'a' + 'A') : *p;
    return s;
}
} // namespace

std::string oc::to_string(void const* ptr)
{
    return hex_of(reinterpret_cast<std::uintptr_t>(ptr), 1);
}

std::string oc::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string oc::to_string(byte b)
{
    return hex_of(static_cast<unsigned char>(b), 2);
}

std::string oc::to_string(char c)
{
    return std::string(1, c);
}

std::string oc::to_string(signed char i)
{
    return chars_of(int(i));
}

std::string oc::to_string(unsigned char i)
{
    return chars_of(unsigned(i));
}

std::string oc::to_string(signed short i)
{
    return chars_of(i);
}

std::string oc::to_string(unsigned short i)
{
    return chars_of(i);
}

std::string oc::to_string(signed int i)
{
    return chars_of(i);
}

std::string oc::to_string(unsigned int i)
{
    return chars_of(i);
}

std::string oc::to_string(signed long i)
{
    return chars_of(i);
}

std::string oc::to_string(unsigned long i)
{
    return chars_of(i);
}

std::string oc::to_string(signed long long i)
{
    return chars_of(i);
}

std::string oc::to_string(unsigned long long i)
{
    return chars_of(i);
}

std::string oc::to_string(float i)
{
    return chars_of(i);
}

std::string oc::to_string(double i)
{
    return chars_of(i);
}

std::string oc::to_string(char const* s)
{
    return {s};
}

std::string oc::to_string(std::string s)
{
    return s;
}

std::string oc::to_string(std::string_view s)
{
    return std::string(s);
}
