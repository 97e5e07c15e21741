#include <outcome-core/errors.hh>

#include <nexus/test.hh>

#include "test-failures.hh"

#include <functional>
#include <ios>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>

// unchecked family
static_assert(oc::is_unchecked_failure<std::logic_error>);
static_assert(oc::is_unchecked_failure<std::out_of_range>);
static_assert(oc::is_unchecked_failure<oc::null_dereference_error>);
static_assert(oc::is_unchecked_failure<oc::unchecked_error>);
static_assert(oc::is_unchecked_failure<oc::unchecked_io_error>);
static_assert(oc::is_unchecked_failure<oc::verify_error>);
static_assert(oc::is_unchecked_failure<oc::illegal_state_error>);
static_assert(oc::is_unchecked_failure<std::bad_alloc>);
static_assert(oc::is_unchecked_failure<std::bad_array_new_length>);
static_assert(oc::is_unchecked_failure<std::bad_cast>);
static_assert(oc::is_unchecked_failure<std::bad_function_call>);
static_assert(oc::is_unchecked_failure<std::bad_optional_access>);
static_assert(oc::is_unchecked_failure<std::bad_variant_access>);

// checked-style
static_assert(oc::is_checked_failure<std::exception>);
static_assert(oc::is_checked_failure<std::runtime_error>);
static_assert(oc::is_checked_failure<std::system_error>);
static_assert(oc::is_checked_failure<std::ios_base::failure>);
static_assert(oc::is_checked_failure<oc::uri_syntax_error>);
static_assert(oc::is_checked_failure<test::io_failure>);
static_assert(!oc::is_checked_failure<oc::verify_error>);
static_assert(!oc::is_checked_failure<int>);
static_assert(!oc::is_unchecked_failure<int>);

TEST("errors - is_unchecked on captured exceptions")
{
    CHECK(oc::is_unchecked(std::make_exception_ptr(std::invalid_argument("x"))));
    CHECK(oc::is_unchecked(std::make_exception_ptr(oc::null_dereference_error())));
    CHECK(oc::is_unchecked(std::make_exception_ptr(oc::verify_error("v"))));
    CHECK(oc::is_unchecked(std::make_exception_ptr(std::bad_alloc())));
    CHECK(oc::is_unchecked(std::make_exception_ptr(std::bad_optional_access())));

    CHECK(!oc::is_unchecked(std::make_exception_ptr(std::runtime_error("r"))));
    CHECK(!oc::is_unchecked(std::make_exception_ptr(test::file_not_found("f"))));
    CHECK(!oc::is_unchecked(std::make_exception_ptr(42)));
}

TEST("errors - classification uses the dynamic type")
{
    std::exception_ptr p;
    try
    {
        throw std::length_error("len");
    }
    catch (std::exception const&)
    {
        p = std::current_exception();
    }

    CHECK(oc::is_unchecked(p));
    CHECK(oc::holds_exception<std::length_error>(p));
    CHECK(oc::holds_exception<std::logic_error>(p));
    CHECK(!oc::holds_exception<std::runtime_error>(p));
}

TEST("errors - visit_exception")
{
    auto const p = std::make_exception_ptr(test::file_not_found("config.ini"));

    std::string seen;
    CHECK(oc::visit_exception<test::io_failure>(p, [&](test::io_failure const& e) { seen = e.what(); }));
    CHECK(seen == "config.ini");

    SECTION("the visitor sees the dynamic type")
    {
        bool is_file_not_found = false;
        CHECK(oc::visit_exception<std::exception>(
            p, [&](std::exception const& e) { is_file_not_found = dynamic_cast<test::file_not_found const*>(&e) != nullptr; }));
        CHECK(is_file_not_found);
    }

    SECTION("no match")
    {
        int calls = 0;
        CHECK(!oc::visit_exception<test::sql_failure>(p, [&](test::sql_failure const&) { ++calls; }));
        CHECK(!oc::visit_exception<std::exception>(nullptr, [&](std::exception const&) { ++calls; }));
        CHECK(calls == 0);
    }

    SECTION("non-std objects")
    {
        int value = 0;
        CHECK(oc::visit_exception<int>(std::make_exception_ptr(3), [&](int v) { value = v; }));
        CHECK(value == 3);
    }

    SECTION("a throwing visitor propagates")
    {
        CHECK(test::throws_as<std::out_of_range>(
            [&] { oc::visit_exception<std::exception>(p, [](std::exception const&) { throw std::out_of_range("visit"); }); }));
    }
}

TEST("errors - describe_exception")
{
    CHECK(oc::describe_exception(std::make_exception_ptr(std::runtime_error("boom"))) == "std::runtime_error: boom");
    CHECK(oc::describe_exception(std::make_exception_ptr(test::io_failure("disk full"))) == "test::io_failure: disk full");
    CHECK(oc::describe_exception(std::make_exception_ptr(7)) == "int");
    CHECK(oc::describe_exception(nullptr) == "nullptr");
}

TEST("errors - null_dereference_error")
{
    CHECK(std::string(oc::null_dereference_error().what()) == "null value where a non-null value is required");
    CHECK(std::string(oc::null_dereference_error("no user").what()) == "no user");
}

TEST("errors - unchecked_io_error keeps the error code")
{
    auto const cause = std::system_error(std::make_error_code(std::errc::permission_denied), "write");
    auto const e = oc::unchecked_io_error(cause);
    CHECK(e.code() == std::errc::permission_denied);
    CHECK(std::string(e.what()) == cause.what());

    auto const direct = oc::unchecked_io_error(std::make_error_code(std::errc::timed_out), "read");
    CHECK(direct.code() == std::errc::timed_out);
    CHECK(std::string(direct.what()) == "read");
}

TEST("errors - uri_syntax_error")
{
    SECTION("with index")
    {
        auto const e = oc::uri_syntax_error("http://a b", "Illegal character in authority", 8);
        CHECK(e.input() == "http://a b");
        CHECK(e.reason() == "Illegal character in authority");
        CHECK(e.index() == 8);
        CHECK(std::string(e.what()) == "Illegal character in authority at index 8: http://a b");
    }

    SECTION("without index")
    {
        auto const e = oc::uri_syntax_error("::", "Expected scheme name");
        CHECK(e.index() == -1);
        CHECK(std::string(e.what()) == "Expected scheme name: ::");
    }
}
