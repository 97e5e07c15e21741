#include <outcome-core/unchecker.hh>

#include <nexus/test.hh>

#include "test-failures.hh"

#include <stdexcept>
#include <string>
#include <system_error>

namespace
{
constexpr auto to_illegal_state = oc::unchecker<std::exception, oc::illegal_state_error>::wrapping_with(
    [](std::exception const& e) { return oc::illegal_state_error(e.what()); });

constexpr auto io_to_illegal_state = oc::unchecker<test::io_failure, oc::illegal_state_error>::wrapping_with(
    [](test::io_failure const& e) { return oc::illegal_state_error(std::string("io: ") + e.what()); });

// the exception nested into e by std::throw_with_nested
std::exception_ptr nested_cause(std::exception const& e)
{
    auto const nested = dynamic_cast<std::nested_exception const*>(&e);
    return nested ? nested->nested_ptr() : nullptr;
}
} // namespace

TEST("unchecker - wrapping a checked failure")
{
    bool caught = false;
    try
    {
        to_illegal_state.call([] { throw test::sql_failure("syntax error near FROM"); });
    }
    catch (oc::illegal_state_error const& e)
    {
        caught = true;
        CHECK(std::string(e.what()) == "syntax error near FROM");

        auto const cause = nested_cause(e);
        REQUIRE(cause != nullptr);
        std::string nested_message;
        CHECK(oc::visit_exception<test::sql_failure>(cause, [&](test::sql_failure const& sql) { nested_message = sql.what(); }));
        CHECK(nested_message == "syntax error near FROM");
    }
    CHECK(caught);
}

TEST("unchecker - unchecked failures pass through unchanged")
{
    SECTION("logic_error under a std::exception unchecker")
    {
        bool caught = false;
        try
        {
            to_illegal_state.call([] { throw std::out_of_range("index 7"); });
        }
        catch (std::out_of_range const& e)
        {
            caught = true;
            CHECK(std::string(e.what()) == "index 7");
            CHECK(nested_cause(e) == nullptr);
        }
        CHECK(caught);
    }

    SECTION("unchecked_error is not wrapped again")
    {
        CHECK(test::throws_as<oc::verify_error>([] { to_illegal_state.call([] { throw oc::verify_error("v"); }); }));
    }

    SECTION("failures outside EF propagate unchanged")
    {
        CHECK(test::throws_as<test::sql_failure>([] { io_to_illegal_state.call([] { throw test::sql_failure("db"); }); }));
        CHECK(test::throws_as<int>([] { io_to_illegal_state.call([] { throw 3; }); }));
    }

    SECTION("derived checked failures are wrapped")
    {
        bool caught = false;
        try
        {
            io_to_illegal_state.call([] { throw test::file_not_found("a.txt"); });
        }
        catch (oc::illegal_state_error const& e)
        {
            caught = true;
            CHECK(std::string(e.what()) == "io: a.txt");
            CHECK(oc::holds_exception<test::file_not_found>(nested_cause(e)));
        }
        CHECK(caught);
    }
}

TEST("unchecker - get_using")
{
    CHECK(to_illegal_state.get_using([] { return 17; }) == 17);
    CHECK(to_illegal_state.get_using([] { return std::string("text"); }) == "text");

    CHECK(test::throws_as<oc::illegal_state_error>([] { (void)to_illegal_state.get_using([]() -> int { throw test::io_failure("io"); }); }));
}

TEST("unchecker - io_unchecker keeps the error code")
{
    bool caught = false;
    try
    {
        oc::io_unchecker.call([] { throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory), "open"); });
    }
    catch (oc::unchecked_io_error const& e)
    {
        caught = true;
        CHECK(e.code() == std::errc::no_such_file_or_directory);
        CHECK(oc::holds_exception<std::system_error>(nested_cause(e)));
    }
    CHECK(caught);

    CHECK(oc::io_unchecker.get_using([] { return 4; }) == 4);
}

TEST("unchecker - uri_unchecker and verify_error conversion")
{
    SECTION("uri_unchecker")
    {
        bool caught = false;
        try
        {
            oc::uri_unchecker.call([] { throw oc::uri_syntax_error("a b", "Illegal character in path", 1); });
        }
        catch (oc::verify_error const& e)
        {
            caught = true;
            CHECK(std::string(e.what()) == "Illegal character in path at index 1: a b");
            CHECK(oc::holds_exception<oc::uri_syntax_error>(nested_cause(e)));
        }
        CHECK(caught);
    }

    SECTION("converting_to_verify_error")
    {
        constexpr auto verifier = oc::unchecker<test::sql_failure, oc::verify_error>::converting_to_verify_error();
        CHECK(test::throws_as<oc::verify_error>([&] { verifier.call([] { throw test::sql_failure("bad"); }); }));
        CHECK(verifier.get_using([] { return 2; }) == 2);
    }
}

TEST("unchecker - lazy wrappers")
{
    SECTION("wrap_runnable does not run until invoked")
    {
        int calls = 0;
        auto const r = to_illegal_state.wrap_runnable(
            [&]
            {
                ++calls;
                throw test::io_failure("late");
            });
        CHECK(calls == 0);

        auto wrapped = r;
        CHECK(test::throws_as<oc::illegal_state_error>([&] { wrapped(); }));
        CHECK(test::throws_as<oc::illegal_state_error>([&] { wrapped(); }));
        CHECK(calls == 2);
    }

    SECTION("wrap_supplier")
    {
        auto s = oc::io_unchecker.wrap_supplier([] { return std::string("ok"); });
        CHECK(s() == "ok");
    }

    SECTION("wrap_function and wrap_bi_function")
    {
        auto f = to_illegal_state.wrap_function(
            [](int i)
            {
                if (i < 0)
                    throw test::io_failure("negative");
                return i * 2;
            });
        CHECK(f(3) == 6);
        CHECK(test::throws_as<oc::illegal_state_error>([&] { (void)f(-1); }));

        auto g = to_illegal_state.wrap_bi_function([](int a, int b) { return a - b; });
        CHECK(g(5, 2) == 3);
    }

    SECTION("wrap_predicate and wrap_comparator")
    {
        auto p = to_illegal_state.wrap_predicate([](std::string const& s) { return s.empty(); });
        CHECK(p(std::string()));
        CHECK(!p(std::string("x")));

        auto c = to_illegal_state.wrap_comparator([](int a, int b) { return a < b ? -1 : a > b ? 1 : 0; });
        CHECK(c(1, 2) < 0);
        CHECK(c(2, 2) == 0);
    }

    SECTION("wrap_consumer and wrap_bi_consumer")
    {
        std::string seen;
        auto consumer = to_illegal_state.wrap_consumer([&](std::string const& s) { seen += s; });
        consumer(std::string("a"));

        auto bi_consumer = to_illegal_state.wrap_bi_consumer([&](std::string const& s, int n) { seen += s + std::to_string(n); });
        bi_consumer(std::string("b"), 1);
        CHECK(seen == "ab1");

        auto failing = to_illegal_state.wrap_consumer([](int) { throw test::sql_failure("consume"); });
        CHECK(test::throws_as<oc::illegal_state_error>([&] { failing(0); }));
    }

    SECTION("wrap_binary_operator")
    {
        auto op = oc::io_unchecker.wrap_binary_operator([](int a, int b) { return a + b; });
        CHECK(op(2, 3) == 5);
    }
}
