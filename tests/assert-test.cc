#include <outcome-core/assert-handler.hh>
#include <outcome-core/assert.hh>
#include <outcome-core/throwing.hh>
#include <outcome-core/try.hh>

#include <nexus/test.hh>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
struct violation
{
    std::string message;
};

// reports every violation as a thrown violation
oc::impl::assertion_handler throwing_handler(std::vector<oc::impl::assertion_info>& seen)
{
    return [&seen](oc::impl::assertion_info const& info)
    {
        seen.push_back(info);
        throw violation{info.message};
    };
}

template <class F>
bool violates(F&& f)
{
    try
    {
        f();
    }
    catch (violation const&)
    {
        return true;
    }
    return false;
}
} // namespace

TEST("assertions - handler receives the violation")
{
    std::vector<oc::impl::assertion_info> seen;
    auto const guard = oc::impl::scoped_assertion_handler(throwing_handler(seen));

    int const line = __LINE__ + 1;
    CHECK(violates([] { OC_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic"); }));

    REQUIRE(seen.size() == 1);
    CHECK(seen[0].expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(seen[0].message == "arithmetic");
    CHECK(std::string(seen[0].location.file_name()).ends_with("assert-test.cc"));
    CHECK(seen[0].location.line() == line);
    CHECK(seen[0].in_flight.empty());
}

TEST("assertions - violation inside a catch block reports the exception in flight")
{
    std::vector<oc::impl::assertion_info> seen;
    auto const guard = oc::impl::scoped_assertion_handler(throwing_handler(seen));

    try
    {
        throw std::runtime_error("disk gone");
    }
    catch (std::runtime_error const&)
    {
        CHECK(violates([] { OC_ASSERT_ALWAYS(false, "while recovering"); }));
    }

    REQUIRE(seen.size() == 1);
    CHECK(seen[0].in_flight == "std::runtime_error: disk gone");
}

TEST("assertions - condition is evaluated once and passing assertions are silent")
{
    std::vector<oc::impl::assertion_info> seen;
    auto const guard = oc::impl::scoped_assertion_handler(throwing_handler(seen));

    int evaluations = 0;
    OC_ASSERT_ALWAYS(++evaluations == 1, "counted");
    CHECK(evaluations == 1);
    CHECK(seen.empty());
}

TEST("assertions - the innermost handler wins and is removed with its scope")
{
    std::vector<oc::impl::assertion_info> outer_seen;
    std::vector<oc::impl::assertion_info> inner_seen;
    auto const outer = oc::impl::scoped_assertion_handler(throwing_handler(outer_seen));

    {
        auto const inner = oc::impl::scoped_assertion_handler(throwing_handler(inner_seen));
        CHECK(violates([] { OC_ASSERT_ALWAYS(false, "inner"); }));
    }
    CHECK(violates([] { OC_ASSERT_ALWAYS(false, "outer"); }));

    REQUIRE(inner_seen.size() == 1);
    REQUIRE(outer_seen.size() == 1);
    CHECK(inner_seen[0].message == "inner");
    CHECK(outer_seen[0].message == "outer");
}

#if OC_ASSERT_ENABLED

TEST("assertions - library preconditions")
{
    std::vector<oc::impl::assertion_info> seen;
    auto const guard = oc::impl::scoped_assertion_handler(throwing_handler(seen));

    SECTION("invoking an invalid throwing callable")
    {
        oc::t_runnable<> empty;
        CHECK(violates([&] { empty(); }));
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].message == "cannot call an invalid oc::throwing");
    }

    SECTION("failure from a null cause")
    {
        CHECK(violates([] { (void)oc::try_void<>::failure(std::exception_ptr()); }));
        CHECK(violates([] { (void)oc::try_catch_all<int>::failure(std::exception_ptr()); }));
        CHECK(seen.size() == 2);
    }

    SECTION("failure whose cause is not of the cause type")
    {
        auto const p = std::make_exception_ptr(std::logic_error("not runtime"));
        CHECK(violates([&] { (void)oc::try_result<int, std::runtime_error>::failure(p); }));
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].message == "the cause does not hold an exception of the declared cause type");
    }

    SECTION("using a consumed stream")
    {
        auto s = oc::checked_stream<int, std::runtime_error>::wrapping(std::vector<int>{1, 2});
        CHECK(oc::move(s).count() == 2);
        CHECK(violates([&] { (void)oc::move(s).count(); }));
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].message == "the stream has already been consumed");
    }
}

#endif
