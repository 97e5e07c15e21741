#include <outcome-core/try.hh>

#include <nexus/test.hh>

#include "test-failures.hh"

#include <string>

namespace
{
using int_try = oc::try_result<int, test::io_failure>;
using string_try = oc::try_result<std::string, test::io_failure>;
using void_try = oc::try_void<test::io_failure>;
} // namespace

TEST("try_optional - projection of value outcomes")
{
    SECTION("success")
    {
        auto const o = int_try::success(3).to_optional();
        CHECK(o.is_success());
        CHECK(!o.is_failure());
        REQUIRE(o.result().has_value());
        CHECK(o.result().value() == 3);
        CHECK(o.cause() == nullptr);
    }

    SECTION("failure")
    {
        auto const p = std::make_exception_ptr(test::io_failure("x"));
        auto const o = int_try::failure(p).to_optional();
        CHECK(o.is_failure());
        CHECK(!o.result().has_value());
        CHECK(o.cause() == p);
    }
}

TEST("try_optional - projection of void outcomes")
{
    auto const ok = void_try::success().to_optional();
    CHECK(ok.is_success());
    CHECK(!ok.result().has_value());
    CHECK(ok.cause() == nullptr);

    auto const p = std::make_exception_ptr(test::file_not_found("f"));
    auto const failed = void_try::failure(p).to_optional();
    CHECK(failed.is_failure());
    CHECK(failed.cause() == p);
}

TEST("try_optional - equality")
{
    SECTION("successes compare their results")
    {
        CHECK(int_try::success(1).to_optional() == int_try::success(1).to_optional());
        CHECK(int_try::success(1).to_optional() != int_try::success(2).to_optional());
        CHECK(void_try::success().to_optional() == void_try::success().to_optional());
    }

    SECTION("a void success only equals a void success")
    {
        CHECK(void_try::success().to_optional() != int_try::success(1).to_optional());
        CHECK(int_try::success(1).to_optional() != void_try::success().to_optional());
        CHECK(string_try::success("1").to_optional() != int_try::success(1).to_optional());
    }

    SECTION("failures compare their causes across result types")
    {
        auto const cause = test::io_failure("shared");
        CHECK(int_try::failure(cause).to_optional() == void_try::failure(cause).to_optional());
        CHECK(void_try::failure(cause).to_optional() == string_try::failure(cause).to_optional());
        CHECK(int_try::failure(cause).to_optional() != void_try::failure(test::io_failure("other")).to_optional());
    }

    SECTION("success never equals failure")
    {
        CHECK(int_try::success(1).to_optional() != int_try::failure(test::io_failure("1")).to_optional());
        CHECK(void_try::success().to_optional() != void_try::failure(test::io_failure("x")).to_optional());
    }
}

TEST("try_optional - to_string")
{
    CHECK(int_try::success(3).to_optional().to_string() == "try_optional{result=3}");
    CHECK(void_try::success().to_optional().to_string() == "try_optional{success}");
    CHECK(int_try::failure(test::io_failure("x")).to_optional().to_string() == "try_optional{cause=test::io_failure: x}");
    CHECK(oc::try_catch_all<int>::success(1).to_optional().to_string() == "try_catch_all_optional{result=1}");
}
