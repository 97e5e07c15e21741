#include <outcome-core/checked_stream.hh>
#include <outcome-core/try.hh>

#include <nexus/test.hh>

#include "test-failures.hh"

#include <list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace
{
using int_stream = oc::checked_stream<int, test::io_failure>;

std::vector<int> const digits = {3, 1, 4, 1, 5, 9, 2, 6};

int compare_ints(int const& a, int const& b)
{
    return a < b ? -1 : a > b ? 1 : 0;
}
} // namespace

static_assert(!std::is_copy_constructible_v<int_stream>);
static_assert(std::is_move_constructible_v<int_stream>);

TEST("checked_stream - wrapping")
{
    CHECK(int_stream::wrapping(digits).to_vector() == digits);
    CHECK(int_stream::wrapping(std::vector<int>{}).count() == 0);
    CHECK(int_stream::wrapping(std::list<int>{7, 8}).to_vector() == std::vector<int>{7, 8});

    // the source range is copied
    auto items = std::vector<int>{1, 2};
    auto s = int_stream::wrapping(items);
    items.push_back(3);
    CHECK(oc::move(s).count() == 2);
}

TEST("checked_stream - intermediate operations")
{
    SECTION("distinct keeps first occurrences in order")
    {
        CHECK(int_stream::wrapping(digits).distinct().to_vector() == std::vector<int>{3, 1, 4, 5, 9, 2, 6});
    }

    SECTION("drop_while stops dropping at the first mismatch")
    {
        auto const r = int_stream::wrapping(digits).drop_while([](int i) { return i != 5; }).to_vector();
        CHECK(r == std::vector<int>{5, 9, 2, 6});
        CHECK(int_stream::wrapping(digits).drop_while([](int) { return true; }).count() == 0);
    }

    SECTION("filter")
    {
        CHECK(int_stream::wrapping(digits).filter([](int i) { return i % 2 == 0; }).to_vector() == std::vector<int>{4, 2, 6});
    }

    SECTION("flat_map")
    {
        auto const r = int_stream::wrapping(std::vector<int>{0, 2, 1})
                           .flat_map([](int i) { return std::vector<std::string>(std::size_t(i), std::to_string(i)); })
                           .to_vector();
        CHECK(r == std::vector<std::string>{"2", "2", "1"});
    }

    SECTION("limit")
    {
        CHECK(int_stream::wrapping(digits).limit(3).to_vector() == std::vector<int>{3, 1, 4});
        CHECK(int_stream::wrapping(digits).limit(0).count() == 0);
        CHECK(int_stream::wrapping(digits).limit(100).count() == 8);
    }

    SECTION("map changes the element type")
    {
        auto const r = int_stream::wrapping(std::vector<int>{1, 22}).map([](int i) { return std::to_string(i); }).to_vector();
        static_assert(std::is_same_v<decltype(r), std::vector<std::string> const>);
        CHECK(r == std::vector<std::string>{"1", "22"});
    }
}

TEST("checked_stream - evaluation is lazy")
{
    int mapped = 0;
    auto s = int_stream::wrapping(digits).map(
        [&](int i)
        {
            ++mapped;
            return i;
        });
    CHECK(mapped == 0);

    auto const first_two = oc::move(s).limit(2).to_vector();
    CHECK(first_two == std::vector<int>{3, 1});
    CHECK(mapped == 2);

    mapped = 0;
    auto const found = int_stream::wrapping(digits)
                           .map(
                               [&](int i)
                               {
                                   ++mapped;
                                   return i;
                               })
                           .any_match([](int i) { return i == 4; });
    CHECK(found);
    CHECK(mapped == 3);
}

TEST("checked_stream - terminal operations")
{
    SECTION("collect")
    {
        auto const joined = int_stream::wrapping(std::vector<int>{1, 2, 3})
                                .collect([] { return std::string(); },
                                         [](std::string& s, int i) { s += std::to_string(i); });
        CHECK(joined == "123");
    }

    SECTION("matching")
    {
        CHECK(int_stream::wrapping(digits).all_match([](int i) { return i > 0; }));
        CHECK(!int_stream::wrapping(digits).all_match([](int i) { return i > 1; }));
        CHECK(int_stream::wrapping(std::vector<int>{}).all_match([](int) { return false; }));
        CHECK(int_stream::wrapping(digits).any_match([](int i) { return i == 9; }));
        CHECK(!int_stream::wrapping(std::vector<int>{}).any_match([](int) { return true; }));
    }

    SECTION("find_first")
    {
        auto const first = int_stream::wrapping(digits).filter([](int i) { return i > 4; }).find_first();
        REQUIRE(first.has_value());
        CHECK(first.value() == 5);
        CHECK(!int_stream::wrapping(std::vector<int>{}).find_first().has_value());
    }

    SECTION("for_each visits in order")
    {
        std::vector<int> seen;
        int_stream::wrapping(digits).for_each([&](int i) { seen.push_back(i); });
        CHECK(seen == digits);
    }

    SECTION("min and max keep the first of equal elements")
    {
        CHECK(int_stream::wrapping(digits).max(compare_ints).value() == 9);
        CHECK(int_stream::wrapping(digits).min(compare_ints).value() == 1);
        CHECK(!int_stream::wrapping(std::vector<int>{}).max(compare_ints).has_value());

        using entry = std::pair<int, std::string>;
        auto const by_key = [](entry const& a, entry const& b) { return compare_ints(a.first, b.first); };
        auto const entries = std::vector<entry>{{1, "a"}, {2, "b"}, {2, "c"}, {1, "d"}};
        CHECK(oc::checked_stream<entry, test::io_failure>::wrapping(entries).max(by_key).value().second == "b");
        CHECK(oc::checked_stream<entry, test::io_failure>::wrapping(entries).min(by_key).value().second == "a");
    }
}

TEST("checked_stream - failures of callbacks")
{
    auto const read = [](int i) -> int
    {
        if (i == 4)
            throw test::file_not_found("4.txt");
        return i;
    };

    SECTION("propagate out of the terminal operation with their dynamic type")
    {
        CHECK(test::throws_as<test::file_not_found>([&] { (void)int_stream::wrapping(digits).map(read).count(); }));
    }

    SECTION("are not raised for elements that are never pulled")
    {
        CHECK(int_stream::wrapping(digits).map(read).limit(2).count() == 2);
    }

    SECTION("are captured by an outcome around the terminal operation")
    {
        auto const t = oc::try_result<int, test::io_failure>::get(
            [&] { return int(int_stream::wrapping(digits).map(read).count()); });
        CHECK(t == oc::try_result<int, test::io_failure>::failure(test::io_failure("4.txt")));
    }

    SECTION("throwing callbacks declaring a covered failure type")
    {
        oc::t_predicate<int, test::file_not_found> positive = [](int const& i) { return i > 0; };
        CHECK(int_stream::wrapping(digits).filter(oc::move(positive)).count() == 8);
    }
}
