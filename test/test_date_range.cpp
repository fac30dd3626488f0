/*

test_date_range.cpp
-------------------

Binary search of date boundaries and export window resolution.

*/

#define BOOST_TEST_MODULE date_range_test

#include <chrono>
#include <limits>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailarc/search/date_range.hpp>
#include "fake_mailbox.hpp"

using mailarc::find_first_item_after;
using mailarc::parse_day;
using mailarc::resolve_window;
using mailarc::window_options;
using fake::day;
using fake::mail;

static fake::items january_february()
{
    return fake::items({
        mail("a", day(2023, 1, 5), "A"),
        mail("b", day(2023, 1, 20), "B"),
        mail("c", day(2023, 2, 2), "C"),
    });
}

static fake::items hourly(std::size_t n)
{
    std::vector<fake::item_spec> specs;
    for (std::size_t i = 0; i < n; ++i)
        specs.push_back(mail("m" + std::to_string(i), day(2022, 6, 1, 0) + std::chrono::hours(i), "x"));
    return fake::items(std::move(specs));
}


BOOST_AUTO_TEST_CASE(parse_day_accepts_calendar_days)
{
    auto d = parse_day("20230115");
    BOOST_REQUIRE(d.has_value());
    BOOST_CHECK(*d == day(2023, 1, 15, 0));

    auto leap = parse_day("20240229");
    BOOST_CHECK(leap.has_value());
}


BOOST_AUTO_TEST_CASE(parse_day_rejects_malformed_input)
{
    for (const char* bad : {"2023011", "2023-01-15", "20230230", "2023011a", "20231301", ""})
    {
        auto d = parse_day(bad);
        BOOST_REQUIRE(!d.has_value());
        BOOST_CHECK(d.error().is(mailarc::error_code::invalid_date));
    }
}


BOOST_AUTO_TEST_CASE(start_date_skips_earlier_items)
{
    auto items = january_february();
    auto target = parse_day("20230115");
    BOOST_REQUIRE(target.has_value());
    BOOST_TEST(find_first_item_after(items, 3, *target) == 1u);
}


BOOST_AUTO_TEST_CASE(boundaries_return_zero_and_count)
{
    auto items = january_february();
    BOOST_TEST(find_first_item_after(items, 3, day(2022, 12, 31)) == 0u);
    BOOST_TEST(find_first_item_after(items, 3, day(2023, 3, 1)) == 3u);
    BOOST_TEST(find_first_item_after(items, 0, day(2022, 12, 31)) == 0u);
}


BOOST_AUTO_TEST_CASE(equal_time_is_not_after)
{
    auto items = january_february();
    BOOST_TEST(find_first_item_after(items, 3, day(2023, 1, 20)) == 2u);
}


BOOST_AUTO_TEST_CASE(result_partitions_the_collection)
{
    auto items = hourly(1000);
    for (int h : {1, 37, 500, 998})
    {
        auto target = day(2022, 6, 1, 0) + std::chrono::hours(h) + std::chrono::minutes(30);
        std::size_t i = find_first_item_after(items, 1000, target);
        BOOST_TEST(i == static_cast<std::size_t>(h + 1));

        auto before = items.fetch(i);
        auto at = items.fetch(i + 1);
        BOOST_REQUIRE(before && at);
        BOOST_CHECK(*(*before)->creation_time() <= target);
        BOOST_CHECK(*(*at)->creation_time() > target);
    }
}


BOOST_AUTO_TEST_CASE(search_probes_logarithmically)
{
    auto items = hourly(1024);
    items.fetches = 0;
    (void)find_first_item_after(items, 1024, day(2022, 6, 10));
    BOOST_TEST(items.fetches <= 11u);
}


BOOST_AUTO_TEST_CASE(unreadable_probe_counts_as_earlier)
{
    auto items = january_february();
    items.fetch_failures[2] = fake::items::always;
    // position 2 (index 1) reads as the epoch, so the search moves past it
    BOOST_TEST(find_first_item_after(items, 3, day(2023, 1, 25)) == 2u);
    BOOST_TEST(find_first_item_after(items, 3, day(2023, 1, 10)) == 2u);
}


BOOST_AUTO_TEST_CASE(window_defaults_to_count)
{
    auto items = hourly(50);
    window_options opts;
    opts.max_count = 20;
    auto w = resolve_window(items, 50, opts);
    BOOST_TEST(w.start == 0u);
    BOOST_TEST(w.end == 20u);
    BOOST_TEST(w.size() == 20u);
}


BOOST_AUTO_TEST_CASE(window_end_date_bounds_count)
{
    auto items = january_february();
    window_options opts;
    opts.start_date = "20230101";
    opts.end_date = "20230201";
    auto w = resolve_window(items, 3, opts);
    BOOST_TEST(w.start == 0u);
    BOOST_TEST(w.end == 2u);

    opts.max_count = 1;
    w = resolve_window(items, 3, opts);
    BOOST_TEST(w.end == 1u);
}


BOOST_AUTO_TEST_CASE(window_ignores_unparsable_dates)
{
    auto items = january_february();
    fake::log_capture logs;
    window_options opts;
    opts.start_date = "yesterday";
    opts.end_date = "20231399";
    auto w = resolve_window(items, 3, opts);
    BOOST_TEST(w.start == 0u);
    BOOST_TEST(w.end == 1000u);
    BOOST_CHECK(logs.contains("Ignoring start date"));
    BOOST_CHECK(logs.contains("Ignoring end date"));
}


BOOST_AUTO_TEST_CASE(window_count_saturates)
{
    auto items = january_february();
    window_options opts;
    opts.max_count = std::numeric_limits<std::size_t>::max();
    opts.start_date = "20230115";
    auto w = resolve_window(items, 3, opts);
    BOOST_TEST(w.start == 1u);
    BOOST_TEST(w.end == std::numeric_limits<std::size_t>::max());
    BOOST_TEST(w.size() >= 2u);

    opts.end_date = "20230201";
    w = resolve_window(items, 3, opts);
    BOOST_TEST(w.end == 2u);
    BOOST_TEST(w.size() == 1u);
}
