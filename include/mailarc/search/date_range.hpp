/*

search/date_range.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Locates date boundaries inside an item collection sorted ascending by
creation time, with O(log n) item fetches.

*/

#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <mailarc/detail/log.hpp>
#include <mailarc/detail/result.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc
{

/// Half-open index range [start, end) over a folder's item collection
struct export_window
{
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t size() const noexcept { return end > start ? end - start : 0; }
};

/// Inputs of resolve_window()
struct window_options
{
    std::size_t max_count = 1000;
    std::optional<std::string> start_date;   ///< YYYYMMDD, inclusive
    std::optional<std::string> end_date;     ///< YYYYMMDD
};

/**
 * Parse a YYYYMMDD calendar day into its UTC midnight.
 */
[[nodiscard]] inline result<timestamp> parse_day(std::string_view text)
{
    if (text.size() != 8)
        return fail<timestamp>(error_code::invalid_date, "expected YYYYMMDD", std::string(text));

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    auto field = [&text](std::size_t off, std::size_t len, auto& out) {
        const char* first = text.data() + off;
        const char* last = first + len;
        auto res = std::from_chars(first, last, out);
        return res.ec == std::errc{} && res.ptr == last;
    };
    if (!field(0, 4, y) || !field(4, 2, m) || !field(6, 2, d))
        return fail<timestamp>(error_code::invalid_date, "expected YYYYMMDD", std::string(text));

    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok())
        return fail<timestamp>(error_code::invalid_date, "no such calendar day", std::string(text));
    return timestamp{std::chrono::sys_days{ymd}};
}

/**
 * Smallest index i in [0, count] whose item has a creation time strictly
 * after `target`; `count` if there is none.
 *
 * The collection must already be sorted ascending by creation time. A probe
 * whose item or timestamp cannot be read counts as the epoch, i.e. as being
 * at or before any realistic target.
 */
[[nodiscard]] inline std::size_t find_first_item_after(item_collection& items, std::size_t count,
    timestamp target)
{
    auto time_at = [&items](std::size_t i) -> timestamp {
        auto item = items.fetch(i + 1);
        if (!item)
        {
            MAILARC_DEBUG("Probe " + std::to_string(i + 1) + ": " + item.error().to_string());
            return timestamp{};
        }
        auto t = (*item)->creation_time();
        if (!t)
            return timestamp{};
        return *t;
    };

    std::size_t lo = 0;
    std::size_t hi = count;
    while (lo < hi)
    {
        std::size_t mid = lo + (hi - lo) / 2;
        if (!(time_at(mid) > target))
            lo = mid + 1;
        else
            hi = mid;
    }

    if (lo < count)
        MAILARC_DEBUG("Found item: " + std::to_string(lo));
    return lo;
}

/**
 * Compute the export window: start at the first item after the start day
 * (0 without one), end after max_count items or at the first item after the
 * end day, whichever comes first. Unparsable dates are logged and ignored.
 */
[[nodiscard]] inline export_window resolve_window(item_collection& items, std::size_t total,
    const window_options& opts)
{
    export_window w;

    if (opts.start_date && !opts.start_date->empty())
    {
        if (auto day = parse_day(*opts.start_date))
        {
            w.start = find_first_item_after(items, total, *day);
            MAILARC_INFO("Starting from " + std::to_string(w.start) + " for " + *opts.start_date);
        }
        else
        {
            MAILARC_WARN("Ignoring start date: " + day.error().to_string());
        }
    }

    constexpr std::size_t no_limit = std::numeric_limits<std::size_t>::max();
    w.end = opts.max_count > no_limit - w.start ? no_limit : w.start + opts.max_count;

    if (opts.end_date && !opts.end_date->empty())
    {
        if (auto day = parse_day(*opts.end_date))
        {
            std::size_t pos = find_first_item_after(items, total, *day);
            MAILARC_INFO("Stopping by " + std::to_string(pos) + " for " + *opts.end_date);
            w.end = std::min(w.end, pos);
        }
        else
        {
            MAILARC_WARN("Ignoring end date: " + day.error().to_string());
        }
    }

    return w;
}

} // namespace mailarc
