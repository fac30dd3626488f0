/*

export/export_engine.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

The export loop: walks an index window of an item collection, extracts each
item and hands the payload to the archive writer. Per-item failures skip the
item; an unreadable backing object, or an item that cannot be fetched after
the configured retries, stops the whole export.

*/

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <mailarc/archive/archive_writer.hpp>
#include <mailarc/detail/log.hpp>
#include <mailarc/detail/result.hpp>
#include <mailarc/export/extraction.hpp>
#include <mailarc/search/date_range.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc
{

struct export_options
{
    /// Extra attempts to fetch the same position before giving up on the run
    std::size_t fetch_retry_limit = 3;
};

struct export_stats
{
    std::size_t saved = 0;            ///< Frames written
    std::size_t skipped = 0;          ///< Soft failures
    std::size_t filtered = 0;         ///< Items excluded by class
    std::size_t fetch_failures = 0;   ///< Failed fetch attempts, retries included

    bool stopped_early = false;
    std::optional<std::size_t> stop_position;   ///< 1-based position of the stopping item
};

enum class export_state
{
    scanning,   ///< No archive open
    writing,    ///< An archive is open and accepting frames
    stopped
};

class export_engine
{
public:
    export_engine(converter& conv, stream_buffer& stream, archive::archive_writer& writer,
        export_options options = {})
        : conv_(conv), stream_(stream), writer_(writer), options_(options)
    {
    }

    /**
     * Export positions [window.start, window.end) of `items`, bounded by `total`.
     *
     * The archive writer is finalized before returning. The error result is
     * reserved for archive I/O faults; stats() stays valid in every case.
     */
    result_void run(item_collection& items, std::size_t total, export_window window)
    {
        stats_ = export_stats{};
        state_ = export_state::scanning;

        auto outcome = loop(items, total, window);
        state_ = export_state::stopped;

        auto closed = writer_.finalize();
        if (!outcome)
            return outcome;
        return closed;
    }

    [[nodiscard]] export_state state() const noexcept { return state_; }
    [[nodiscard]] const export_stats& stats() const noexcept { return stats_; }

private:
    result_void loop(item_collection& items, std::size_t total, export_window window)
    {
        std::size_t attempts = 0;
        for (std::size_t i = window.start; i < window.end && i < total;)
        {
            const std::size_t position = i + 1;
            auto item = items.fetch(position);
            if (!item)
            {
                ++stats_.fetch_failures;
                MAILARC_WARN("Failed to get Item " + std::to_string(position) + ": " + item.error().to_string());
                if (++attempts > options_.fetch_retry_limit)
                {
                    stop(position);
                    return ok();
                }
                continue;
            }
            attempts = 0;

            bool keep_going = true;
            result_void written = ok();
            std::visit([&](auto&& out) {
                using T = std::decay_t<decltype(out)>;
                if constexpr (std::is_same_v<T, hard_stop>)
                {
                    log_failure(**item, i, out.reason);
                    stop(position);
                    keep_going = false;
                }
                else if constexpr (std::is_same_v<T, soft_failure>)
                {
                    log_failure(**item, i, out.reason);
                    ++stats_.skipped;
                }
                else if constexpr (std::is_same_v<T, filtered_message>)
                {
                    MAILARC_DEBUG("Filtered " + std::to_string(i) + " (" + out.message_class + ")");
                    ++stats_.filtered;
                }
                else
                {
                    written = writer_.submit(out.data, out.created);
                    if (written)
                    {
                        ++stats_.saved;
                        state_ = export_state::writing;
                    }
                }
            }, extract_message(**item, conv_, stream_));
            item->reset();

            if (!keep_going)
                return ok();
            if (!written)
            {
                MAILARC_ERROR("Archive write failed at " + std::to_string(position) + ": " +
                    written.error().to_string());
                stop(position);
                return written;
            }
            ++i;
        }
        return ok();
    }

    static void log_failure(const item_handle& item, std::size_t index, const error& reason)
    {
        std::string subject;
        std::string cls;
        if (auto s = item.subject())
            subject = std::move(*s);
        if (auto c = item.message_class())
            cls = std::move(*c);
        MAILARC_WARN("Failed to extract data for " + std::to_string(index) + " " + subject +
            " (" + cls + "): " + reason.to_string());
    }

    void stop(std::size_t position)
    {
        MAILARC_WARN("Stopped at " + std::to_string(position));
        stats_.stopped_early = true;
        stats_.stop_position = position;
    }

    converter& conv_;
    stream_buffer& stream_;
    archive::archive_writer& writer_;
    export_options options_;

    export_stats stats_;
    export_state state_ = export_state::scanning;
};

} // namespace mailarc
