/*

export/extraction.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Per-item translation from an item handle into owned MIME bytes.

*/

#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <boost/algorithm/string/predicate.hpp>

#include <mailarc/detail/log.hpp>
#include <mailarc/detail/result.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc
{

/// Message classes skipped without conversion (meeting responses)
inline constexpr std::string_view filtered_class_prefix = "IPM.Schedule.Meeting.Resp.";

/// Converted bytes, owned, and the item's creation time
struct extracted_message
{
    std::string data;
    timestamp created{};
};

/// Item deliberately not exported; not an error
struct filtered_message
{
    std::string message_class;
};

/// This item failed; the export continues with the next one
struct soft_failure
{
    error reason;
};

/// The export cannot continue past this item
struct hard_stop
{
    error reason;
};

using extraction_outcome = std::variant<extracted_message, filtered_message, soft_failure, hard_stop>;

/**
 * Convert one item through `conv`, using `stream` as scratch output.
 *
 * The stream is reset first. Its bytes are copied out before returning, since
 * the next reset may reuse or move the underlying memory.
 */
[[nodiscard]] inline extraction_outcome extract_message(item_handle& item, converter& conv,
    stream_buffer& stream)
{
    if (auto r = stream.reset(); !r)
        return soft_failure{r.error()};

    if (auto cls = item.message_class(); cls && boost::algorithm::starts_with(*cls, filtered_class_prefix))
        return filtered_message{std::move(*cls)};

    extracted_message msg;
    if (auto t = item.creation_time())
        msg.created = *t;

    auto backing = item.open_backing_object();
    if (!backing)
    {
        MAILARC_ERROR("Get backing object: " + backing.error().to_string());
        return hard_stop{backing.error()};
    }

    if (auto r = conv.convert(**backing, stream); !r)
        return soft_failure{r.error()};

    auto size = stream.position();
    if (!size)
        return soft_failure{size.error()};
    if (*size == 0)
        return soft_failure{error(error_code::empty_conversion)};

    auto bytes = stream.copy_out(*size);
    if (!bytes)
        return soft_failure{bytes.error()};
    msg.data = std::move(*bytes);
    return msg;
}

} // namespace mailarc
