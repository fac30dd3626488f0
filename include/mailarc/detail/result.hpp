/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions cross mailarc component boundaries - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace mailarc
{

/// Error categories for mailarc operations
enum class error_code : std::uint16_t
{
    success = 0,

    // Initialization errors (100-199)
    initialization_failed = 100,
    session_failed = 101,
    converter_unavailable = 102,
    address_book_unavailable = 103,

    // Lookup errors (200-299)
    folder_not_found = 200,
    collection_unavailable = 201,
    property_unavailable = 202,

    // Per-item errors (300-399)
    item_fetch_failed = 300,
    unexpected_handle = 301,
    backing_object_unreadable = 302,
    conversion_failed = 303,
    empty_conversion = 304,
    stream_error = 305,

    // I/O errors (400-499)
    io_error = 400,
    directory_creation_failed = 401,
    archive_open_failed = 402,
    archive_write_failed = 403,
    archive_malformed = 404,

    // Input validation (700-799)
    invalid_argument = 700,
    invalid_date = 701,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view error_code_to_string(error_code ec) noexcept
{
    switch (ec)
    {
        case error_code::success: return "Success";
        case error_code::initialization_failed: return "Initialization failed";
        case error_code::session_failed: return "Session failed";
        case error_code::converter_unavailable: return "Converter unavailable";
        case error_code::address_book_unavailable: return "Address book unavailable";
        case error_code::folder_not_found: return "Folder not found";
        case error_code::collection_unavailable: return "Collection unavailable";
        case error_code::property_unavailable: return "Property unavailable";
        case error_code::item_fetch_failed: return "Item fetch failed";
        case error_code::unexpected_handle: return "Unexpected handle";
        case error_code::backing_object_unreadable: return "Backing object unreadable";
        case error_code::conversion_failed: return "Conversion failed";
        case error_code::empty_conversion: return "Empty conversion";
        case error_code::stream_error: return "Stream error";
        case error_code::io_error: return "I/O error";
        case error_code::directory_creation_failed: return "Directory creation failed";
        case error_code::archive_open_failed: return "Archive open failed";
        case error_code::archive_write_failed: return "Archive write failed";
        case error_code::archive_malformed: return "Archive malformed";
        case error_code::invalid_argument: return "Invalid argument";
        case error_code::invalid_date: return "Invalid date";
    }
    return "Unknown error";
}

/// Rich error type with code, message, and optional native context (HRESULT, errno text, path)
class error
{
public:
    error() noexcept : code_(error_code::success) {}

    explicit error(error_code code)
        : code_(code), message_(error_code_to_string(code)) {}

    error(error_code code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    error(error_code code, std::string message, std::string context) noexcept
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& context() const noexcept { return context_; }

    [[nodiscard]] bool is_success() const noexcept { return code_ == error_code::success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_success(); }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[" + std::to_string(static_cast<int>(code_)) + "] " + message_;
        if (!context_.empty())
            out += ": " + context_;
        return out;
    }

    /// Check if this is a specific error
    [[nodiscard]] bool is(error_code ec) const noexcept { return code_ == ec; }

    /// Per-item faults are recovered or escalated by the export loop
    [[nodiscard]] bool is_item_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 300 && c < 400;
    }

    [[nodiscard]] bool is_io_error() const noexcept
    {
        auto c = static_cast<std::uint16_t>(code_);
        return c >= 400 && c < 500;
    }

private:
    error_code code_;
    std::string message_;
    std::string context_;
};

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error>;

/// Helper to create void success
[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code)
{
    return std::unexpected(error(code));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message)
{
    return std::unexpected(error(code, std::move(message)));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error> fail(error_code code, std::string message, std::string context)
{
    return std::unexpected(error(code, std::move(message), std::move(context)));
}

} // namespace mailarc
