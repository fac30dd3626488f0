/*

source/mailbox.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Collaborator interfaces a mailbox backend implements: the folder hierarchy,
the index-addressed item collections, the conversion service and its
reusable output stream, and the session owning all of them.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <mailarc/detail/result.hpp>

namespace mailarc
{

/// Creation times are kept at second precision, in UTC
using timestamp = std::chrono::sys_seconds;

/// Owning store of a folder (PST/OST file, Maildir root, ...)
struct store_info
{
    std::string display_name;
    std::string file_path;
};

/**
 * Opaque native object behind an item, the input of a converter.
 */
class backing_object
{
public:
    virtual ~backing_object() = default;
};

/**
 * Reusable byte stream the converter writes into.
 *
 * One instance is shared by every extraction of a run. reset() must be called
 * before each use; bytes previously written are not guaranteed to survive it.
 */
class stream_buffer
{
public:
    virtual ~stream_buffer() = default;

    /// Rewind to offset 0
    virtual result_void reset() = 0;

    /// Append at the current offset
    virtual result_void write(std::string_view bytes) = 0;

    /// Current offset, i.e. bytes written since the last reset
    virtual result<std::size_t> position() = 0;

    /// Copy the first `size` bytes out of the stream's own memory
    virtual result<std::string> copy_out(std::size_t size) = 0;
};

/**
 * Message-to-MIME conversion service.
 */
class converter
{
public:
    virtual ~converter() = default;

    virtual result_void convert(backing_object& message, stream_buffer& out) = 0;
};

/**
 * One item of a collection. Valid for a single loop iteration.
 */
class item_handle
{
public:
    virtual ~item_handle() = default;

    [[nodiscard]] virtual result<std::string> subject() const = 0;
    [[nodiscard]] virtual result<std::string> message_class() const = 0;
    [[nodiscard]] virtual result<timestamp> creation_time() const = 0;

    /// Native object usable for conversion
    virtual result<std::unique_ptr<backing_object>> open_backing_object() = 0;
};

/**
 * Lazily paged, 1-based, index-addressed item source of a folder.
 *
 * Handles returned by fetch() are invalidated by a resort.
 */
class item_collection
{
public:
    virtual ~item_collection() = default;

    virtual result_void sort_by_creation_time(bool descending = false) = 0;
    virtual result<std::size_t> count() = 0;
    virtual result<std::unique_ptr<item_handle>> fetch(std::size_t position) = 0;
};

/**
 * One node of the mailbox hierarchy as exposed by the backend.
 */
class folder_handle
{
public:
    virtual ~folder_handle() = default;

    [[nodiscard]] virtual result<std::string> name() const = 0;
    [[nodiscard]] virtual result<std::string> path() const = 0;
    [[nodiscard]] virtual result<std::string> entry_id() const = 0;
    [[nodiscard]] virtual result<int> object_class() const = 0;
    [[nodiscard]] virtual result<int> default_item_type() const = 0;
    [[nodiscard]] virtual result<std::string> default_message_class() const = 0;
    [[nodiscard]] virtual result<store_info> store() const = 0;

    virtual result<std::size_t> subfolder_count() = 0;

    /// 1-based, in the order the backend exposes them
    virtual result<std::unique_ptr<folder_handle>> subfolder(std::size_t position) = 0;

    virtual result<std::unique_ptr<item_collection>> items() = 0;
};

/**
 * Process-scoped backend state: initialized before use, torn down on destruction.
 */
class session
{
public:
    virtual ~session() = default;

    /// Short description of the host client, logged at startup
    [[nodiscard]] virtual std::string describe() const = 0;

    virtual result<std::unique_ptr<folder_handle>> root_folder() = 0;
    virtual result<std::unique_ptr<converter>> make_converter() = 0;
    virtual result<std::unique_ptr<stream_buffer>> make_stream_buffer() = 0;

    /// Let the converter resolve addresses through the session's address book
    virtual result_void attach_address_book(converter& conv) = 0;
};

} // namespace mailarc
