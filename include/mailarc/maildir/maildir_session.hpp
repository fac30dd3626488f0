/*

maildir/maildir_session.hpp
---------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

#include <mailarc/detail/result.hpp>
#include <mailarc/maildir/maildir_store.hpp>
#include <mailarc/source/mailbox.hpp>
#include <mailarc/source/memory_stream.hpp>

namespace mailarc::maildir
{

/**
 * Maildir files are stored as RFC 822 already: conversion copies the file.
 */
class passthrough_converter : public converter
{
public:
    result_void convert(backing_object& message, stream_buffer& out) override
    {
        auto* file = dynamic_cast<message_file*>(&message);
        if (file == nullptr)
            return fail(error_code::conversion_failed, "not a Maildir message");

        std::ifstream in(file->path(), std::ios::binary);
        if (!in)
            return fail(error_code::conversion_failed, "cannot open message", file->path().string());

        std::array<char, 64 * 1024> chunk{};
        while (in)
        {
            in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            auto got = in.gcount();
            if (got <= 0)
                break;
            if (auto r = out.write({chunk.data(), static_cast<std::size_t>(got)}); !r)
                return r;
        }
        if (in.bad())
            return fail(error_code::conversion_failed, "read error", file->path().string());
        return ok();
    }
};

class maildir_session : public session
{
public:
    explicit maildir_session(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] std::string describe() const override
    {
        return "Maildir store: " + root_.string();
    }

    result<std::unique_ptr<folder_handle>> root_folder() override
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(root_, ec))
            return fail<std::unique_ptr<folder_handle>>(error_code::initialization_failed,
                "Maildir root is not a directory", root_.string());
        auto root = std::filesystem::canonical(root_, ec);
        if (ec)
            return fail<std::unique_ptr<folder_handle>>(error_code::initialization_failed,
                ec.message(), root_.string());
        return std::make_unique<maildir_folder>(root, root);
    }

    result<std::unique_ptr<converter>> make_converter() override
    {
        return std::make_unique<passthrough_converter>();
    }

    result<std::unique_ptr<stream_buffer>> make_stream_buffer() override
    {
        return std::make_unique<memory_stream_buffer>();
    }

    result_void attach_address_book(converter&) override
    {
        return fail(error_code::address_book_unavailable, "Maildir stores have no address book");
    }

private:
    std::filesystem::path root_;
};

} // namespace mailarc::maildir
