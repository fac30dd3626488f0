/*

source/memory_stream.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>

#include <mailarc/source/mailbox.hpp>

namespace mailarc
{

/**
 * Heap backed stream_buffer. reset() rewinds without releasing capacity, so
 * storage grows to the largest message seen and is then reused.
 */
class memory_stream_buffer : public stream_buffer
{
public:
    result_void reset() override
    {
        pos_ = 0;
        return ok();
    }

    result_void write(std::string_view bytes) override
    {
        if (pos_ + bytes.size() > data_.size())
            data_.resize(pos_ + bytes.size());
        data_.replace(pos_, bytes.size(), bytes.data(), bytes.size());
        pos_ += bytes.size();
        return ok();
    }

    result<std::size_t> position() override
    {
        return pos_;
    }

    result<std::string> copy_out(std::size_t size) override
    {
        if (size > data_.size())
            return fail<std::string>(error_code::stream_error, "read past end of stream",
                std::to_string(size) + " > " + std::to_string(data_.size()));
        return std::string(data_.data(), size);
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return data_.capacity(); }

private:
    std::string data_;
    std::size_t pos_ = 0;
};

} // namespace mailarc
