/*

archive/frame.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

MMDF style framing: each message is written between two postmarks
(four 0x01 bytes and a newline). The postmark must not occur inside a
message; nothing checks it.

*/

#pragma once

#include <array>
#include <exception>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <mailarc/detail/result.hpp>

namespace mailarc::archive
{

inline constexpr std::array<char, 5> postmark{'\x01', '\x01', '\x01', '\x01', '\n'};

[[nodiscard]] constexpr std::string_view postmark_view() noexcept
{
    return {postmark.data(), postmark.size()};
}

/// Write postmark, payload, postmark
inline std::ostream& write_frame(std::ostream& out, std::string_view payload)
{
    out.write(postmark.data(), static_cast<std::streamsize>(postmark.size()));
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.write(postmark.data(), static_cast<std::streamsize>(postmark.size()));
    return out;
}

/**
 * Split decompressed archive content back into payloads, in write order.
 */
[[nodiscard]] inline result<std::vector<std::string>> split_frames(std::string_view content)
{
    const std::string_view mark = postmark_view();
    std::vector<std::string> frames;
    std::size_t pos = 0;
    while (pos < content.size())
    {
        if (content.substr(pos, mark.size()) != mark)
            return fail<std::vector<std::string>>(error_code::archive_malformed,
                "missing opening postmark", "offset " + std::to_string(pos));
        std::size_t begin = pos + mark.size();
        std::size_t close = content.find(mark, begin);
        if (close == std::string_view::npos)
            return fail<std::vector<std::string>>(error_code::archive_malformed,
                "missing closing postmark", "offset " + std::to_string(begin));
        frames.emplace_back(content.substr(begin, close - begin));
        pos = close + mark.size();
    }
    return frames;
}

/**
 * Sequential reader of a gzip compressed archive.
 */
class frame_reader
{
public:
    explicit frame_reader(std::filesystem::path path) : path_(std::move(path)) {}

    /// Decompressed bytes of the whole archive
    [[nodiscard]] result<std::string> read_all() const
    {
        namespace io = boost::iostreams;
        std::string content;
        try
        {
            io::file_source src(path_.string(), std::ios::in | std::ios::binary);
            if (!src.is_open())
                return fail<std::string>(error_code::io_error, "cannot open archive", path_.string());
            io::filtering_istream in;
            in.push(io::gzip_decompressor());
            in.push(src);
            io::copy(in, io::back_inserter(content));
        }
        catch (const std::exception& exc)
        {
            return fail<std::string>(error_code::io_error, exc.what(), path_.string());
        }
        return content;
    }

    [[nodiscard]] result<std::vector<std::string>> frames() const
    {
        auto content = read_all();
        if (!content)
            return fail<std::vector<std::string>>(content.error());
        return split_frames(*content);
    }

private:
    std::filesystem::path path_;
};

} // namespace mailarc::archive
