/*

archive/archive_writer.hpp
--------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Writes framed messages into one gzip file per calendar month, named
{folder}_{YYYYMM}.{extension}. Only one file is open at a time. The first
open of a month in a run truncates the file; reopening it later in the same
run appends another gzip member.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <mailarc/archive/frame.hpp>
#include <mailarc/detail/log.hpp>
#include <mailarc/detail/result.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc::archive
{

inline constexpr std::string_view default_extension = "mmdf.gz";

/// Calendar month of a timestamp, in UTC
[[nodiscard]] inline std::chrono::year_month month_of(timestamp ts) noexcept
{
    std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(ts)};
    return {ymd.year(), ymd.month()};
}

/// "YYYYMM"
[[nodiscard]] inline std::string month_stamp(std::chrono::year_month ym)
{
    std::string year = std::to_string(static_cast<int>(ym.year()));
    if (year.size() < 4)
        year.insert(0, 4 - year.size(), '0');
    unsigned m = static_cast<unsigned>(ym.month());
    return year + (m < 10 ? "0" : "") + std::to_string(m);
}

[[nodiscard]] inline std::string archive_file_name(std::string_view folder_name,
    std::chrono::year_month ym, std::string_view extension = default_extension)
{
    std::string name(folder_name);
    name += '_';
    name += month_stamp(ym);
    name += '.';
    name += extension;
    return name;
}

class archive_writer
{
public:
    archive_writer(std::filesystem::path directory, std::string folder_name,
        std::string extension = std::string(default_extension))
        : directory_(std::move(directory)), folder_name_(std::move(folder_name)),
          extension_(std::move(extension))
    {
    }

    archive_writer(const archive_writer&) = delete;
    archive_writer& operator=(const archive_writer&) = delete;

    ~archive_writer()
    {
        if (auto r = finalize(); !r)
            MAILARC_ERROR("Closing archive: " + r.error().to_string());
    }

    /**
     * Append one framed payload to the file of the timestamp's month, closing
     * the open file first when it belongs to another month. An epoch
     * timestamp (unknown creation time) never rotates.
     */
    result_void submit(std::string_view payload, timestamp ts)
    {
        if (out_ && ts != timestamp{} && month_of(ts) != *month_)
        {
            if (auto r = finalize(); !r)
                return r;
        }

        if (!out_)
        {
            if (auto r = open(month_of(ts)); !r)
                return r;
        }

        try
        {
            write_frame(*out_, payload);
        }
        catch (const std::exception& exc)
        {
            return fail(error_code::archive_write_failed, exc.what(), current_.string());
        }
        if (!*out_)
            return fail(error_code::archive_write_failed, "stream in failed state", current_.string());
        ++frames_in_file_;
        return ok();
    }

    /// Flush and close the open file, if any. Calling it again does nothing.
    result_void finalize()
    {
        if (!out_)
            return ok();

        std::unique_ptr<boost::iostreams::filtering_ostream> out = std::move(out_);
        std::string path = current_.string();
        month_.reset();
        current_.clear();
        MAILARC_DEBUG("Closing " + path + " (" + std::to_string(frames_in_file_) + " frames)");
        frames_in_file_ = 0;
        try
        {
            out->reset();
        }
        catch (const std::exception& exc)
        {
            return fail(error_code::archive_write_failed, exc.what(), path);
        }
        return ok();
    }

    [[nodiscard]] bool is_open() const noexcept { return out_ != nullptr; }

    /// Path of the open file, empty when none is open
    [[nodiscard]] const std::filesystem::path& current_path() const noexcept { return current_; }

    /// Every distinct file opened so far, in first opening order
    [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

private:
    result_void open(std::chrono::year_month ym)
    {
        namespace io = boost::iostreams;
        auto path = directory_ / archive_file_name(folder_name_, ym, extension_);
        const bool reopened = std::find(files_.begin(), files_.end(), path) != files_.end();
        const auto mode = std::ios::out | std::ios::binary | (reopened ? std::ios::app : std::ios::trunc);
        try
        {
            io::file_sink sink(path.string(), mode);
            if (!sink.is_open())
            {
                MAILARC_ERROR("Failed to open file " + path.string());
                return fail(error_code::archive_open_failed, "cannot create archive", path.string());
            }
            auto out = std::make_unique<io::filtering_ostream>();
            out->push(io::gzip_compressor());
            out->push(sink);
            out_ = std::move(out);
        }
        catch (const std::exception& exc)
        {
            MAILARC_ERROR("Failed to open file " + path.string() + ": " + exc.what());
            return fail(error_code::archive_open_failed, exc.what(), path.string());
        }

        MAILARC_INFO((reopened ? "Reopening file " : "Opening file ") + path.string());
        month_ = ym;
        current_ = path;
        if (!reopened)
            files_.push_back(std::move(path));
        return ok();
    }

    std::filesystem::path directory_;
    std::string folder_name_;
    std::string extension_;

    std::unique_ptr<boost::iostreams::filtering_ostream> out_;
    std::optional<std::chrono::year_month> month_;
    std::filesystem::path current_;
    std::size_t frames_in_file_ = 0;
    std::vector<std::filesystem::path> files_;
};

} // namespace mailarc::archive
