/*

maildir/maildir_store.hpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

A directory tree of Maildir folders seen through the mailbox interfaces.
Every directory is a folder; its messages are the regular files under its
cur/ and new/ subdirectories, dated by modification time. Other
subdirectories (tmp/ excluded) are sub-folders.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <mailarc/detail/result.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc::maildir
{

/// Outlook olFolder, reported for every directory
inline constexpr int folder_object_class = 2;

/// Outlook olMailItem
inline constexpr int mail_item_type = 0;

inline constexpr std::string_view note_class = "IPM.Note";

[[nodiscard]] inline bool is_maildir_subdir(const std::filesystem::path& p)
{
    auto name = p.filename().string();
    return name == "cur" || name == "new" || name == "tmp";
}

/**
 * Value of the first `header` field of a message, unfolded and trimmed.
 * Reading stops at the blank line ending the header block.
 */
[[nodiscard]] inline std::optional<std::string> read_header(const std::filesystem::path& file,
    std::string_view header)
{
    std::ifstream in(file, std::ios::binary);
    if (!in)
        return std::nullopt;

    const std::string prefix = std::string(header) + ":";
    std::optional<std::string> value;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            break;
        if (value)
        {
            if (line.front() != ' ' && line.front() != '\t')
                break;
            *value += ' ';
            *value += boost::algorithm::trim_copy(line);
            continue;
        }
        if (boost::algorithm::istarts_with(line, prefix))
            value = boost::algorithm::trim_copy(line.substr(prefix.size()));
    }
    return value;
}

[[nodiscard]] inline result<timestamp> modification_time(const std::filesystem::path& file)
{
    std::error_code ec;
    auto ft = std::filesystem::last_write_time(file, ec);
    if (ec)
        return fail<timestamp>(error_code::property_unavailable, ec.message(), file.string());
    auto sys = std::chrono::file_clock::to_sys(ft);
    return std::chrono::floor<std::chrono::seconds>(sys);
}

/// Backing object of a Maildir message: the file itself
class message_file : public backing_object
{
public:
    explicit message_file(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class maildir_item : public item_handle
{
public:
    maildir_item(std::filesystem::path path, timestamp created)
        : path_(std::move(path)), created_(created)
    {
    }

    [[nodiscard]] result<std::string> subject() const override
    {
        auto s = read_header(path_, "Subject");
        if (!s)
            return fail<std::string>(error_code::property_unavailable, "no Subject header", path_.string());
        return std::move(*s);
    }

    [[nodiscard]] result<std::string> message_class() const override
    {
        return std::string(note_class);
    }

    [[nodiscard]] result<timestamp> creation_time() const override
    {
        return created_;
    }

    result<std::unique_ptr<backing_object>> open_backing_object() override
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path_, ec))
            return fail<std::unique_ptr<backing_object>>(error_code::backing_object_unreadable,
                "message file is gone", path_.string());
        return std::make_unique<message_file>(path_);
    }

private:
    std::filesystem::path path_;
    timestamp created_;
};

class maildir_items : public item_collection
{
public:
    struct entry
    {
        std::filesystem::path path;
        timestamp created;
    };

    explicit maildir_items(std::vector<entry> entries) : entries_(std::move(entries)) {}

    /// Messages under dir/cur and dir/new, in directory order
    static result<std::unique_ptr<maildir_items>> scan(const std::filesystem::path& dir)
    {
        std::vector<entry> entries;
        for (const char* sub : {"cur", "new"})
        {
            auto d = dir / sub;
            std::error_code ec;
            if (!std::filesystem::is_directory(d, ec))
                continue;
            for (std::filesystem::directory_iterator it(d, ec), end; !ec && it != end; it.increment(ec))
            {
                if (!it->is_regular_file(ec))
                    continue;
                auto t = modification_time(it->path());
                entries.push_back({it->path(), t ? *t : timestamp{}});
            }
            if (ec)
                return fail<std::unique_ptr<maildir_items>>(error_code::collection_unavailable,
                    ec.message(), d.string());
        }
        return std::make_unique<maildir_items>(std::move(entries));
    }

    result_void sort_by_creation_time(bool descending) override
    {
        std::stable_sort(entries_.begin(), entries_.end(), [descending](const entry& a, const entry& b) {
            if (a.created != b.created)
                return descending ? a.created > b.created : a.created < b.created;
            return a.path.filename() < b.path.filename();
        });
        return ok();
    }

    result<std::size_t> count() override
    {
        return entries_.size();
    }

    result<std::unique_ptr<item_handle>> fetch(std::size_t position) override
    {
        if (position == 0 || position > entries_.size())
            return fail<std::unique_ptr<item_handle>>(error_code::item_fetch_failed,
                "position out of range", std::to_string(position));
        const entry& e = entries_[position - 1];
        return std::make_unique<maildir_item>(e.path, e.created);
    }

private:
    std::vector<entry> entries_;
};

class maildir_folder : public folder_handle
{
public:
    maildir_folder(std::filesystem::path dir, std::filesystem::path root)
        : dir_(std::move(dir)), root_(std::move(root))
    {
    }

    [[nodiscard]] result<std::string> name() const override
    {
        return dir_.filename().string();
    }

    /// "/<store>/<relative path>", '/' separated on every platform
    [[nodiscard]] result<std::string> path() const override
    {
        std::string out = "/" + root_.filename().string();
        auto rel = relative();
        if (!rel.empty())
            out += "/" + rel;
        return out;
    }

    [[nodiscard]] result<std::string> entry_id() const override
    {
        return relative();
    }

    [[nodiscard]] result<int> object_class() const override { return folder_object_class; }
    [[nodiscard]] result<int> default_item_type() const override { return mail_item_type; }
    [[nodiscard]] result<std::string> default_message_class() const override { return std::string(note_class); }

    [[nodiscard]] result<store_info> store() const override
    {
        return store_info{root_.filename().string(), root_.string()};
    }

    result<std::size_t> subfolder_count() override
    {
        if (auto r = load_children(); !r)
            return fail<std::size_t>(r.error());
        return children_->size();
    }

    result<std::unique_ptr<folder_handle>> subfolder(std::size_t position) override
    {
        if (auto r = load_children(); !r)
            return fail<std::unique_ptr<folder_handle>>(r.error());
        if (position == 0 || position > children_->size())
            return fail<std::unique_ptr<folder_handle>>(error_code::item_fetch_failed,
                "sub-folder position out of range", std::to_string(position));
        const auto& child = (*children_)[position - 1];
        std::error_code ec;
        if (!std::filesystem::is_directory(child, ec))
            return fail<std::unique_ptr<folder_handle>>(error_code::collection_unavailable,
                "sub-folder is gone", child.string());
        return std::make_unique<maildir_folder>(child, root_);
    }

    result<std::unique_ptr<item_collection>> items() override
    {
        auto scanned = maildir_items::scan(dir_);
        if (!scanned)
            return fail<std::unique_ptr<item_collection>>(scanned.error());
        return std::unique_ptr<item_collection>(std::move(*scanned));
    }

private:
    [[nodiscard]] std::string relative() const
    {
        if (dir_ == root_)
            return {};
        return dir_.lexically_relative(root_).generic_string();
    }

    result_void load_children()
    {
        if (children_)
            return ok();
        std::vector<std::filesystem::path> dirs;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec))
        {
            if (it->is_directory(ec) && !is_maildir_subdir(it->path()))
                dirs.push_back(it->path());
        }
        if (ec)
            return fail(error_code::collection_unavailable, ec.message(), dir_.string());
        std::sort(dirs.begin(), dirs.end());
        children_ = std::move(dirs);
        return ok();
    }

    std::filesystem::path dir_;
    std::filesystem::path root_;
    std::optional<std::vector<std::filesystem::path>> children_;
};

} // namespace mailarc::maildir
