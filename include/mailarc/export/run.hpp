/*

export/run.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

One complete export run against a session: folder tree, folder lookup,
window resolution, export loop.

*/

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <mailarc/archive/archive_writer.hpp>
#include <mailarc/detail/log.hpp>
#include <mailarc/detail/result.hpp>
#include <mailarc/export/export_engine.hpp>
#include <mailarc/folder/tree_builder.hpp>
#include <mailarc/search/date_range.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc
{

/**
 * Configuration of an export run.
 */
struct run_config
{
    /// Display name of the folder to export; empty exports nothing
    std::string folder_name;

    /// Directory receiving the archives, created when missing
    std::filesystem::path target_directory = ".";

    /// Upper bound on the number of items walked
    std::size_t max_count = 1000;

    /// YYYYMMDD, inclusive
    std::optional<std::string> start_date;

    /// YYYYMMDD
    std::optional<std::string> end_date;

    /// Resolve addresses through the session's address book during conversion
    bool use_address_book = false;

    /// Log every folder of the tree before exporting
    bool list_folders = false;

    std::string archive_extension = std::string(archive::default_extension);

    export_options engine;

    // ==================== Factory Methods ====================

    /// Only print the folder tree
    static run_config list_only()
    {
        run_config cfg;
        cfg.list_folders = true;
        return cfg;
    }

    /// Export up to `count` items of `folder` into `dir`
    static run_config export_folder(std::string folder, std::filesystem::path dir, std::size_t count = 1000)
    {
        run_config cfg;
        cfg.folder_name = std::move(folder);
        cfg.target_directory = std::move(dir);
        cfg.max_count = count;
        return cfg;
    }
};

struct run_summary
{
    std::size_t folders = 0;                 ///< Nodes in the folder tree
    std::size_t total_items = 0;             ///< Items in the exported folder
    export_window window;
    export_stats stats;
    std::vector<std::filesystem::path> files;
};

/**
 * Execute one run. Initialization, lookup and I/O faults are returned as
 * errors; per-item faults only show up in the summary's stats.
 */
[[nodiscard]] inline result<run_summary> run_export(session& sess, const run_config& cfg)
{
    MAILARC_INFO(sess.describe());

    auto conv = sess.make_converter();
    if (!conv)
        return fail<run_summary>(conv.error());
    auto stream = sess.make_stream_buffer();
    if (!stream)
        return fail<run_summary>(stream.error());

    auto root = sess.root_folder();
    if (!root)
        return fail<run_summary>(root.error());

    run_summary summary;
    folder_tree tree = build_folder_tree(std::move(*root));
    summary.folders = tree.size();
    if (cfg.list_folders)
        tree.list();

    if (cfg.folder_name.empty())
        return summary;

    folder* target = tree.find(cfg.folder_name);
    if (target == nullptr || !target->handle)
    {
        MAILARC_ERROR("Folder " + cfg.folder_name + " not found");
        return fail<run_summary>(error_code::folder_not_found, "folder not found", cfg.folder_name);
    }

    if (cfg.use_address_book)
    {
        if (auto r = sess.attach_address_book(**conv); !r)
            MAILARC_WARN("Address book not attached: " + r.error().to_string());
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.target_directory, ec);
    if (ec)
    {
        MAILARC_ERROR("Failed to make dir for " + cfg.target_directory.string() + ": " + ec.message());
        return fail<run_summary>(error_code::directory_creation_failed, ec.message(),
            cfg.target_directory.string());
    }

    auto items = target->handle->items();
    if (!items)
        return fail<run_summary>(items.error());
    if (auto r = (*items)->sort_by_creation_time(); !r)
        MAILARC_WARN("Sort by creation time failed, date bounds may be wrong: " + r.error().to_string());
    auto total = (*items)->count();
    if (!total)
        return fail<run_summary>(total.error());
    summary.total_items = *total;

    window_options wopts;
    wopts.max_count = cfg.max_count;
    wopts.start_date = cfg.start_date;
    wopts.end_date = cfg.end_date;
    summary.window = resolve_window(**items, *total, wopts);
    MAILARC_INFO("Folder " + target->name + ": total " + std::to_string(*total) + " items, from: " +
        std::to_string(summary.window.start) + ", to: " + std::to_string(summary.window.end) +
        ", count: " + std::to_string(summary.window.size()));

    archive::archive_writer writer(cfg.target_directory, target->name, cfg.archive_extension);
    export_engine engine(**conv, **stream, writer, cfg.engine);
    auto outcome = engine.run(**items, *total, summary.window);

    summary.stats = engine.stats();
    summary.files = writer.files();
    MAILARC_INFO(std::to_string(summary.stats.saved) + " emails saved");

    if (!outcome)
        return fail<run_summary>(outcome.error());
    return summary;
}

} // namespace mailarc
