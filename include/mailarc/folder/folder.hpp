/*

folder/folder.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <mailarc/detail/log.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc
{

/**
 * Snapshot of one mailbox folder, built once per run.
 *
 * Invariant: total_items == num_items + sum of the children's total_items.
 */
struct folder
{
    std::string entry_id;
    std::string name;
    std::string path;

    folder* parent = nullptr;                          ///< Not owning
    std::vector<std::unique_ptr<folder>> children;

    std::size_t num_folders = 0;                       ///< As reported by the backend
    std::size_t num_items = 0;
    std::size_t total_items = 0;

    std::string store;
    std::string store_path;

    int default_item_type = 0;
    std::string default_message_class;
    int object_class = 0;

    std::unique_ptr<folder_handle> handle;
};

/**
 * Result of a tree build: the owned root and every node in depth-first
 * pre-order, root first.
 */
struct folder_tree
{
    std::unique_ptr<folder> root;
    std::vector<folder*> flat;

    /// First node whose display name matches, in traversal order
    [[nodiscard]] folder* find(std::string_view name) const noexcept
    {
        for (folder* f : flat)
        {
            if (f->name == name)
                return f;
        }
        return nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept { return flat.size(); }

    /// One log line per node: "index: name path (total)"
    void list() const
    {
        for (std::size_t i = 0; i < flat.size(); ++i)
        {
            const folder& f = *flat[i];
            MAILARC_INFO(std::to_string(i) + ": " + f.name + " " + f.path +
                " (" + std::to_string(f.total_items) + ")");
        }
    }
};

} // namespace mailarc
