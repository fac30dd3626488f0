/*

folder/tree_builder.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Depth-first walk of a folder hierarchy into a folder_tree. Property reads
that fail leave the field at its zero value; a sub-folder that cannot be
fetched is skipped.

*/

#pragma once

#include <memory>
#include <string>
#include <utility>

#include <mailarc/detail/log.hpp>
#include <mailarc/folder/folder.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc
{

namespace detail
{

template<typename T, typename R>
void assign_if(T& field, R&& r)
{
    if (r)
        field = std::move(*r);
}

inline void read_properties(folder& node, const folder_handle& h)
{
    assign_if(node.name, h.name());
    assign_if(node.path, h.path());
    assign_if(node.entry_id, h.entry_id());
    assign_if(node.object_class, h.object_class());
    assign_if(node.default_item_type, h.default_item_type());
    assign_if(node.default_message_class, h.default_message_class());

    if (auto st = h.store())
    {
        node.store = std::move(st->display_name);
        node.store_path = std::move(st->file_path);
    }
}

inline void read_item_count(folder& node, folder_handle& h)
{
    auto items = h.items();
    if (!items)
    {
        MAILARC_DEBUG("No items for " + node.path + ": " + items.error().to_string());
        return;
    }
    if (auto n = (*items)->count())
        node.num_items = *n;
    else
        MAILARC_DEBUG("Item count for " + node.path + ": " + n.error().to_string());
}

inline std::unique_ptr<folder> build_node(std::unique_ptr<folder_handle> h, folder* parent,
    std::vector<folder*>& flat)
{
    auto node = std::make_unique<folder>();
    node->parent = parent;
    read_properties(*node, *h);
    flat.push_back(node.get());

    if (auto n = h->subfolder_count())
    {
        node->num_folders = *n;
        for (std::size_t i = 1; i <= *n; ++i)
        {
            auto sub = h->subfolder(i);
            if (!sub)
            {
                MAILARC_WARN("Skipping sub-folder " + std::to_string(i) + " of " + node->path +
                    ": " + sub.error().to_string());
                continue;
            }
            auto child = build_node(std::move(*sub), node.get(), flat);
            node->total_items += child->total_items;
            node->children.push_back(std::move(child));
        }
    }
    else
    {
        MAILARC_WARN("Cannot enumerate sub-folders of " + node->path + ": " + n.error().to_string());
    }

    read_item_count(*node, *h);
    node->total_items += node->num_items;
    node->handle = std::move(h);
    return node;
}

} // namespace detail

/**
 * Build the folder tree rooted at `root`.
 *
 * @param root    Backend handle of the top folder, owned by the returned root node.
 * @param parent  Parent to link the root to, or null for a standalone tree.
 */
[[nodiscard]] inline folder_tree build_folder_tree(std::unique_ptr<folder_handle> root,
    folder* parent = nullptr)
{
    folder_tree tree;
    tree.root = detail::build_node(std::move(root), parent, tree.flat);
    return tree;
}

} // namespace mailarc
