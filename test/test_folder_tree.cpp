/*

test_folder_tree.cpp
--------------------

Folder tree construction: aggregated totals, traversal order, lookup and
partial failures.

*/

#define BOOST_TEST_MODULE folder_tree_test

#include <functional>
#include <string>
#include <boost/test/unit_test.hpp>
#include <mailarc/folder/tree_builder.hpp>
#include "fake_mailbox.hpp"

using mailarc::build_folder_tree;
using mailarc::folder;

static fake::folder_spec sample_tree()
{
    fake::folder_spec root{.name = "Personal"};
    root.extra_items = 1;

    auto& inbox = root.add({.name = "Inbox"});
    inbox.extra_items = 3;
    auto& work = inbox.add({.name = "Work"});
    work.extra_items = 5;
    auto& deep = work.add({.name = "Archive"});
    deep.extra_items = 7;

    auto& sent = root.add({.name = "Sent"});
    sent.extra_items = 2;
    return root;
}

static void check_totals(const folder& f)
{
    std::size_t sum = f.num_items;
    for (const auto& c : f.children)
    {
        BOOST_CHECK(c->parent == &f);
        check_totals(*c);
        sum += c->total_items;
    }
    BOOST_TEST(f.total_items == sum);
}


BOOST_AUTO_TEST_CASE(totals_aggregate_recursively)
{
    auto tree = build_folder_tree(std::make_unique<fake::folder>(sample_tree(), ""));

    BOOST_REQUIRE(tree.root);
    check_totals(*tree.root);
    BOOST_TEST(tree.root->num_items == 1u);
    BOOST_TEST(tree.root->total_items == 18u);
    BOOST_TEST(tree.root->num_folders == 2u);
    BOOST_CHECK(tree.root->parent == nullptr);
}


BOOST_AUTO_TEST_CASE(flat_list_is_depth_first_preorder)
{
    auto tree = build_folder_tree(std::make_unique<fake::folder>(sample_tree(), ""));

    BOOST_REQUIRE_EQUAL(tree.size(), 5u);
    BOOST_TEST(tree.flat[0]->name == "Personal");
    BOOST_TEST(tree.flat[1]->name == "Inbox");
    BOOST_TEST(tree.flat[2]->name == "Work");
    BOOST_TEST(tree.flat[3]->name == "Archive");
    BOOST_TEST(tree.flat[4]->name == "Sent");
    BOOST_TEST(tree.flat[3]->path == "\\Personal\\Inbox\\Work\\Archive");
    BOOST_TEST(tree.flat[3]->total_items == 7u);
    BOOST_TEST(tree.flat[1]->total_items == 15u);
}


BOOST_AUTO_TEST_CASE(find_returns_first_match_with_handle)
{
    auto spec = sample_tree();
    spec.children[1].add({.name = "Work"}).extra_items = 4;
    auto tree = build_folder_tree(std::make_unique<fake::folder>(spec, ""));

    folder* work = tree.find("Work");
    BOOST_REQUIRE(work != nullptr);
    BOOST_TEST(work->parent->name == "Inbox");
    BOOST_CHECK(work->handle != nullptr);
    BOOST_CHECK(tree.find("Drafts") == nullptr);
}


BOOST_AUTO_TEST_CASE(unfetchable_subfolder_is_skipped)
{
    auto spec = sample_tree();
    spec.children[0].fetchable = false;
    fake::log_capture logs;

    auto tree = build_folder_tree(std::make_unique<fake::folder>(spec, ""));

    BOOST_TEST(tree.size() == 2u);
    BOOST_TEST(tree.root->children.size() == 1u);
    BOOST_TEST(tree.root->num_folders == 2u);
    BOOST_TEST(tree.root->total_items == 3u);
    BOOST_CHECK(tree.find("Work") == nullptr);
    BOOST_CHECK(logs.contains("Skipping sub-folder 1"));
    check_totals(*tree.root);
}


BOOST_AUTO_TEST_CASE(unenumerable_children_leave_node_counted)
{
    auto spec = sample_tree();
    spec.children[0].enumerable = false;
    fake::log_capture logs;

    auto tree = build_folder_tree(std::make_unique<fake::folder>(spec, ""));

    folder* inbox = tree.find("Inbox");
    BOOST_REQUIRE(inbox != nullptr);
    BOOST_TEST(inbox->children.empty());
    BOOST_TEST(inbox->num_folders == 0u);
    BOOST_TEST(inbox->total_items == 3u);
    BOOST_TEST(tree.root->total_items == 6u);
    BOOST_CHECK(logs.contains("Cannot enumerate sub-folders"));
}


BOOST_AUTO_TEST_CASE(unreadable_properties_stay_empty)
{
    auto spec = sample_tree();
    spec.children[1].has_name = false;

    auto tree = build_folder_tree(std::make_unique<fake::folder>(spec, ""));

    BOOST_REQUIRE_EQUAL(tree.size(), 5u);
    const folder& sent = *tree.flat[4];
    BOOST_TEST(sent.name.empty());
    BOOST_TEST(sent.store.empty());
    BOOST_TEST(sent.store_path.empty());
    BOOST_TEST(sent.entry_id == "EID:Sent");
    BOOST_TEST(sent.object_class == 2);
    BOOST_TEST(sent.default_message_class == "IPM.Note");
    BOOST_TEST(sent.total_items == 2u);
}


BOOST_AUTO_TEST_CASE(list_logs_one_line_per_folder)
{
    auto tree = build_folder_tree(std::make_unique<fake::folder>(sample_tree(), ""));
    fake::log_capture logs;

    tree.list();

    BOOST_REQUIRE_EQUAL(logs.lines.size(), 5u);
    BOOST_TEST(logs.lines[0] == "0: Personal \\Personal (18)");
    BOOST_TEST(logs.lines[3] == "3: Archive \\Personal\\Inbox\\Work\\Archive (7)");
}
