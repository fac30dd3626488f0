/*

test_maildir.cpp
----------------

Maildir backend: folder enumeration, headers, ordering by modification time
and an export from disk.

*/

#define BOOST_TEST_MODULE maildir_test

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailarc/archive/frame.hpp>
#include <mailarc/export/run.hpp>
#include <mailarc/folder/tree_builder.hpp>
#include <mailarc/maildir/maildir_session.hpp>
#include <mailarc/maildir/maildir_store.hpp>
#include "fake_mailbox.hpp"

using mailarc::maildir::maildir_session;
using mailarc::maildir::read_header;
using fake::day;

static std::filesystem::path put_message(const std::filesystem::path& dir, const std::string& name,
    const std::string& content, mailarc::timestamp mtime)
{
    std::filesystem::create_directories(dir);
    auto file = dir / name;
    std::ofstream(file, std::ios::binary) << content;
    std::filesystem::last_write_time(file, std::chrono::file_clock::from_sys(mtime));
    return file;
}

static void make_box(const std::filesystem::path& dir)
{
    for (const char* sub : {"cur", "new", "tmp"})
        std::filesystem::create_directories(dir / sub);
}

/// root/{Inbox/{Work}, Sent}, messages spread over cur/ and new/
static std::filesystem::path sample_store()
{
    auto root = fake::make_temp_dir("maildir") / "store";
    make_box(root);
    make_box(root / "Inbox");
    make_box(root / "Inbox" / "Work");
    make_box(root / "Sent");

    put_message(root / "Inbox" / "cur", "2.host:2,S", "Subject: second\r\n\r\nB\r\n", day(2023, 1, 20));
    put_message(root / "Inbox" / "new", "3.host", "Subject: third\r\n\r\nC\r\n", day(2023, 2, 2));
    put_message(root / "Inbox" / "cur", "1.host:2,S", "Subject: first\r\n\r\nA\r\n", day(2023, 1, 5));
    put_message(root / "Inbox" / "Work" / "cur", "w.host:2,", "Subject: w\r\n\r\nW\r\n", day(2022, 7, 1));
    return root;
}


BOOST_AUTO_TEST_CASE(header_lookup_unfolds_and_stops_at_body)
{
    auto dir = fake::make_temp_dir("maildir_header");
    auto file = put_message(dir, "m",
        "From: a@example.com\r\n"
        "subject: a long\r\n"
        "\tfolded line\r\n"
        "X-Other: y\r\n"
        "\r\n"
        "Subject: not a header\r\n",
        day(2023, 1, 1));

    auto s = read_header(file, "Subject");
    BOOST_REQUIRE(s.has_value());
    BOOST_TEST(*s == "a long folded line");
    BOOST_CHECK(!read_header(file, "Date").has_value());
    BOOST_CHECK(!read_header(dir / "absent", "Subject").has_value());

    std::filesystem::remove_all(dir);
}


BOOST_AUTO_TEST_CASE(directories_become_folders)
{
    auto root = sample_store();
    maildir_session sess(root);

    auto handle = sess.root_folder();
    BOOST_REQUIRE(handle.has_value());
    auto tree = mailarc::build_folder_tree(std::move(*handle));

    BOOST_REQUIRE_EQUAL(tree.size(), 4u);
    BOOST_TEST(tree.flat[0]->name == "store");
    BOOST_TEST(tree.flat[1]->name == "Inbox");
    BOOST_TEST(tree.flat[2]->name == "Work");
    BOOST_TEST(tree.flat[3]->name == "Sent");
    BOOST_TEST(tree.flat[2]->path == "/store/Inbox/Work");
    BOOST_TEST(tree.flat[2]->entry_id == "Inbox/Work");
    BOOST_TEST(tree.flat[1]->store == "store");
    BOOST_TEST(tree.flat[1]->default_message_class == "IPM.Note");

    BOOST_TEST(tree.flat[1]->num_items == 3u);
    BOOST_TEST(tree.flat[1]->total_items == 4u);
    BOOST_TEST(tree.root->total_items == 4u);
    BOOST_TEST(tree.root->num_folders == 2u);

    std::filesystem::remove_all(root.parent_path());
}


BOOST_AUTO_TEST_CASE(items_sort_by_modification_time)
{
    auto root = sample_store();
    maildir_session sess(root);
    auto handle = sess.root_folder();
    BOOST_REQUIRE(handle.has_value());
    auto tree = mailarc::build_folder_tree(std::move(*handle));

    auto items = tree.find("Inbox")->handle->items();
    BOOST_REQUIRE(items.has_value());
    BOOST_REQUIRE((*items)->sort_by_creation_time());

    std::vector<std::string> subjects;
    for (std::size_t i = 1; i <= 3; ++i)
    {
        auto it = (*items)->fetch(i);
        BOOST_REQUIRE(it.has_value());
        subjects.push_back(*(*it)->subject());
    }
    BOOST_TEST(subjects == (std::vector<std::string>{"first", "second", "third"}));
    BOOST_CHECK(!(*items)->fetch(4).has_value());
    BOOST_CHECK(!(*items)->fetch(0).has_value());

    std::filesystem::remove_all(root.parent_path());
}


BOOST_AUTO_TEST_CASE(export_copies_files_verbatim)
{
    auto root = sample_store();
    auto out = root.parent_path() / "out";
    maildir_session sess(root);

    auto summary = mailarc::run_export(sess, mailarc::run_config::export_folder("Inbox", out));
    BOOST_REQUIRE_MESSAGE(summary.has_value(), (summary ? std::string() : summary.error().to_string()));
    BOOST_TEST(summary->stats.saved == 3u);

    auto jan = mailarc::archive::frame_reader(out / "Inbox_202301.mmdf.gz").frames();
    BOOST_REQUIRE(jan.has_value());
    BOOST_REQUIRE_EQUAL(jan->size(), 2u);
    BOOST_TEST((*jan)[0] == "Subject: first\r\n\r\nA\r\n");
    BOOST_TEST((*jan)[1] == "Subject: second\r\n\r\nB\r\n");

    auto feb = mailarc::archive::frame_reader(out / "Inbox_202302.mmdf.gz").frames();
    BOOST_REQUIRE(feb.has_value());
    BOOST_TEST(feb->size() == 1u);

    std::filesystem::remove_all(root.parent_path());
}


BOOST_AUTO_TEST_CASE(session_rejects_missing_root_and_address_book)
{
    maildir_session sess(fake::make_temp_dir("maildir_none") / "absent");
    auto handle = sess.root_folder();
    BOOST_REQUIRE(!handle.has_value());
    BOOST_CHECK(handle.error().is(mailarc::error_code::initialization_failed));

    auto conv = sess.make_converter();
    BOOST_REQUIRE(conv.has_value());
    auto ab = sess.attach_address_book(**conv);
    BOOST_CHECK(ab.error().is(mailarc::error_code::address_book_unavailable));
}
