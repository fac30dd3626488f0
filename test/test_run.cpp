/*

test_run.cpp
------------

Complete export runs against an in-memory session.

*/

#define BOOST_TEST_MODULE run_test

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailarc/archive/frame.hpp>
#include <mailarc/export/run.hpp>
#include "fake_mailbox.hpp"

using mailarc::run_config;
using mailarc::run_export;
using mailarc::archive::frame_reader;
using fake::day;
using fake::mail;

namespace
{

fake::folder_spec personal()
{
    fake::folder_spec root{.name = "Personal"};
    auto& inbox = root.add({.name = "Inbox"});
    // deliberately out of order; the run sorts by creation time
    inbox.mails = {
        mail("c", day(2023, 2, 2), "C"),
        mail("a", day(2023, 1, 5), "A"),
        mail("b", day(2023, 1, 20), "B"),
    };
    root.add({.name = "Sent"}).extra_items = 4;
    return root;
}

std::vector<std::string> frames_of(const std::filesystem::path& p)
{
    auto frames = frame_reader(p).frames();
    BOOST_REQUIRE_MESSAGE(frames.has_value(), (frames ? std::string() : frames.error().to_string()));
    return *frames;
}

} // namespace


BOOST_AUTO_TEST_CASE(exports_sorted_folder_into_monthly_archives)
{
    auto dir = fake::make_temp_dir("run");
    fake::session sess(personal());
    fake::log_capture logs;

    auto summary = run_export(sess, run_config::export_folder("Inbox", dir));
    BOOST_REQUIRE_MESSAGE(summary.has_value(), (summary ? std::string() : summary.error().to_string()));

    BOOST_TEST(summary->folders == 3u);
    BOOST_TEST(summary->total_items == 3u);
    BOOST_TEST(summary->window.start == 0u);
    BOOST_TEST(summary->window.end == 1000u);
    BOOST_TEST(summary->stats.saved == 3u);
    BOOST_REQUIRE_EQUAL(summary->files.size(), 2u);
    BOOST_TEST(frames_of(dir / "Inbox_202301.mmdf.gz") == (std::vector<std::string>{"A", "B"}));
    BOOST_TEST(frames_of(dir / "Inbox_202302.mmdf.gz") == std::vector<std::string>{"C"});
    BOOST_CHECK(logs.contains("fake session"));
    BOOST_CHECK(logs.contains("Folder Inbox: total 3 items, from: 0, to: 1000, count: 1000"));
    BOOST_CHECK(logs.contains("3 emails saved"));

    std::filesystem::remove_all(dir);
}


BOOST_AUTO_TEST_CASE(start_date_skips_earlier_items)
{
    auto dir = fake::make_temp_dir("run_start");
    fake::session sess(personal());

    auto cfg = run_config::export_folder("Inbox", dir);
    cfg.start_date = "20230115";
    auto summary = run_export(sess, cfg);
    BOOST_REQUIRE(summary.has_value());

    BOOST_TEST(summary->window.start == 1u);
    BOOST_TEST(summary->stats.saved == 2u);
    BOOST_TEST(frames_of(dir / "Inbox_202301.mmdf.gz") == std::vector<std::string>{"B"});
    BOOST_TEST(frames_of(dir / "Inbox_202302.mmdf.gz") == std::vector<std::string>{"C"});

    std::filesystem::remove_all(dir);
}


BOOST_AUTO_TEST_CASE(end_date_and_count_bound_the_window)
{
    auto dir = fake::make_temp_dir("run_end");
    fake::session sess(personal());

    auto cfg = run_config::export_folder("Inbox", dir, 10);
    cfg.end_date = "20230131";
    auto summary = run_export(sess, cfg);
    BOOST_REQUIRE(summary.has_value());
    BOOST_TEST(summary->window.end == 2u);
    BOOST_TEST(summary->stats.saved == 2u);
    BOOST_TEST(summary->files.size() == 1u);

    cfg.end_date.reset();
    cfg.max_count = 1;
    summary = run_export(sess, cfg);
    BOOST_REQUIRE(summary.has_value());
    BOOST_TEST(summary->stats.saved == 1u);
    BOOST_TEST(frames_of(dir / "Inbox_202301.mmdf.gz") == std::vector<std::string>{"A"});

    std::filesystem::remove_all(dir);
}


BOOST_AUTO_TEST_CASE(unknown_folder_fails)
{
    auto dir = fake::make_temp_dir("run_missing");
    fake::session sess(personal());
    fake::log_capture logs;

    auto summary = run_export(sess, run_config::export_folder("Drafts", dir));
    BOOST_REQUIRE(!summary.has_value());
    BOOST_CHECK(summary.error().is(mailarc::error_code::folder_not_found));
    BOOST_CHECK(logs.contains("Folder Drafts not found"));
    BOOST_TEST(std::filesystem::is_empty(dir));

    std::filesystem::remove_all(dir);
}


BOOST_AUTO_TEST_CASE(list_only_lists_and_exports_nothing)
{
    fake::session sess(personal());
    fake::log_capture logs;

    auto summary = run_export(sess, run_config::list_only());
    BOOST_REQUIRE(summary.has_value());
    BOOST_TEST(summary->folders == 3u);
    BOOST_TEST(summary->stats.saved == 0u);
    BOOST_TEST(summary->files.empty());
    BOOST_CHECK(logs.contains("0: Personal \\Personal (7)"));
    BOOST_CHECK(logs.contains("2: Sent \\Personal\\Sent (4)"));
    BOOST_CHECK(!logs.contains("emails saved"));
}


BOOST_AUTO_TEST_CASE(address_book_is_attached_only_on_request)
{
    auto dir = fake::make_temp_dir("run_ab");
    fake::session sess(personal());

    auto cfg = run_config::export_folder("Inbox", dir);
    BOOST_REQUIRE(run_export(sess, cfg));
    BOOST_TEST(sess.address_book_attached == 0u);

    cfg.use_address_book = true;
    BOOST_REQUIRE(run_export(sess, cfg));
    BOOST_TEST(sess.address_book_attached == 1u);

    std::filesystem::remove_all(dir);
}


BOOST_AUTO_TEST_CASE(target_directory_is_created)
{
    auto base = fake::make_temp_dir("run_mkdir");
    auto dir = base / "archives" / "2023";
    fake::session sess(personal());

    auto summary = run_export(sess, run_config::export_folder("Inbox", dir));
    BOOST_REQUIRE(summary.has_value());
    BOOST_CHECK(std::filesystem::is_directory(dir));
    BOOST_CHECK(std::filesystem::exists(dir / "Inbox_202301.mmdf.gz"));

    std::filesystem::remove_all(base);
}


BOOST_AUTO_TEST_CASE(uncreatable_target_directory_fails)
{
    auto base = fake::make_temp_dir("run_mkdir_fail");
    std::ofstream(base / "plain") << "not a directory";
    fake::session sess(personal());
    fake::log_capture logs;

    auto summary = run_export(sess, run_config::export_folder("Inbox", base / "plain" / "sub"));
    BOOST_REQUIRE(!summary.has_value());
    BOOST_CHECK(summary.error().is(mailarc::error_code::directory_creation_failed));
    BOOST_CHECK(logs.contains("Failed to make dir"));

    std::filesystem::remove_all(base);
}
