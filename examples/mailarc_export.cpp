/*

mailarc_export.cpp
------------------

Exports one mail folder into monthly gzip MMDF archives. On Windows the
folder comes from the running Outlook profile unless --maildir is given;
elsewhere --maildir is required.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <boost/program_options.hpp>
#include <mailarc/detail/log.hpp>
#include <mailarc/export/run.hpp>
#include <mailarc/maildir/maildir_session.hpp>
#ifdef _WIN32
#include <mailarc/outlook/outlook_session.hpp>
#endif


namespace po = boost::program_options;
using std::cout;
using std::endl;


static mailarc::result<std::unique_ptr<mailarc::session>> open_session(const po::variables_map& vm)
{
    if (vm.count("maildir"))
        return std::make_unique<mailarc::maildir::maildir_session>(vm["maildir"].as<std::string>());
#ifdef _WIN32
    auto s = mailarc::outlook::outlook_session::create();
    if (!s)
        return mailarc::fail<std::unique_ptr<mailarc::session>>(s.error());
    return std::unique_ptr<mailarc::session>(std::move(*s));
#else
    return mailarc::fail<std::unique_ptr<mailarc::session>>(mailarc::error_code::invalid_argument,
        "--maildir is required on this platform");
#endif
}


int main(int argc, char* argv[])
{
    mailarc::run_config cfg;
    std::string start_date;
    std::string end_date;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help")
        ("list", po::bool_switch(&cfg.list_folders), "list folders")
        ("ab", po::bool_switch(&cfg.use_address_book), "use addressbook to translate email address")
        ("folder", po::value(&cfg.folder_name), "folder name to save")
        ("dir", po::value<std::string>()->default_value("."), "target directory to save")
        ("count", po::value(&cfg.max_count)->default_value(1000), "total emails to save")
        ("startdate", po::value(&start_date), "start date of emails to save (e.g., 20060102)")
        ("enddate", po::value(&end_date), "end date of emails to save (e.g., 20060102)")
        ("retries", po::value(&cfg.engine.fetch_retry_limit)->default_value(3),
            "attempts to re-fetch an unreadable item before stopping")
        ("maildir", po::value<std::string>(), "export from a Maildir tree instead of Outlook")
        ("verbose,v", "debug logging");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& exc)
    {
        std::cerr << exc.what() << "\n" << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help"))
    {
        cout << desc << endl;
        return EXIT_SUCCESS;
    }
    if (vm.count("verbose"))
        mailarc::log::logger::instance().set_level(mailarc::log::level::debug);

    cfg.target_directory = vm["dir"].as<std::string>();
    if (!start_date.empty())
        cfg.start_date = start_date;
    if (!end_date.empty())
        cfg.end_date = end_date;

    auto sess = open_session(vm);
    if (!sess)
    {
        MAILARC_FATAL("Session: " + sess.error().to_string());
        return EXIT_FAILURE;
    }

    auto summary = mailarc::run_export(**sess, cfg);
    if (!summary)
    {
        MAILARC_ERROR(summary.error().to_string());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
