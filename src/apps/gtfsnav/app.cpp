#include "app.h"

#include <gtfs/access/feed_reader.h>
#include <gtfsnav/commands/execute.h>
#include <gtfsnav/config/config_reader.h>

#include <logging/logger.h>
#include <logging/scoped_timer.h>

#include <iostream>
#include <unistd.h>

using namespace gtfsnav;

namespace
{
const char* const prompt = "gtfsnav> ";

class load_progress : public gtfs::access::event_handler
{
public:
    void on_file_opened(const std::string& filename) override
    {
        LOG(INFO) << "Reading " << filename << " ...";
    }

    void on_table_loaded(const std::string& filename, size_t record_count) override
    {
        LOG(INFO) << "Read " << record_count << " records from " << filename;
    }
};

void print_session_help(std::ostream& out)
{
    out << "Commands are dot separated paths, evaluated against the whole feed:\n"
        << "  info                              counts of the current selection\n"
        << "  routes.list | stops.list | trips.list\n"
        << "  routes.info | stops.info | trips.info\n"
        << "  routes.<id>.<command>             <command> on the projection of a route\n"
        << "  stops.<id>.<command>              ... of a stop and its descendants\n"
        << "  trips.<id>.<command>              ... of a trip\n"
        << "  help                              this text\n"
        << "  quit | exit                       leave\n"
        << "Example: stops.STAGECOACH.routes.CITY.trips.list\n";
}

std::string trim(const std::string& line)
{
    static const std::string whitespace = " \t\r\n";
    const auto first = line.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return {};
    return line.substr(first, line.find_last_not_of(whitespace) - first + 1);
}

config::config read_config(int argc, char* argv[])
{
    config::config cfg;
    config::config_reader reader(cfg);
    reader.read(argc, argv);
    return cfg;
}
}

app::app(int argc, char* argv[]) :
    bin_(argv[0]),
    cfg_(read_config(argc, argv)),
    printer_(std::cout, cfg_.use_color && isatty(STDOUT_FILENO))
{
}

ret_code app::run()
{
    if (cfg_.show_help)
    {
        config::config_reader::help(bin_.c_str(), std::cout);
        return ret_code::SUCCESS;
    }
    if (cfg_.show_version)
    {
        config::config_reader::version(std::cout);
        return ret_code::SUCCESS;
    }

    logging::configure_logging({cfg_.log_level, cfg_.log_file, cfg_.use_color});
    LOG(DEBUG) << "Configured options:\n" << cfg_.to_string();

    if (cfg_.feed_path.empty())
    {
        LOG(ERROR) << "No input feed specified, see --help.";
        return ret_code::NO_INPUT_FEED;
    }

    gtfs::schedule feed;
    if (auto res = load_feed(feed); res != ret_code::SUCCESS)
        return res;

    const auto root = navigation::node::make_root(std::move(feed));
    if (cfg_.batch_mode())
        return run_batch(root);

    return run_session(root, std::cin);
}

ret_code app::load_feed(gtfs::schedule& feed) const
{
    logging::scoped_timer timer("loading " + cfg_.feed_path);

    load_progress progress;
    gtfs::access::feed_reader reader(feed, cfg_.feed_path, &progress);
    if (auto res = reader.read({}); res != gtfs::access::result_code::OK)
    {
        LOG(ERROR) << "Could not parse input GTFS feed (" << gtfs::access::to_string(res.code)
                   << "), reason was:";
        LOG(ERROR) << res.message;
        return ret_code::GTFS_PARSE_ERR;
    }

    LOG(INFO) << "Loaded " << feed.stops.size() << " stops, " << feed.routes.size() << " routes, "
              << feed.trips.size() << " trips and " << feed.stop_time_count() << " stop times";
    return ret_code::SUCCESS;
}

ret_code app::run_batch(const navigation::node::ptr& root)
{
    for (const auto& command : cfg_.commands)
    {
        if (!execute(root, command))
            return ret_code::COMMAND_FAILED;
    }
    std::cout.flush();
    return ret_code::SUCCESS;
}

ret_code app::run_session(const navigation::node::ptr& root, std::istream& in)
{
    const bool interactive = isatty(STDIN_FILENO);
    std::string line;
    while (true)
    {
        if (interactive)
            std::cout << prompt << std::flush;

        if (!std::getline(in, line))
            break;

        const std::string command = trim(line);
        if (command.empty())
            continue;
        if (command == "quit" || command == "exit")
            break;
        if (command == "help")
        {
            print_session_help(std::cout);
            continue;
        }

        execute(root, command);
        std::cout.flush();
    }
    return ret_code::SUCCESS;
}

bool app::execute(const navigation::node::ptr& root, const std::string& line)
{
    return commands::execute(root, line, printer_, std::cerr);
}
