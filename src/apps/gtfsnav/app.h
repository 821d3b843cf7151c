#ifndef GTFSNAV_APP_H
#define GTFSNAV_APP_H

#include <gtfs/schedule.h>
#include <gtfsnav/commands/printer.h>
#include <gtfsnav/config/config.h>
#include <gtfsnav/navigation/node.h>

#include <istream>
#include <ostream>
#include <string>

enum class ret_code
{
    SUCCESS = 0,
    NO_INPUT_FEED = 1,
    INVALID_OPTION = 2,
    GTFS_PARSE_ERR = 3,
    COMMAND_FAILED = 4
};

class app
{
public:
    // Throws invalid_parameter_exception for a bad command line.
    app(int argc, char* argv[]);
    ret_code run();

private:
    ret_code load_feed(gtfsnav::gtfs::schedule& feed) const;
    ret_code run_batch(const gtfsnav::navigation::node::ptr& root);
    ret_code run_session(const gtfsnav::navigation::node::ptr& root, std::istream& in);
    bool execute(const gtfsnav::navigation::node::ptr& root, const std::string& line);

    std::string bin_;
    gtfsnav::config::config cfg_;
    gtfsnav::commands::printer printer_;
};


#endif//GTFSNAV_APP_H
