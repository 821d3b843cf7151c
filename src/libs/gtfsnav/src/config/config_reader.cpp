// Copyright 2018, University of Freiburg,
// Chair of Algorithms and Data Structures.
// Authors: Patrick Brosi <brosi@informatik.uni-freiburg.de>

#include <gtfsnav/config/config_reader.h>

#include <exceptions/exceptions.h>

#include <getopt.h>
#include <iomanip>
#include <string>

#ifndef GTFSNAV_VERSION
#define GTFSNAV_VERSION "unknown"
#endif

namespace gtfsnav::config
{

// _____________________________________________________________________________
void config_reader::help(const char* bin, std::ostream& out)
{
    out << std::setfill(' ') << std::left << "gtfsnav GTFS schedule navigator " << GTFSNAV_VERSION << "\n\n"
        << "Usage: " << bin << " [options] <GTFS FEED DIR>\n\n"
        << "Allowed options:\n\n"
        << "General:\n"
        << std::setw(35) << "  -v [ --version ]"
        << "print version\n"
        << std::setw(35) << "  -h [ --help ]"
        << "show this help message\n"
        << "\nInput:\n"
        << std::setw(35) << "  -i [ --input ] arg"
        << "unpacked GTFS feed directory, may also be\n"
        << std::setw(35) << " "
        << "  given as positional parameter\n"
        << std::setw(35) << "  -e [ --execute ] arg"
        << "run command <arg> and exit, may be repeated\n"
        << "\nOutput:\n"
        << std::setw(35) << "  -l [ --log-level ] arg (=info)"
        << "trace, debug, info, warn, error,\n"
        << std::setw(35) << " "
        << "  critical or off\n"
        << std::setw(35) << "  -L [ --log-file ] arg"
        << "also write the log to <arg>\n"
        << std::setw(35) << "  --no-color"
        << "do not color route names\n"
        << "\nCommands:\n"
        << "  info | (routes|stops|trips).(list|info|<id>.<command>)\n"
        << "  e.g. stops.STAGECOACH.routes.list\n";
}

// _____________________________________________________________________________
void config_reader::version(std::ostream& out)
{
    out << "gtfsnav " << GTFSNAV_VERSION << " (built " << __DATE__ << " " << __TIME__ << ")\n";
}

config_reader::config_reader(config& cfg) :
    config_{cfg}
{
}

// _____________________________________________________________________________
void config_reader::read(int argc, char** argv)
{
    struct option ops[] = {{"input", required_argument, nullptr, 'i'},
                           {"execute", required_argument, nullptr, 'e'},
                           {"log-level", required_argument, nullptr, 'l'},
                           {"log-file", required_argument, nullptr, 'L'},
                           {"no-color", no_argument, nullptr, 1},
                           {"version", no_argument, nullptr, 'v'},
                           {"help", no_argument, nullptr, 'h'},
                           {nullptr, 0, nullptr, 0}};

    std::vector<std::string> feed_paths;

    // 0 makes glibc reinitialize its scanning state
    optind = 0;
    int c = 0;
    while ((c = getopt_long(argc, argv, ":hvi:e:l:L:", ops, nullptr)) != -1)
    {
        switch (c)
        {
            case 1:
                config_.use_color = false;
                break;
            case 'i':
                feed_paths.emplace_back(optarg);
                break;
            case 'e':
                config_.commands.emplace_back(optarg);
                break;
            case 'l':
                if (!logging::from_string(optarg, config_.log_level))
                    throw make_exception_macro(invalid_parameter_exception,
                                               std::string("unknown log level ") + optarg);
                break;
            case 'L':
                config_.log_file = optarg;
                break;
            case 'v':
                config_.show_version = true;
                break;
            case 'h':
                config_.show_help = true;
                break;
            case ':':
                throw make_exception_macro(invalid_parameter_exception,
                                           std::string(argv[optind - 1]) + " requires an argument");
            case '?':
                throw make_exception_macro(invalid_parameter_exception,
                                           std::string(argv[optind - 1]) + " option unknown");
            default:
                throw make_exception_macro(invalid_parameter_exception, "error while parsing arguments");
        }
    }

    for (int i = optind; i < argc; i++)
        feed_paths.emplace_back(argv[i]);

    if (feed_paths.size() > 1)
        throw make_exception_macro(invalid_parameter_exception, "only one feed directory may be given");

    if (!feed_paths.empty())
        config_.feed_path = feed_paths.front();
}
}  // namespace gtfsnav::config
