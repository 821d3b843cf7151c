// Copyright 2018, University of Freiburg,
// Chair of Algorithms and Data Structures.
// Authors: Patrick Brosi <brosi@informatik.uni-freiburg.de>

#ifndef GTFSNAV_CONFIG_CONFIG_H_
#define GTFSNAV_CONFIG_CONFIG_H_

#include <logging/level.h>

#include <sstream>
#include <string>
#include <vector>

namespace gtfsnav::config
{

struct config
{
    std::string feed_path;
    // commands given with -e, run in order instead of the interactive prompt
    std::vector<std::string> commands;
    logging::log_level log_level{logging::info};
    std::string log_file;
    bool use_color{true};
    bool show_help{false};
    bool show_version{false};

    bool batch_mode() const { return !commands.empty(); }

    std::string to_string() const
    {
        std::stringstream ss;
        ss << "feed-path: " << feed_path << "\n"
           << "log-level: " << logging::to_string(log_level) << "\n"
           << "log-file: " << log_file << "\n"
           << "color: " << use_color << "\n"
           << "commands: ";

        for (const auto& c : commands)
        {
            ss << c << " ";
        }

        ss << "\n";
        return ss.str();
    }
};

}  // namespace gtfsnav::config
#endif  // GTFSNAV_CONFIG_CONFIG_H_
