// Copyright 2018, University of Freiburg,
// Chair of Algorithms and Data Structures.
// Authors: Patrick Brosi <brosi@informatik.uni-freiburg.de>

#ifndef GTFSNAV_CONFIG_CONFIG_READER_H_
#define GTFSNAV_CONFIG_CONFIG_READER_H_

#include <gtfsnav/config/config.h>

#include <ostream>

namespace gtfsnav::config
{

class config_reader
{
public:
    explicit config_reader(config& cfg);

    // Throws invalid_parameter_exception on unknown options, missing arguments
    // and more than one feed.
    void read(int argc, char** argv);

    static void help(const char* bin, std::ostream& out);
    static void version(std::ostream& out);

private:
    config& config_;
};
}  // namespace gtfsnav::config
#endif  // GTFSNAV_CONFIG_CONFIG_READER_H_
