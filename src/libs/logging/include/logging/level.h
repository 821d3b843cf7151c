#ifndef LOGGING_LEVEL_H
#define LOGGING_LEVEL_H

#include <string>

namespace logging
{
// Values match spdlog::level::level_enum.
enum log_level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
    n_levels
};

std::string to_string(log_level level);

// Accepts the lower case names of the levels, leaves level untouched on failure.
bool from_string(const std::string& name, log_level& level);

}// namespace logging
#endif//LOGGING_LEVEL_H
