#ifndef LOGGING_LOGGER_H
#define LOGGING_LOGGER_H

#include <logging/level.h>

#include <sstream>
#include <string>

// Short level names for LOG(), kept out of level.h so that headers needing only
// the enumeration do not carry them.
#define TRACE 0
#define DEBUG 1
#define INFO 2
#define WARN 3
#define ERROR 4
#define CRITICAL 5
#define OFF 6

namespace logging
{

struct source_loc
{
    constexpr source_loc() = default;
    constexpr source_loc(const char *filename_in, int line_in, const char *funcname_in)
            : filename_{filename_in}
            , line_{line_in}
            , funcname_{funcname_in}
    {}

    const char *filename_{nullptr};
    int line_{0};
    const char *funcname_{nullptr};
};

/**
 * @brief one log statement, collected through operator<< and emitted line by line on destruction
 */
class log
{
public:
    log(logging::log_level level, source_loc&& location);

    log(log const&) = delete;
    log& operator=(log const&) = delete;

    log(log&&) = default;
    log& operator=(log&&) = default;

    template<typename T>
    friend log&& operator<<(log&& l, T&& t)
    {
        if (l.enabled_)
            l.message_ << t;

        return std::move(l);
    }

    ~log();

private:
    logging::log_level level_;
    bool enabled_;
    std::stringstream message_;
    source_loc location_;
};

struct logging_config
{
    log_level level = info;
    // empty for console only
    std::string file;
    bool color = true;
};

// Replaces the default logger with one writing to stderr and, if configured, to a file.
void configure_logging(const logging_config& config);

}// namespace logging

#define LOG(lvl) logging::log(static_cast<logging::log_level>(lvl), logging::source_loc{__FILE__, __LINE__, static_cast<const char *>(__FUNCTION__)})

#define LOG_TRACE() LOG(TRACE)
#define LOG_DEBUG() LOG(DEBUG)
#define LOG_INFO() LOG(INFO)
#define LOG_WARN() LOG(WARN)
#define LOG_ERROR() LOG(ERROR)
#define LOG_CRITICAL() LOG(CRITICAL)

#endif//LOGGING_LOGGER_H
