#include "logging/logger.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <memory>
#include <vector>

namespace logging
{
namespace
{
const std::array<const char*, n_levels> level_names = {"trace", "debug", "info", "warn", "error", "critical", "off"};
}

std::string to_string(log_level level)
{
    if (level < trace || level >= n_levels)
        return "unknown";
    return level_names[level];
}

bool from_string(const std::string& name, log_level& level)
{
    for (size_t i = 0; i < level_names.size(); ++i)
    {
        if (name == level_names[i])
        {
            level = static_cast<log_level>(i);
            return true;
        }
    }
    return false;
}

log::log(logging::log_level level, source_loc&& location) :
    level_{level},
    enabled_{spdlog::default_logger_raw()->should_log(static_cast<spdlog::level::level_enum>(level))},
    message_{},
    location_{location}
{
}

log::~log()
{
    if (!enabled_)
        return;

    auto default_logger = spdlog::default_logger_raw();
    std::string to;
    while (std::getline(message_, to, '\n'))
    {
        default_logger->log(spdlog::source_loc{location_.filename_, location_.line_, location_.funcname_},
                            static_cast<spdlog::level::level_enum>(level_), to);
    }
}

void configure_logging(const logging_config& config)
{
    const auto level = static_cast<spdlog::level::level_enum>(config.level);
    std::vector<spdlog::sink_ptr> sinks;

    // stdout carries the reports, the log goes to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
            config.color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
    console_sink->set_level(level);
    console_sink->set_pattern("%H:%M:%S %^%l%$ %v");
    sinks.push_back(console_sink);

    if (!config.file.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
    logger->set_level(config.file.empty() ? level : spdlog::level::trace);
    spdlog::set_default_logger(logger);
}

}// namespace logging
