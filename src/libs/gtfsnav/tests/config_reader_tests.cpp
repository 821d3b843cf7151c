#include <catch2/catch.hpp>

#include <gtfsnav/config/config_reader.h>
#include <exceptions/exceptions.h>

#include <sstream>
#include <string>
#include <vector>

using gtfsnav::config::config;
using gtfsnav::config::config_reader;

namespace
{
config parse_args(std::vector<std::string> args)
{
    args.insert(args.begin(), "gtfsnav");
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    config cfg;
    config_reader reader(cfg);
    reader.read(static_cast<int>(args.size()), argv.data());
    return cfg;
}
}

TEST_CASE("Defaults")
{
    const auto cfg = parse_args({});
    CHECK(cfg.feed_path.empty());
    CHECK(!cfg.batch_mode());
    CHECK(cfg.log_level == logging::info);
    CHECK(cfg.use_color);
    CHECK(!cfg.show_help);
}

TEST_CASE("Feed directory as option or positional parameter")
{
    CHECK(parse_args({"-i", "feeds/demo"}).feed_path == "feeds/demo");
    CHECK(parse_args({"--input", "feeds/demo"}).feed_path == "feeds/demo");
    CHECK(parse_args({"feeds/demo"}).feed_path == "feeds/demo");
}

TEST_CASE("Batch commands, logging and color")
{
    const auto cfg = parse_args({"-e", "routes.list", "--execute", "stops.info", "-l", "debug", "-L", "run.log",
                           "--no-color", "feed"});
    CHECK(cfg.commands == std::vector<std::string>{"routes.list", "stops.info"});
    CHECK(cfg.batch_mode());
    CHECK(cfg.log_level == logging::debug);
    CHECK(cfg.log_file == "run.log");
    CHECK(!cfg.use_color);
    CHECK(cfg.feed_path == "feed");
}

TEST_CASE("Help and version")
{
    CHECK(parse_args({"-h"}).show_help);
    CHECK(parse_args({"--version"}).show_version);

    std::ostringstream out;
    config_reader::help("gtfsnav", out);
    CHECK(out.str().find("--execute") != std::string::npos);
}

TEST_CASE("Invalid command lines")
{
    CHECK_THROWS_AS(parse_args({"--bogus"}), invalid_parameter_exception);
    CHECK_THROWS_AS(parse_args({"-i"}), invalid_parameter_exception);
    CHECK_THROWS_AS(parse_args({"-l", "verbose"}), invalid_parameter_exception);
    CHECK_THROWS_AS(parse_args({"feed_a", "feed_b"}), invalid_parameter_exception);

    try
    {
        parse_args({"-l", "verbose"});
        FAIL("no exception");
    }
    catch (const invalid_parameter_exception& ex)
    {
        CHECK(strip_location(ex.what()) == "unknown log level verbose");
    }
}
