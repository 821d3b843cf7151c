#include <catch2/catch.hpp>

#include <gtfsnav/commands/execute.h>
#include <gtfsnav/commands/schedule_interpreter.h>
#include "fixtures.h"

#include <sstream>

using namespace gtfsnav;
using namespace gtfsnav::testing;
using commands::command_path;

namespace
{
struct session
{
    explicit session(gtfs::schedule s, bool color = false) :
        root(navigation::node::make_root(std::move(s))),
        out(output, color)
    {
    }

    result run(const std::string& line)
    {
        output.str(std::string());
        commands::schedule_interpreter interpreter(root, out);
        return interpreter.interpret(command_path::parse(line));
    }

    std::vector<std::string> lines() const
    {
        std::vector<std::string> res;
        std::istringstream in(output.str());
        std::string line;
        while (std::getline(in, line))
            res.push_back(line);
        return res;
    }

    navigation::node::ptr root;
    std::ostringstream output;
    commands::printer out;
};
}

TEST_CASE("Listing routes prints one line per route, matching info")
{
    session s(city_schedule());
    REQUIRE(s.run("routes.list") == result_code::OK);
    const auto listed = s.lines();
    CHECK(listed == std::vector<std::string>{"R.10: 10", "R1: Downtown Line (1)", "R2: Night Line", "R3: 3"});

    REQUIRE(s.run("routes.info") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"Routes: " + std::to_string(listed.size())});
}

TEST_CASE("Listing stops and trips")
{
    session s(city_schedule());
    REQUIRE(s.run("stops.list") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"A: Downtown", "A1: Platform 1", "A2: Platform 2", "B: Uptown",
                                                "C: Harbor", "N: Unnamed Location"});

    REQUIRE(s.run("trips.list") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"T.9: Unnamed Trip", "T1: to Downtown", "T2: Unnamed Trip",
                                                "T3: Harbor"});
}

TEST_CASE("Info on the feed")
{
    session s(downtown_schedule());
    REQUIRE(s.run("info") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"Feed", "Stops: 2", "Routes: 2", "Trips: 1", "Stop times: 1"});
}

TEST_CASE("Drilling down from a stop to one of its routes")
{
    session s(downtown_schedule());
    REQUIRE(s.run("stops.A.routes.R1.list") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"R1: Downtown Line (1)"});

    REQUIRE(s.run("stops.A.routes.list") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"R1: Downtown Line (1)"});

    REQUIRE(s.run("stops.A.info") == result_code::OK);
    const auto info = s.lines();
    REQUIRE(info.size() == 7);
    CHECK(info[0] == "Stop A: Downtown");
    CHECK(info[1] == "Path: stops.A");
    CHECK(info[2] == "Type: station");
    CHECK(info[3] == "Stops: 2");
}

TEST_CASE("Info on a route names its type and colors")
{
    auto source = downtown_schedule();
    source.routes.at("R1").route_color = 0x00FF7Fu;
    session s(std::move(source));

    REQUIRE(s.run("routes.R1.info") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"Route R1: Downtown Line (1)", "Path: routes.R1", "Type: bus",
                                                "Color: #00FF7F", "Stops: 1", "Routes: 1", "Trips: 1",
                                                "Stop times: 1"});

    REQUIRE(s.run("routes.R1.stops.A1.info") == result_code::OK);
    CHECK(s.lines()[2] == "Type: stop");

    REQUIRE(s.run("trips.T1.info") == result_code::OK);
    CHECK(s.lines()[2] == "Stops: 1");
}

TEST_CASE("A route outside of the projection is an invalid command")
{
    session s(downtown_schedule());

    SECTION("unknown route")
    {
        const auto res = s.run("stops.A.routes.R9.list");
        REQUIRE(res == result_code::StopsCommandError);
        CHECK(res.message() == "Error interpreting stops subcommand: Error executing command for stop A: "
                               "Error interpreting routes command: Invalid command: R9.list");
    }
    SECTION("route of the feed that does not serve the stop")
    {
        const auto res = s.run("stops.A.routes.R2.list");
        CHECK(res.root_cause() == result_code::InvalidCommand);
        CHECK(res.root_cause().subject() == "R2.list");
        CHECK(s.lines().empty());
    }
}

TEST_CASE("Ids containing dots")
{
    session s(city_schedule());
    REQUIRE(s.run("routes.R.10.trips.list") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"T.9: Unnamed Trip"});

    REQUIRE(s.run("trips.T.9.stops.list") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"B: Uptown"});
}

TEST_CASE("An exact id takes precedence over a longer dotted id")
{
    auto source = downtown_schedule();
    add(source, make_stop("A.info", "Downtown Info Desk"));
    session s(std::move(source));

    REQUIRE(s.run("stops.A.info") == result_code::OK);
    const auto info = s.lines();
    REQUIRE(!info.empty());
    CHECK(info[0] == "Stop A: Downtown");

    REQUIRE(s.run("stops.A.info.info") == result_code::OK);
    CHECK(s.lines().front() == "Stop A: Downtown");

    SECTION("the dotted id is reached when its head names no entity")
    {
        source = downtown_schedule();
        add(source, make_stop("Z.info", "Zoo Info Desk"));
        session z(std::move(source));
        REQUIRE(z.run("stops.Z.info.info") == result_code::OK);
        CHECK(z.lines().front() == "Stop Z.info: Zoo Info Desk");
    }
}

TEST_CASE("Terminal commands ignore what follows them")
{
    session s(downtown_schedule());
    REQUIRE(s.run("routes.info.whatever") == result_code::OK);
    CHECK(s.lines() == std::vector<std::string>{"Routes: 2"});
    REQUIRE(s.run("info.stops") == result_code::OK);
    CHECK(s.lines().front() == "Feed");
}

TEST_CASE("Command errors")
{
    session s(city_schedule());

    SECTION("unknown command")
    {
        const auto res = s.run("shapes.list");
        CHECK(res == result_code::InvalidCommand);
        CHECK(res.message() == "Invalid command: shapes.list");
    }
    SECTION("collection without subcommand")
    {
        const auto res = s.run("stops");
        CHECK(res == result_code::SubcommandRequired);
        CHECK(res.message() == "Subcommand required for stops");
    }
    SECTION("entity without subcommand")
    {
        const auto res = s.run("routes.R1");
        CHECK(res.message() == "Error interpreting routes command: Error executing command for route R1: "
                               "Subcommand required for routes.R1");
    }
    SECTION("trip errors")
    {
        const auto res = s.run("trips.T1.routes.R3.info");
        CHECK(res == result_code::TripsCommandError);
        REQUIRE(res.cause());
        CHECK(*res.cause() == result_code::ErrorExecutingCommandForTrip);
        CHECK(res.cause()->subject() == "T1");
    }
    SECTION("nothing is printed on failure")
    {
        s.run("stops.B.routes.R3.list");
        CHECK(s.lines().empty());
    }
}

TEST_CASE("Projection failures are wrapped as errors getting the entity")
{
    gtfs::schedule source;
    add(source, make_generic_node("X", "Y"));
    add(source, make_generic_node("Y", "X"));
    session s(std::move(source));

    const auto res = s.run("stops.X.info");
    CHECK(res.message() == "Error interpreting stops subcommand: Error getting stop: "
                           "Error getting descendants for stop Y: Cyclic stop hierarchy at stop X");
}

TEST_CASE("Route names can be printed in the route colors")
{
    auto source = downtown_schedule();
    source.routes.at("R1").route_color = 0xFF0000u;
    session s(std::move(source), true);

    REQUIRE(s.run("routes.list") == result_code::OK);
    const auto lines = s.lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].find("R1: \x1b[") == 0);
    CHECK(lines[0].find("Downtown Line (1)") != std::string::npos);
    // no color given
    CHECK(lines[1] == "R2: Night Line");
}

TEST_CASE("Executing a line reports failures on the error stream")
{
    const auto root = navigation::node::make_root(downtown_schedule());
    std::ostringstream output;
    std::ostringstream errors;
    commands::printer out(output);

    CHECK(!commands::execute(root, "routes.NOPE.list", out, errors));
    CHECK(output.str().empty());
    CHECK(errors.str() == "Error interpreting routes command: Invalid command: NOPE.list\n");

    errors.str(std::string());
    CHECK(commands::execute(root, "routes.list", out, errors));
    CHECK(errors.str().empty());
    CHECK(output.str() == "R1: Downtown Line (1)\nR2: Night Line\n");
}
