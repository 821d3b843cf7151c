#include <catch2/catch.hpp>
#include <gtfs/exceptions/invalid_field_format.h>
#include <gtfs/misc.h>
#include <gtfs/route.h>
#include <gtfs/stop.h>

using namespace gtfsnav::gtfs;

TEST_CASE("Route name needs at least one of the names")
{
    CHECK(!make_route_name("", ""));

    const auto both = make_route_name("10", "Airport - Bullfrog");
    REQUIRE(both);
    CHECK(std::holds_alternative<long_and_short_name>(*both));

    route r;
    r.route_id = "AB";
    r.name = *both;
    CHECK(r.display_name() == "Airport - Bullfrog (10)");

    r.name = *make_route_name("10", "");
    CHECK(r.display_name() == "10");
    CHECK(!r.route_long_name());
}

TEST_CASE("Unified stop accessors")
{
    stop s;
    s.stop_id = "A1";
    s.details = stop_details{"Platform 1", 1.5, 2.5, std::string("A")};
    CHECK(s.location_type() == stop_location_type::StopOrPlatform);
    CHECK(s.stop_name() == "Platform 1");
    CHECK(s.parent_station() == "A");

    s.details = station_details{"Downtown", 1.0, 2.0};
    CHECK(s.location_type() == stop_location_type::Station);
    CHECK(!s.parent_station());
    CHECK(s.stop_lon() == 2.0);

    s.details = boarding_area_details{std::nullopt, std::nullopt, std::nullopt, "A1"};
    CHECK(s.location_type() == stop_location_type::BoardingArea);
    CHECK(!s.stop_name());
    CHECK(s.parent_station() == "A1");
}

TEST_CASE("Hex colors")
{
    CHECK(parse_hex_color("FF0000") == 0xFF0000u);
    CHECK(parse_hex_color("#00ff7f") == 0x00FF7Fu);
    CHECK(get_hex_color_string(0x00FF7Fu) == "00FF7F");
    CHECK_THROWS_AS(parse_hex_color("FFF"), invalid_field_format);
    CHECK_THROWS_AS(parse_hex_color("GG0000"), invalid_field_format);
}

TEST_CASE("Route types")
{
    CHECK(get_route_type(3) == route_type::Bus);
    CHECK(get_route_type(12) == route_type::Monorail);
    CHECK(get_route_type_string(route_type::Trolleybus) == "trolleybus");
    CHECK_THROWS_AS(get_route_type(8), invalid_field_format);
}
