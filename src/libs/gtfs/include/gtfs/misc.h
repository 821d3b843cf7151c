#pragma once
#include <gtfs/enums/route_type.h>
#include <gtfs/enums/stop_location_type.h>

#include <cstdint>
#include <string>

namespace gtfsnav::gtfs
{

// File names of the tables read from a feed ------------------------------------------------------
const std::string file_stops = "stops.txt";
const std::string file_routes = "routes.txt";
const std::string file_trips = "trips.txt";
const std::string file_stop_times = "stop_times.txt";

constexpr char csv_separator = ',';
constexpr char quote = '"';

std::string append_leading_zero(const std::string& s, bool check = true);

std::string add_trailing_slash(const std::string & path);

std::string unquote_text(const std::string & text);

std::string trim_spaces(const std::string & token);

std::string normalize(std::string & token, bool has_quotes);

// Colors are stored as 0xRRGGBB.
uint32_t parse_hex_color(const std::string & hex);

std::string get_hex_color_string(uint32_t color);

std::string get_route_type_string(route_type t);

route_type get_route_type(int t);

std::string get_location_type_string(stop_location_type t);

}
