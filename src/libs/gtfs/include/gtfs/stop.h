#pragma once
#include <gtfs/enums/accessibility.h>
#include <gtfs/enums/stop_location_type.h>
#include <gtfs/types.h>

#include <optional>
#include <variant>

namespace gtfsnav::gtfs
{
// location_type 0 (or empty): a stop or platform, may belong to a station.
struct stop_details
{
    Text stop_name;
    double stop_lat = 0.0;
    double stop_lon = 0.0;
    std::optional<Id> parent_station;
};

// location_type 1: stations are the roots of the stop hierarchy.
struct station_details
{
    Text stop_name;
    double stop_lat = 0.0;
    double stop_lon = 0.0;
};

// location_type 2
struct entrance_exit_details
{
    Text stop_name;
    double stop_lat = 0.0;
    double stop_lon = 0.0;
    Id parent_station;
};

// location_type 3
struct generic_node_details
{
    std::optional<Text> stop_name;
    std::optional<double> stop_lat;
    std::optional<double> stop_lon;
    Id parent_station;
};

// location_type 4
struct boarding_area_details
{
    std::optional<Text> stop_name;
    std::optional<double> stop_lat;
    std::optional<double> stop_lon;
    Id parent_station;
};

using location_details = std::variant<stop_details,
                                      station_details,
                                      entrance_exit_details,
                                      generic_node_details,
                                      boarding_area_details>;

struct stop
{
    // Required:
    Id stop_id;
    location_details details;

    // Optional:
    std::optional<Text> stop_code;
    std::optional<Text> tts_stop_name;
    std::optional<Text> stop_desc;
    std::optional<Id> zone_id;
    std::optional<Text> stop_url;
    std::optional<Timezone> stop_timezone;
    accessibility wheelchair_boarding = accessibility::NoInfo;
    std::optional<Id> level_id;
    std::optional<Text> platform_code;

    stop_location_type location_type() const;
    std::optional<Text> stop_name() const;
    std::optional<double> stop_lat() const;
    std::optional<double> stop_lon() const;
    std::optional<Id> parent_station() const;
};
}
