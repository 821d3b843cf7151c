#pragma once
#include <gtfs/enums/accessibility.h>
#include <gtfs/enums/trip_direction_id.h>
#include <gtfs/types.h>

#include <optional>

namespace gtfsnav::gtfs
{
struct trip
{
    // Required:
    Id route_id;
    Id service_id;
    Id trip_id;

    // Optional:
    std::optional<Text> trip_headsign;
    std::optional<Text> trip_short_name;
    std::optional<trip_direction_id> direction_id;
    std::optional<Id> block_id;
    std::optional<Id> shape_id;
    accessibility wheelchair_accessible = accessibility::NoInfo;
    accessibility bikes_allowed = accessibility::NoInfo;

    // Headsign, else short name.
    std::optional<Text> display_name() const;
};
}
