#pragma once
#include <gtfs/enums/continuity_policy.h>
#include <gtfs/enums/stop_time_boarding.h>
#include <gtfs/enums/stop_time_point.h>
#include <gtfs/time.h>
#include <gtfs/types.h>

#include <optional>

namespace gtfsnav::gtfs
{
struct stop_time
{
    // Required:
    Id trip_id;
    size_t stop_sequence = 0;

    // Conditionally required, absent when the trip serves a location group or area instead:
    std::optional<Id> stop_id;
    std::optional<Id> location_group_id;
    std::optional<Id> location_id;

    time arrival_time;
    time departure_time;

    // Optional:
    std::optional<Text> stop_headsign;
    time start_pickup_drop_off_window;
    time end_pickup_drop_off_window;
    std::optional<stop_time_boarding> pickup_type;
    std::optional<stop_time_boarding> drop_off_type;
    std::optional<continuity_policy> continuous_pickup;
    std::optional<continuity_policy> continuous_drop_off;
    std::optional<double> shape_dist_traveled;
    std::optional<stop_time_point> timepoint;
    std::optional<Id> pickup_booking_rule_id;
    std::optional<Id> drop_off_booking_rule_id;
};
}
