#pragma once
#include <gtfs/route.h>
#include <gtfs/stop.h>
#include <gtfs/stop_time.h>
#include <gtfs/trip.h>

#include <map>
#include <vector>

namespace gtfsnav::gtfs
{

// Keyed collections of a feed or of any projection of it
using stop_map = std::map<Id, stop>;
using route_map = std::map<Id, route>;
using trip_map = std::map<Id, trip>;
// stop times grouped by trip_id, each group in feed order
using stop_time_map = std::map<Id, std::vector<stop_time>>;

/**
 * @brief in-memory form of the four required GTFS tables, either a whole feed
 * or a referentially closed subset of one
 */
class schedule
{
public:
    schedule() = default;

    size_t stop_time_count() const;
    bool empty() const;

    void add_stop_time(stop_time st);

public:
    stop_map stops;
    route_map routes;
    trip_map trips;
    stop_time_map stop_times;
};
}
