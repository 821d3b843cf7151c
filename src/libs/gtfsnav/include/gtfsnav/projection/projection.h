#pragma once
#include <gtfs/schedule.h>
#include <gtfsnav/result.h>

namespace gtfsnav::projection
{
// Every projection leaves out untouched unless it returns OK. The source is never modified.

// The route, its trips, their stop times and the stops these visit.
result project_by_route(const gtfs::schedule& source, const gtfs::Id& route_id, gtfs::schedule& out);

// The stop and its descendants, the stop times at them, the trips of those stop times
// and the routes of those trips.
result project_by_stop(const gtfs::schedule& source, const gtfs::Id& stop_id, gtfs::schedule& out);

// The trip, its stop times, the stops they visit and the trip's route.
result project_by_trip(const gtfs::schedule& source, const gtfs::Id& trip_id, gtfs::schedule& out);
}
