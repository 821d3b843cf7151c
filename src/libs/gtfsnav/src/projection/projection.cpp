#include <gtfsnav/projection/projection.h>
#include <gtfsnav/projection/stop_hierarchy.h>

#include <logging/logger.h>

#include <set>
#include <vector>

namespace gtfsnav::projection
{
namespace
{
void copy_stops(const gtfs::schedule& source, const std::set<gtfs::Id>& stop_ids, gtfs::schedule& out)
{
    for (const auto& stop_id : stop_ids)
    {
        if (const auto it = source.stops.find(stop_id); it != source.stops.end())
            out.stops.emplace(*it);
    }
}

void copy_routes(const gtfs::schedule& source, const std::set<gtfs::Id>& route_ids, gtfs::schedule& out)
{
    for (const auto& route_id : route_ids)
    {
        if (const auto it = source.routes.find(route_id); it != source.routes.end())
            out.routes.emplace(*it);
    }
}

// Copies the stop times of every trip of out and collects the stops they visit.
std::set<gtfs::Id> copy_stop_times_of_trips(const gtfs::schedule& source, gtfs::schedule& out)
{
    std::set<gtfs::Id> visited_stops;
    for (const auto& [trip_id, t] : out.trips)
    {
        const auto it = source.stop_times.find(trip_id);
        if (it == source.stop_times.end())
            continue;

        for (const auto& st : it->second)
        {
            if (st.stop_id)
                visited_stops.insert(*st.stop_id);
        }
        out.stop_times.emplace(trip_id, it->second);
    }
    return visited_stops;
}

void log_projection(const char* selector, const gtfs::Id& id, const gtfs::schedule& out)
{
    LOG(DEBUG) << "projected " << selector << " " << id << ": " << out.stops.size() << " stops, "
               << out.routes.size() << " routes, " << out.trips.size() << " trips, "
               << out.stop_time_count() << " stop times";
}
}

result project_by_route(const gtfs::schedule& source, const gtfs::Id& route_id, gtfs::schedule& out)
{
    const auto route_it = source.routes.find(route_id);
    if (route_it == source.routes.end())
        return {result_code::NoSuchRoute, route_id};

    gtfs::schedule projected;
    projected.routes.emplace(*route_it);

    for (const auto& [trip_id, t] : source.trips)
    {
        if (t.route_id == route_id)
            projected.trips.emplace(trip_id, t);
    }

    const auto visited_stops = copy_stop_times_of_trips(source, projected);
    copy_stops(source, visited_stops, projected);

    log_projection("route", route_id, projected);
    out = std::move(projected);
    return result_code::OK;
}

result project_by_stop(const gtfs::schedule& source, const gtfs::Id& stop_id, gtfs::schedule& out)
{
    const stop_hierarchy hierarchy(source.stops);

    std::set<gtfs::Id> closure;
    if (auto res = hierarchy.descendants(stop_id, closure); res != result_code::OK)
        return res;

    gtfs::schedule projected;
    copy_stops(source, closure, projected);

    for (const auto& [trip_id, stop_times] : source.stop_times)
    {
        if (!source.trips.count(trip_id))
            continue;

        std::vector<gtfs::stop_time> at_closure;
        for (const auto& st : stop_times)
        {
            if (st.stop_id && closure.count(*st.stop_id))
                at_closure.push_back(st);
        }
        if (!at_closure.empty())
            projected.stop_times.emplace(trip_id, std::move(at_closure));
    }

    std::set<gtfs::Id> route_ids;
    for (const auto& [trip_id, stop_times] : projected.stop_times)
    {
        const auto& t = source.trips.at(trip_id);
        route_ids.insert(t.route_id);
        projected.trips.emplace(trip_id, t);
    }
    copy_routes(source, route_ids, projected);

    log_projection("stop", stop_id, projected);
    out = std::move(projected);
    return result_code::OK;
}

result project_by_trip(const gtfs::schedule& source, const gtfs::Id& trip_id, gtfs::schedule& out)
{
    const auto trip_it = source.trips.find(trip_id);
    if (trip_it == source.trips.end())
        return {result_code::NoSuchTrip, trip_id};

    gtfs::schedule projected;
    projected.trips.emplace(*trip_it);

    const auto visited_stops = copy_stop_times_of_trips(source, projected);
    copy_stops(source, visited_stops, projected);
    copy_routes(source, {trip_it->second.route_id}, projected);

    log_projection("trip", trip_id, projected);
    out = std::move(projected);
    return result_code::OK;
}
}
