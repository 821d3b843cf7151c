#pragma once
#include <gtfs/schedule.h>

#include <optional>
#include <set>
#include <string>

namespace gtfsnav::testing
{
inline gtfs::stop make_station(const gtfs::Id& id, const std::string& name)
{
    gtfs::stop s;
    s.stop_id = id;
    s.details = gtfs::station_details{name, 10.0, 20.0};
    return s;
}

inline gtfs::stop make_stop(const gtfs::Id& id, const std::string& name, std::optional<gtfs::Id> parent = std::nullopt)
{
    gtfs::stop s;
    s.stop_id = id;
    s.details = gtfs::stop_details{name, 10.0, 20.0, std::move(parent)};
    return s;
}

inline gtfs::stop make_generic_node(const gtfs::Id& id, const gtfs::Id& parent)
{
    gtfs::stop s;
    s.stop_id = id;
    s.details = gtfs::generic_node_details{std::nullopt, std::nullopt, std::nullopt, parent};
    return s;
}

inline gtfs::route make_route(const gtfs::Id& id, const std::string& short_name, const std::string& long_name)
{
    gtfs::route r;
    r.route_id = id;
    r.name = *gtfs::make_route_name(short_name, long_name);
    r.route_type = gtfs::route_type::Bus;
    return r;
}

inline gtfs::trip make_trip(const gtfs::Id& id, const gtfs::Id& route_id,
                            std::optional<std::string> headsign = std::nullopt)
{
    gtfs::trip t;
    t.trip_id = id;
    t.route_id = route_id;
    t.service_id = "DAILY";
    t.trip_headsign = std::move(headsign);
    return t;
}

inline gtfs::stop_time make_stop_time(const gtfs::Id& trip_id, std::optional<gtfs::Id> stop_id, size_t sequence)
{
    gtfs::stop_time st;
    st.trip_id = trip_id;
    st.stop_id = std::move(stop_id);
    st.stop_sequence = sequence;
    st.arrival_time = gtfs::time(8, static_cast<uint16_t>(sequence), 0);
    st.departure_time = st.arrival_time;
    return st;
}

inline void add(gtfs::schedule& s, gtfs::stop st) { s.stops.emplace(st.stop_id, std::move(st)); }
inline void add(gtfs::schedule& s, gtfs::route r) { s.routes.emplace(r.route_id, std::move(r)); }
inline void add(gtfs::schedule& s, gtfs::trip t) { s.trips.emplace(t.trip_id, std::move(t)); }

/**
 * Station A "Downtown" with platform A1, trip T1 of route R1 serving A1,
 * and route R2 without trips.
 */
inline gtfs::schedule downtown_schedule()
{
    gtfs::schedule s;
    add(s, make_station("A", "Downtown"));
    add(s, make_stop("A1", "Platform 1", std::string("A")));
    add(s, make_route("R1", "1", "Downtown Line"));
    add(s, make_route("R2", "", "Night Line"));
    add(s, make_trip("T1", "R1", std::string("to Downtown")));
    s.add_stop_time(make_stop_time("T1", std::string("A1"), 1));
    return s;
}

/**
 * The downtown schedule extended with:
 *  - stops A2 (platform without service), N (generic node of A), B "Uptown", C "Harbor"
 *  - T1 continuing to B and ending at a location group without stop id
 *  - T2 of R1 from B to C, T3 of route R3 at C, T.9 of route R.10 at B
 *  - stop times of trip GHOST, which is not in the trip table, at A1
 */
inline gtfs::schedule city_schedule()
{
    gtfs::schedule s = downtown_schedule();
    add(s, make_stop("A2", "Platform 2", std::string("A")));
    add(s, make_generic_node("N", "A"));
    add(s, make_stop("B", "Uptown"));
    add(s, make_stop("C", "Harbor"));

    add(s, make_route("R3", "3", ""));
    add(s, make_route("R.10", "10", ""));

    add(s, make_trip("T2", "R1"));
    add(s, make_trip("T3", "R3", std::string("Harbor")));
    add(s, make_trip("T.9", "R.10"));

    s.add_stop_time(make_stop_time("T1", std::string("B"), 2));
    auto flex = make_stop_time("T1", std::nullopt, 3);
    flex.location_group_id = "ZONE_1";
    s.add_stop_time(flex);

    s.add_stop_time(make_stop_time("T2", std::string("B"), 1));
    s.add_stop_time(make_stop_time("T2", std::string("C"), 2));
    s.add_stop_time(make_stop_time("T3", std::string("C"), 1));
    s.add_stop_time(make_stop_time("T.9", std::string("B"), 1));
    s.add_stop_time(make_stop_time("GHOST", std::string("A1"), 1));
    return s;
}

template<class Map>
std::set<gtfs::Id> keys(const Map& m)
{
    std::set<gtfs::Id> res;
    for (const auto& entry : m)
        res.insert(entry.first);
    return res;
}
}
