#include <gtfs/trip.h>

namespace gtfsnav::gtfs
{
std::optional<Text> trip::display_name() const
{
    if (trip_headsign)
        return trip_headsign;

    return trip_short_name;
}
}
