#include <gtfsnav/commands/trips_interpreter.h>

namespace gtfsnav::commands
{
trips_interpreter::trips_interpreter(navigation::node::ptr current, printer& out) :
    collection_interpreter(std::move(current), out, navigation::node_kind::Trip)
{
}

void trips_interpreter::list()
{
    for (const auto& [trip_id, t] : get_schedule().trips)
        printer_.entry(trip_id, t.display_name().value_or("Unnamed Trip"));
}

size_t trips_interpreter::count() const
{
    return get_schedule().trips.size();
}

bool trips_interpreter::contains(const gtfs::Id& id) const
{
    return get_schedule().trips.count(id) != 0;
}
}
