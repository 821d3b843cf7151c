#include <gtfsnav/commands/stops_interpreter.h>

namespace gtfsnav::commands
{
stops_interpreter::stops_interpreter(navigation::node::ptr current, printer& out) :
    collection_interpreter(std::move(current), out, navigation::node_kind::Stop)
{
}

void stops_interpreter::list()
{
    for (const auto& [stop_id, s] : get_schedule().stops)
        printer_.entry(stop_id, s.stop_name().value_or("Unnamed Location"));
}

size_t stops_interpreter::count() const
{
    return get_schedule().stops.size();
}

bool stops_interpreter::contains(const gtfs::Id& id) const
{
    return get_schedule().stops.count(id) != 0;
}
}
