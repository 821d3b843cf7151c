#include <gtfsnav/commands/routes_interpreter.h>

namespace gtfsnav::commands
{
routes_interpreter::routes_interpreter(navigation::node::ptr current, printer& out) :
    collection_interpreter(std::move(current), out, navigation::node_kind::Route)
{
}

void routes_interpreter::list()
{
    for (const auto& [route_id, r] : get_schedule().routes)
        printer_.route_entry(r);
}

size_t routes_interpreter::count() const
{
    return get_schedule().routes.size();
}

bool routes_interpreter::contains(const gtfs::Id& id) const
{
    return get_schedule().routes.count(id) != 0;
}
}
