#include <gtfsnav/navigation/node.h>
#include <gtfsnav/projection/projection.h>

namespace gtfsnav::navigation
{
namespace
{
const char* kind_name(node_kind kind)
{
    switch (kind)
    {
        case node_kind::Feed: return "Feed";
        case node_kind::Route: return "Route";
        case node_kind::Stop: return "Stop";
        case node_kind::Trip: return "Trip";
    }
    return "";
}

std::optional<std::string> entity_name(const gtfs::schedule& s, node_kind kind, const gtfs::Id& id)
{
    switch (kind)
    {
        case node_kind::Route:
            if (const auto it = s.routes.find(id); it != s.routes.end())
                return it->second.display_name();
            break;
        case node_kind::Stop:
            if (const auto it = s.stops.find(id); it != s.stops.end())
                return it->second.stop_name();
            break;
        case node_kind::Trip:
            if (const auto it = s.trips.find(id); it != s.trips.end())
                return it->second.display_name();
            break;
        case node_kind::Feed:
            break;
    }
    return std::nullopt;
}
}

node::node(gtfs::schedule s, node_kind kind, gtfs::Id id, std::optional<std::string> name, const ptr& parent) :
    schedule_(std::move(s)),
    kind_(kind),
    node_id_(std::move(id)),
    node_name_(std::move(name)),
    parent_(parent)
{
}

node::ptr node::make_root(gtfs::schedule feed)
{
    return ptr(new node(std::move(feed), node_kind::Feed, {}, std::nullopt, nullptr));
}

size_t node::depth() const
{
    size_t res = 0;
    for (auto p = parent(); p; p = p->parent())
        ++res;
    return res;
}

std::string node::path() const
{
    std::string res = is_root() ? std::string() : segment();
    for (auto p = parent(); p && !p->is_root(); p = p->parent())
        res = p->segment() + "." + res;
    return res;
}

std::string node::segment() const
{
    return std::string(collection_name(kind_)) + "." + node_id_;
}

std::string node::header() const
{
    if (is_root())
        return kind_name(kind_);

    std::string res = std::string(kind_name(kind_)) + " " + node_id_;
    if (node_name_)
        res += ": " + *node_name_;
    return res;
}

result make_child(const node::ptr& parent, node_kind kind, const gtfs::Id& id, node::ptr& out)
{
    const auto& source = parent->get_schedule();
    gtfs::schedule projected;
    result res;
    switch (kind)
    {
        case node_kind::Route:
            res = projection::project_by_route(source, id, projected);
            break;
        case node_kind::Stop:
            res = projection::project_by_stop(source, id, projected);
            break;
        case node_kind::Trip:
            res = projection::project_by_trip(source, id, projected);
            break;
        case node_kind::Feed:
            return {result_code::InvalidCommand, id};
    }
    if (res != result_code::OK)
        return res;

    auto name = entity_name(source, kind, id);
    out = node::ptr(new node(std::move(projected), kind, id, std::move(name), parent));
    return result_code::OK;
}

const char* collection_name(node_kind kind)
{
    switch (kind)
    {
        case node_kind::Route: return "routes";
        case node_kind::Stop: return "stops";
        case node_kind::Trip: return "trips";
        case node_kind::Feed: break;
    }
    return "";
}
}
