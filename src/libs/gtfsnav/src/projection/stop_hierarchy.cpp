#include <gtfsnav/projection/stop_hierarchy.h>

#include <stack>

namespace gtfsnav::projection
{
stop_hierarchy::stop_hierarchy(const gtfs::stop_map& stops) :
    stops_(stops)
{
    for (const auto& [stop_id, s] : stops_)
    {
        if (auto parent = s.parent_station())
            children_[*parent].push_back(stop_id);
    }
}

const std::vector<gtfs::Id>& stop_hierarchy::children(const gtfs::Id& stop_id) const
{
    static const std::vector<gtfs::Id> none;
    const auto it = children_.find(stop_id);
    return it == children_.end() ? none : it->second;
}

result stop_hierarchy::descendants(const gtfs::Id& stop_id, std::set<gtfs::Id>& closure) const
{
    if (!stops_.count(stop_id))
        return {result_code::NoSuchStop, stop_id};

    std::set<gtfs::Id> visited{stop_id};
    std::stack<gtfs::Id> pending;
    pending.push(stop_id);

    while (!pending.empty())
    {
        const gtfs::Id current = pending.top();
        pending.pop();

        for (const auto& child : children(current))
        {
            if (!stops_.count(child))
                return {result_code::ErrorGettingDescendants, current, {result_code::NoSuchStop, child}};

            if (!visited.insert(child).second)
                return {result_code::ErrorGettingDescendants, current, {result_code::CyclicStopHierarchy, child}};

            pending.push(child);
        }
    }

    closure.insert(visited.begin(), visited.end());
    return result_code::OK;
}
}
