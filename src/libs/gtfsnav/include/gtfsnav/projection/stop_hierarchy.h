#pragma once
#include <gtfs/schedule.h>
#include <gtfsnav/result.h>

#include <map>
#include <set>
#include <vector>

namespace gtfsnav::projection
{
/**
 * @brief parent to children index over the stops of a schedule, built from parent_station
 */
class stop_hierarchy
{
public:
    explicit stop_hierarchy(const gtfs::stop_map& stops);

    const std::vector<gtfs::Id>& children(const gtfs::Id& stop_id) const;

    /**
     * Collects stop_id and all of its descendants into closure.
     * Fails with NoSuchStop when stop_id is not a stop, and with ErrorGettingDescendants
     * wrapping NoSuchStop or CyclicStopHierarchy when the hierarchy below it is broken.
     */
    result descendants(const gtfs::Id& stop_id, std::set<gtfs::Id>& closure) const;

private:
    const gtfs::stop_map& stops_;
    std::map<gtfs::Id, std::vector<gtfs::Id>> children_;
};
}
