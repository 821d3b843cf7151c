#pragma once
#include <gtfs/schedule.h>
#include <gtfsnav/result.h>

#include <memory>
#include <optional>
#include <string>

namespace gtfsnav::navigation
{
enum class node_kind
{
    Feed,
    Route,
    Stop,
    Trip
};

/**
 * @brief one level of navigation: a schedule together with the entity it was projected from
 *
 * Nodes are immutable and shared. A child keeps a weak reference to its parent, so a node
 * stays usable after its ancestors are released.
 */
class node
{
public:
    using ptr = std::shared_ptr<const node>;

    static ptr make_root(gtfs::schedule feed);

    const gtfs::schedule& get_schedule() const { return schedule_; }
    node_kind kind() const { return kind_; }
    const gtfs::Id& id() const { return node_id_; }
    const std::optional<std::string>& name() const { return node_name_; }

    ptr parent() const { return parent_.lock(); }
    bool is_root() const { return kind_ == node_kind::Feed; }

    // Number of ancestors still alive.
    size_t depth() const;

    // Dot-joined address from the root in the command language, e.g. "stops.A.routes.R1".
    std::string path() const;

    // "Route AB: Airport - Bullfrog (10)", "Feed" for the root
    std::string header() const;

private:
    friend result make_child(const ptr& parent, node_kind kind, const gtfs::Id& id, ptr& out);

    node(gtfs::schedule s, node_kind kind, gtfs::Id id, std::optional<std::string> name, const ptr& parent);

    std::string segment() const;

    gtfs::schedule schedule_;
    node_kind kind_;
    gtfs::Id node_id_;
    std::optional<std::string> node_name_;
    std::weak_ptr<const node> parent_;
};

/**
 * Projects the schedule of parent onto the route, stop or trip id and wraps the
 * projection in a child node of parent. out is set only on success.
 */
result make_child(const node::ptr& parent, node_kind kind, const gtfs::Id& id, node::ptr& out);

// "routes", "stops" or "trips"
const char* collection_name(node_kind kind);
}
