#pragma once
#include <gtfs/enums/continuity_policy.h>
#include <gtfs/enums/route_type.h>
#include <gtfs/types.h>

#include <cstdint>
#include <optional>
#include <variant>

namespace gtfsnav::gtfs
{
using rt = route_type;

// A route must be named by route_short_name, route_long_name or both.
struct short_name
{
    Text route_short_name;
};

struct long_name
{
    Text route_long_name;
};

struct long_and_short_name
{
    Text route_long_name;
    Text route_short_name;
};

using route_name = std::variant<short_name, long_name, long_and_short_name>;

struct route
{
    // Required:
    Id route_id;
    route_name name;
    rt route_type = rt::Tram;

    // Conditionally required:
    std::optional<Id> agency_id;

    // Optional
    std::optional<Text> route_desc;
    std::optional<Text> route_url;
    std::optional<uint32_t> route_color;
    std::optional<uint32_t> route_text_color;
    std::optional<size_t> route_sort_order;  // Routes with smaller value values should be displayed first
    std::optional<continuity_policy> continuous_pickup;
    std::optional<continuity_policy> continuous_drop_off;
    std::optional<Id> network_id;

    std::optional<Text> route_long_name() const;
    std::optional<Text> route_short_name() const;

    // "Long (Short)" when both names are given, otherwise the one that is.
    Text display_name() const;
};

// Builds the name variant out of the two optional name columns, nullopt if both are empty.
std::optional<route_name> make_route_name(const Text& short_name, const Text& long_name);
}
