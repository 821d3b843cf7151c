#include <gtfs/stop.h>

#include <type_traits>

namespace gtfsnav::gtfs
{
stop_location_type stop::location_type() const
{
    // variant alternatives are declared in location_type order
    return static_cast<stop_location_type>(details.index());
}

std::optional<Text> stop::stop_name() const
{
    return std::visit([](const auto& d) -> std::optional<Text> { return d.stop_name; }, details);
}

std::optional<double> stop::stop_lat() const
{
    return std::visit([](const auto& d) -> std::optional<double> { return d.stop_lat; }, details);
}

std::optional<double> stop::stop_lon() const
{
    return std::visit([](const auto& d) -> std::optional<double> { return d.stop_lon; }, details);
}

std::optional<Id> stop::parent_station() const
{
    return std::visit(
            [](const auto& d) -> std::optional<Id> {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, station_details>)
                    return std::nullopt;
                else
                    return d.parent_station;
            },
            details);
}
}
