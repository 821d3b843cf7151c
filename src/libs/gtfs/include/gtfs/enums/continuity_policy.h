#pragma once
namespace gtfsnav::gtfs
{
// continuous_pickup / continuous_drop_off of routes.txt and stop_times.txt
enum class continuity_policy
{
    Continuous = 0,
    NotContinuous = 1,
    Phone = 2,               // Must phone agency to arrange
    CoordinateWithDriver = 3 // Must coordinate with driver to arrange
};
}
