#pragma once
namespace gtfsnav::gtfs
{
// Two arbitrary opposing directions of travel.
enum class trip_direction_id
{
    A = 0,
    B = 1
};
}
