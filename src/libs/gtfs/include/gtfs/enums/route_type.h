#pragma once
namespace gtfsnav::gtfs
{
enum class route_type
{
    Tram = 0,         // Tram, Streetcar, Light rail
    Subway = 1,       // Any underground rail system within a metropolitan area
    Rail = 2,         // Intercity or long-distance travel
    Bus = 3,          // Short- and long-distance bus routes
    Ferry = 4,        // Boat service
    CableTram = 5,    // Street-level rail cars where the cable runs beneath the vehicle
    AerialLift = 6,   // Aerial lift, suspended cable car (gondola lift, aerial tramway)
    Funicular = 7,    // Any rail system designed for steep inclines
    Trolleybus = 11,  // Electric buses that draw power from overhead wires using poles
    Monorail = 12     // Railway in which the track consists of a single rail or a beam
};
}
