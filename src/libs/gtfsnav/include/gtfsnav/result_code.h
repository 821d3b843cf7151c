#pragma once
namespace gtfsnav
{
enum class result_code
{
    OK,

    // projection
    NoSuchRoute,
    NoSuchStop,
    NoSuchTrip,
    ErrorGettingDescendants,
    CyclicStopHierarchy,

    // command dispatch
    InvalidCommand,
    SubcommandRequired,
    ErrorGettingRoute,
    ErrorGettingStop,
    ErrorGettingTrip,
    ErrorExecutingCommandForRoute,
    ErrorExecutingCommandForStop,
    ErrorExecutingCommandForTrip,
    RoutesCommandError,
    StopsCommandError,
    TripsCommandError
};
}
