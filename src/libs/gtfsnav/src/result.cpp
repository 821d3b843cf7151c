#include <gtfsnav/result.h>

namespace gtfsnav
{
namespace
{
std::string describe(result_code code, const std::string& subject)
{
    switch (code)
    {
        case result_code::OK:
            return "OK";
        case result_code::NoSuchRoute:
            return "No such route: " + subject;
        case result_code::NoSuchStop:
            return "No such stop: " + subject;
        case result_code::NoSuchTrip:
            return "No such trip: " + subject;
        case result_code::ErrorGettingDescendants:
            return "Error getting descendants for stop " + subject;
        case result_code::CyclicStopHierarchy:
            return "Cyclic stop hierarchy at stop " + subject;
        case result_code::InvalidCommand:
            return "Invalid command: " + subject;
        case result_code::SubcommandRequired:
            return "Subcommand required for " + subject;
        case result_code::ErrorGettingRoute:
            return "Error getting route";
        case result_code::ErrorGettingStop:
            return "Error getting stop";
        case result_code::ErrorGettingTrip:
            return "Error getting trip";
        case result_code::ErrorExecutingCommandForRoute:
            return "Error executing command for route " + subject;
        case result_code::ErrorExecutingCommandForStop:
            return "Error executing command for stop " + subject;
        case result_code::ErrorExecutingCommandForTrip:
            return "Error executing command for trip " + subject;
        case result_code::RoutesCommandError:
            return "Error interpreting routes command";
        case result_code::StopsCommandError:
            return "Error interpreting stops subcommand";
        case result_code::TripsCommandError:
            return "Error interpreting trips command";
    }
    return "Unknown error";
}
}

result::result(result_code code, std::string subject, result cause) :
    code_(code),
    subject_(std::move(subject)),
    cause_(std::make_shared<const result>(std::move(cause)))
{
}

const result& result::root_cause() const
{
    const result* current = this;
    while (current->cause_)
        current = current->cause_.get();
    return *current;
}

std::string result::message() const
{
    std::string res = describe(code_, subject_);
    for (const result* current = cause_.get(); current; current = current->cause_.get())
        res += ": " + describe(current->code_, current->subject_);
    return res;
}
}
