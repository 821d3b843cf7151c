#include <gtfsnav/commands/schedule_interpreter.h>
#include <gtfsnav/commands/collection_interpreter.h>

#include <gtfs/misc.h>

namespace gtfsnav::commands
{
using navigation::node_kind;

namespace
{
struct collection_command
{
    const char* keyword;
    node_kind kind;
    result_code error;
};

const collection_command collection_commands[] = {
        {"routes", node_kind::Route, result_code::RoutesCommandError},
        {"stops", node_kind::Stop, result_code::StopsCommandError},
        {"trips", node_kind::Trip, result_code::TripsCommandError},
};
}

schedule_interpreter::schedule_interpreter(navigation::node::ptr current, printer& out) :
    node_(std::move(current)),
    printer_(out)
{
}

result schedule_interpreter::interpret(const command_path& path)
{
    if (path.empty())
        return {result_code::SubcommandRequired, node_->is_root() ? std::string("feed") : node_->path()};

    const auto& head = path.head();
    if (head == "info")
    {
        info();
        return result_code::OK;
    }

    for (const auto& command : collection_commands)
    {
        if (head != command.keyword)
            continue;

        const auto rest = path.tail();
        if (rest.empty())
            return {result_code::SubcommandRequired, head};

        auto interpreter = make_collection_interpreter(command.kind, node_, printer_);
        if (auto res = interpreter->interpret(rest); res != result_code::OK)
            return {command.error, {}, std::move(res)};
        return result_code::OK;
    }

    return {result_code::InvalidCommand, path.to_string()};
}

void schedule_interpreter::info()
{
    const auto& s = node_->get_schedule();
    printer_.line(node_->header());
    if (!node_->is_root())
    {
        printer_.line("Path: " + node_->path());
        describe_entity();
    }
    printer_.count("Stops", s.stops.size());
    printer_.count("Routes", s.routes.size());
    printer_.count("Trips", s.trips.size());
    printer_.count("Stop times", s.stop_time_count());
}

// Type of the selected stop or route, and the route's colors when the feed gives them.
void schedule_interpreter::describe_entity()
{
    const auto& s = node_->get_schedule();
    switch (node_->kind())
    {
        case node_kind::Stop:
            if (const auto it = s.stops.find(node_->id()); it != s.stops.end())
                printer_.line("Type: " + gtfs::get_location_type_string(it->second.location_type()));
            break;
        case node_kind::Route:
            if (const auto it = s.routes.find(node_->id()); it != s.routes.end())
            {
                const auto& r = it->second;
                printer_.line("Type: " + gtfs::get_route_type_string(r.route_type));
                if (r.route_color)
                    printer_.line("Color: #" + gtfs::get_hex_color_string(*r.route_color));
                if (r.route_text_color)
                    printer_.line("Text color: #" + gtfs::get_hex_color_string(*r.route_text_color));
            }
            break;
        case node_kind::Trip:
        case node_kind::Feed:
            break;
    }
}
}
