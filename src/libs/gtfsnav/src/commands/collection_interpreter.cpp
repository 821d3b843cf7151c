#include <gtfsnav/commands/collection_interpreter.h>
#include <gtfsnav/commands/routes_interpreter.h>
#include <gtfsnav/commands/schedule_interpreter.h>
#include <gtfsnav/commands/stops_interpreter.h>
#include <gtfsnav/commands/trips_interpreter.h>

#include <logging/logger.h>

namespace gtfsnav::commands
{
using navigation::node_kind;

namespace
{
result_code getting_error(node_kind kind)
{
    switch (kind)
    {
        case node_kind::Route: return result_code::ErrorGettingRoute;
        case node_kind::Stop: return result_code::ErrorGettingStop;
        case node_kind::Trip: return result_code::ErrorGettingTrip;
        case node_kind::Feed: break;
    }
    return result_code::InvalidCommand;
}

result_code executing_error(node_kind kind)
{
    switch (kind)
    {
        case node_kind::Route: return result_code::ErrorExecutingCommandForRoute;
        case node_kind::Stop: return result_code::ErrorExecutingCommandForStop;
        case node_kind::Trip: return result_code::ErrorExecutingCommandForTrip;
        case node_kind::Feed: break;
    }
    return result_code::InvalidCommand;
}
}

collection_interpreter::collection_interpreter(navigation::node::ptr current, printer& out, node_kind kind) :
    node_(std::move(current)),
    printer_(out),
    kind_(kind)
{
}

result collection_interpreter::interpret(const command_path& path)
{
    if (path.empty())
        return {result_code::SubcommandRequired, navigation::collection_name(kind_)};

    const auto& head = path.head();
    if (head == "list")
    {
        list();
        return result_code::OK;
    }
    if (head == "info")
    {
        printer_.count(label(), count());
        return result_code::OK;
    }

    // The head alone is the id when it names an entity; longer dotted runs only when it does not.
    for (size_t taken = 1; taken <= path.size(); ++taken)
    {
        const auto id = path.join(taken);
        if (contains(id))
            return enter(id, path.drop(taken));
    }

    return {result_code::InvalidCommand, path.to_string()};
}

result collection_interpreter::enter(const gtfs::Id& id, const command_path& rest)
{
    navigation::node::ptr child;
    if (auto res = navigation::make_child(node_, kind_, id, child); res != result_code::OK)
        return {getting_error(kind_), id, std::move(res)};

    LOG(DEBUG) << "entering " << child->path() << " (depth " << child->depth() << ")";

    schedule_interpreter interpreter(child, printer_);
    if (auto res = interpreter.interpret(rest); res != result_code::OK)
        return {executing_error(kind_), id, std::move(res)};
    return result_code::OK;
}

std::unique_ptr<collection_interpreter> make_collection_interpreter(node_kind kind,
                                                                    navigation::node::ptr current,
                                                                    printer& out)
{
    switch (kind)
    {
        case node_kind::Route:
            return std::make_unique<routes_interpreter>(std::move(current), out);
        case node_kind::Stop:
            return std::make_unique<stops_interpreter>(std::move(current), out);
        case node_kind::Trip:
            return std::make_unique<trips_interpreter>(std::move(current), out);
        case node_kind::Feed:
            break;
    }
    return nullptr;
}
}
