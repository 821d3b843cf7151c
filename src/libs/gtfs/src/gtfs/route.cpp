#include <gtfs/route.h>

namespace gtfsnav::gtfs
{
namespace
{
template<typename... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

std::optional<Text> route::route_long_name() const
{
    return std::visit(overloaded{[](const short_name&) -> std::optional<Text> { return std::nullopt; },
                                 [](const long_name& n) -> std::optional<Text> { return n.route_long_name; },
                                 [](const long_and_short_name& n) -> std::optional<Text> { return n.route_long_name; }},
                      name);
}

std::optional<Text> route::route_short_name() const
{
    return std::visit(overloaded{[](const short_name& n) -> std::optional<Text> { return n.route_short_name; },
                                 [](const long_name&) -> std::optional<Text> { return std::nullopt; },
                                 [](const long_and_short_name& n) -> std::optional<Text> { return n.route_short_name; }},
                      name);
}

Text route::display_name() const
{
    return std::visit(overloaded{[](const short_name& n) { return n.route_short_name; },
                                 [](const long_name& n) { return n.route_long_name; },
                                 [](const long_and_short_name& n) {
                                     return n.route_long_name + " (" + n.route_short_name + ")";
                                 }},
                      name);
}

std::optional<route_name> make_route_name(const Text& short_name_text, const Text& long_name_text)
{
    if (!short_name_text.empty() && !long_name_text.empty())
        return long_and_short_name{long_name_text, short_name_text};
    if (!short_name_text.empty())
        return short_name{short_name_text};
    if (!long_name_text.empty())
        return long_name{long_name_text};
    return std::nullopt;
}
}
