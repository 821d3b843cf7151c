#pragma once
#include <gtfs/route.h>
#include <gtfs/types.h>

#include <ostream>
#include <string>

namespace gtfsnav::commands
{
/**
 * @brief writes reports line by line, optionally painting route names in the route's color
 */
class printer
{
public:
    explicit printer(std::ostream& out, bool use_color = false);

    void line(const std::string& text);

    // "id: name"
    void entry(const gtfs::Id& id, const std::string& name);
    void route_entry(const gtfs::route& r);

    // "Routes: 3"
    void count(const std::string& label, size_t value);

private:
    std::ostream& out_;
    bool use_color_;
};
}
