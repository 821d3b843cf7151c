#include <gtfsnav/commands/printer.h>

#include <fmt/color.h>
#include <fmt/format.h>

namespace gtfsnav::commands
{
printer::printer(std::ostream& out, bool use_color) :
    out_(out),
    use_color_(use_color)
{
}

void printer::line(const std::string& text)
{
    out_ << text << '\n';
}

void printer::entry(const gtfs::Id& id, const std::string& name)
{
    out_ << fmt::format("{}: {}", id, name) << '\n';
}

void printer::route_entry(const gtfs::route& r)
{
    if (!use_color_ || !r.route_color)
    {
        entry(r.route_id, r.display_name());
        return;
    }

    auto style = fmt::fg(fmt::rgb(*r.route_color));
    if (r.route_text_color)
        style = fmt::bg(fmt::rgb(*r.route_color)) | fmt::fg(fmt::rgb(*r.route_text_color));
    out_ << fmt::format("{}: {}", r.route_id, fmt::format(style, "{}", r.display_name())) << '\n';
}

void printer::count(const std::string& label, size_t value)
{
    out_ << fmt::format("{}: {}", label, value) << '\n';
}
}
