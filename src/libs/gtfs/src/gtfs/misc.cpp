#include <gtfs/misc.h>
#include <gtfs/exceptions/invalid_field_format.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace gtfsnav::gtfs
{
std::string append_leading_zero(const std::string& s, bool check)
{
    if (check && s.size() > 2)
        throw invalid_field_format("The string for appending zero is too long: " + s);

    if (s.size() >= 2)
        return s;
    return "0" + s;
}
std::string add_trailing_slash(const std::string& path)
{
    auto extended_path = path;
    if (!extended_path.empty() && extended_path.back() != '/')
        extended_path += "/";
    return extended_path;
}
std::string unquote_text(const std::string& text)
{
    std::string res;
    bool prev_is_quote = false;
    bool prev_is_skipped = false;

    size_t start_index = 0;
    size_t end_index = text.size();

    // Field values that contain quotation marks or commas must be enclosed within quotation marks.
    if (text.size() > 1 && text.front() == quote && text.back() == quote)
    {
        ++start_index;
        --end_index;
    }

    // In addition, each quotation mark in the field value must be preceded with a quotation mark.
    for (size_t i = start_index; i < end_index; ++i)
    {
        if (text[i] != quote)
        {
            res += text[i];
            prev_is_quote = false;
            prev_is_skipped = false;
            continue;
        }

        if (prev_is_quote)
        {
            if (prev_is_skipped)
                res += text[i];

            prev_is_skipped = !prev_is_skipped;
        }
        else
        {
            prev_is_quote = true;
            res += text[i];
        }
    }

    return res;
}
std::string trim_spaces(const std::string& token)
{
    static const std::string delimiters = " \t";
    std::string res = token;
    res.erase(0, res.find_first_not_of(delimiters));
    res.erase(res.find_last_not_of(delimiters) + 1);
    return res;
}
std::string normalize(std::string& token, bool has_quotes)
{
    std::string res = trim_spaces(token);
    if (has_quotes)
        return unquote_text(res);
    return res;
}
uint32_t parse_hex_color(const std::string& hex)
{
    std::string digits = hex;
    if (!digits.empty() && digits.front() == '#')
        digits.erase(0, 1);

    if (digits.size() != 6 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c); }))
        throw invalid_field_format("color is not a six-digit hexadecimal number: " + hex);

    return static_cast<uint32_t>(std::stoul(digits, nullptr, 16));
}
std::string get_hex_color_string(uint32_t color)
{
    std::ostringstream stream;
    stream << std::uppercase << std::hex << std::setw(6) << std::setfill('0') << (color & 0xFFFFFFu);
    return stream.str();
}
std::string get_route_type_string(route_type t)
{
    switch (t)
    {
        case route_type::Tram:
            return "tram";
        case route_type::Subway:
            return "subway";
        case route_type::Rail:
            return "rail";
        case route_type::Bus:
            return "bus";
        case route_type::Ferry:
            return "ferry";
        case route_type::CableTram:
            return "cablecar";
        case route_type::AerialLift:
            return "gondola";
        case route_type::Funicular:
            return "funicular";
        case route_type::Trolleybus:
            return "trolleybus";
        case route_type::Monorail:
            return "monorail";
    }
    return "";
}
route_type get_route_type(int t)
{
    switch (t)
    {
        case 0:
        case 1:
        case 2:
        case 3:
        case 4:
        case 5:
        case 6:
        case 7:
        case 11:
        case 12:
            return static_cast<route_type>(t);
        default:
            throw invalid_field_format("unknown route_type " + std::to_string(t));
    }
}
std::string get_location_type_string(stop_location_type t)
{
    switch (t)
    {
        case stop_location_type::StopOrPlatform:
            return "stop";
        case stop_location_type::Station:
            return "station";
        case stop_location_type::EntranceExit:
            return "entrance/exit";
        case stop_location_type::GenericNode:
            return "generic node";
        case stop_location_type::BoardingArea:
            return "boarding area";
    }
    return "";
}
}
