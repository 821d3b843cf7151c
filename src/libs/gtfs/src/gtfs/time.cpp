#include <gtfs/time.h>
#include <gtfs/misc.h>
#include <gtfs/exceptions/invalid_field_format.h>

#include <algorithm>
#include <cctype>

namespace gtfsnav::gtfs
{
namespace
{
uint16_t parse_time_segment(const std::string & segment, const std::string & raw_time_str)
{
    if (segment.empty() || segment.size() > 3 ||
        !std::all_of(segment.begin(), segment.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw invalid_field_format("time is not in [H]H:MM:SS format: " + raw_time_str);

    return static_cast<uint16_t>(std::stoi(segment));
}
}

bool time::limit_hours_to_24max()
{
    if (hh < 24)
        return false;

    hh = hh % 24;
    set_total_seconds();
    return true;
}

void time::set_total_seconds() { total_seconds = hh * 60 * 60 + mm * 60 + ss; }

time::time(const std::string & raw_time_str) : raw_time(trim_spaces(raw_time_str))
{
    if (raw_time.empty())
        return;

    const size_t first = raw_time.find(':');
    const size_t second = first == std::string::npos ? std::string::npos : raw_time.find(':', first + 1);
    if (second == std::string::npos || raw_time.find(':', second + 1) != std::string::npos)
        throw invalid_field_format("time is not in [H]H:MM:SS format: " + raw_time_str);

    hh = parse_time_segment(raw_time.substr(0, first), raw_time_str);
    mm = parse_time_segment(raw_time.substr(first + 1, second - first - 1), raw_time_str);
    ss = parse_time_segment(raw_time.substr(second + 1), raw_time_str);

    if (mm >= 60 || ss >= 60)
        throw invalid_field_format("time minutes/seconds wrong value: " + std::to_string(mm) +
                                 " minutes, " + std::to_string(ss) + " seconds");

    limit_hours_to_24max();
    set_total_seconds();
    time_is_provided = true;
}

time::time(uint16_t hours, uint16_t minutes, uint16_t seconds)
        : hh(hours), mm(minutes), ss(seconds)
{
    if (mm >= 60 || ss >= 60)
        throw invalid_field_format("time is out of range: " + std::to_string(mm) + " minutes " +
                                 std::to_string(ss) + " seconds");

    limit_hours_to_24max();
    set_total_seconds();
    raw_time = to_string();
    time_is_provided = true;
}

bool time::is_provided() const { return time_is_provided; }

size_t time::get_total_seconds() const { return total_seconds; }

std::tuple<uint16_t, uint16_t, uint16_t> time::get_hh_mm_ss() const { return {hh, mm, ss}; }

std::string time::get_raw_time() const { return raw_time; }

std::string time::to_string() const
{
    return append_leading_zero(std::to_string(hh)) + ":" + append_leading_zero(std::to_string(mm)) + ":" +
           append_leading_zero(std::to_string(ss));
}

bool operator==(const time& lhs, const time& rhs)
{
    return lhs.get_hh_mm_ss() == rhs.get_hh_mm_ss() && lhs.is_provided() == rhs.is_provided();
}

bool operator!=(const time& lhs, const time& rhs)
{
    return !(lhs == rhs);
}
}
