#pragma once
#include <cstdint>
#include <string>
#include <tuple>

namespace gtfsnav::gtfs
{
// Time in GTFS is in the HH:MM:SS format (H:MM:SS is also accepted).
// Times past midnight (e.g. 25:10:00) are kept as wall-clock time of day, hours are taken modulo 24.
class time
{
public:
    time() = default;
    explicit time(const std::string & raw_time_str);
    time(uint16_t hours, uint16_t minutes, uint16_t seconds);
    bool is_provided() const;
    size_t get_total_seconds() const;
    std::tuple<uint16_t, uint16_t, uint16_t> get_hh_mm_ss() const;
    std::string get_raw_time() const;
    std::string to_string() const;
    bool limit_hours_to_24max();

private:
    void set_total_seconds();
    bool time_is_provided = false;
    std::string raw_time;
    size_t total_seconds = 0;
    uint16_t hh = 0;
    uint16_t mm = 0;
    uint16_t ss = 0;
};

bool operator==(const time & lhs, const time & rhs);
bool operator!=(const time & lhs, const time & rhs);

}
