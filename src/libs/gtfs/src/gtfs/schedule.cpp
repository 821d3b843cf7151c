#include <gtfs/schedule.h>

#include <numeric>

namespace gtfsnav::gtfs
{
size_t schedule::stop_time_count() const
{
    return std::accumulate(stop_times.begin(), stop_times.end(), size_t{0},
                           [](size_t sum, const auto& group) { return sum + group.second.size(); });
}

bool schedule::empty() const
{
    return stops.empty() && routes.empty() && trips.empty() && stop_times.empty();
}

void schedule::add_stop_time(stop_time st)
{
    auto& group = stop_times[st.trip_id];
    group.push_back(std::move(st));
}
}
