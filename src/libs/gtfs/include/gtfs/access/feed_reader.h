#pragma once

#include <gtfs/schedule.h>
#include <gtfs/access/result.h>

#include <functional>
#include <map>
#include <string>

namespace gtfsnav::gtfs::access
{
using parsed_csv_row = std::map<std::string, std::string>;

/**
 * @brief receives the progress of a feed_reader, one call pair per table
 */
class event_handler
{
public:
    virtual ~event_handler() = default;

    virtual void on_file_opened(const std::string& filename) = 0;
    virtual void on_table_loaded(const std::string& filename, size_t record_count) = 0;
};

class feed_reader
{
public:
    struct read_config
    {
        bool stops = true;
        bool routes = true;
        bool trips = true;
        bool stop_times = true;

        // Reject feeds whose parent_station references form a cycle.
        bool validate_stop_hierarchy = true;
    };

    feed_reader(schedule& feed, const std::string& directory, event_handler* handler = nullptr);
    result read(const read_config& config) noexcept;

protected:
    result parse_csv(const std::string& filename,
                     const std::function<result(const parsed_csv_row& record)>& add_entity) noexcept;

    result read_stops();

    result read_routes();

    result read_trips();

    result read_stop_times();

    result check_stop_hierarchy() const;

private:
    schedule& feed_;
    std::string gtfs_directory_;
    event_handler* handler_;
};
}
