#include <gtfs/access/feed_reader.h>
#include <gtfs/exceptions/invalid_field_format.h>
#include <gtfs/misc.h>
#include "csv_parser.h"

#include <set>
#include <stdexcept>
#include <string>
#include <sys/stat.h>

namespace gtfsnav::gtfs::access
{
namespace
{
std::string get_value_or_default(const parsed_csv_row& container, const std::string& key,
                                 const std::string& default_value = "")
{
    const auto it = container.find(key);
    if (it == container.end())
        return default_value;

    return it->second;
}

std::optional<std::string> get_optional(const parsed_csv_row& container, const std::string& key)
{
    const auto it = container.find(key);
    if (it == container.end())
        return std::nullopt;

    return it->second;
}

// Throws std::out_of_range naming the field, mapped to ERROR_REQUIRED_FIELD_ABSENT.
const std::string& get_required(const parsed_csv_row& container, const std::string& key)
{
    const auto it = container.find(key);
    if (it == container.end())
        throw std::out_of_range("Required field '" + key + "' is absent");

    return it->second;
}

int parse_int(const std::string& value, const std::string& key)
{
    size_t pos = 0;
    int res = 0;
    try
    {
        res = std::stoi(value, &pos);
    }
    catch (const std::logic_error&)
    {
        throw invalid_field_format("'" + key + "' is not an integer: " + value);
    }
    if (pos != value.size())
        throw invalid_field_format("'" + key + "' is not an integer: " + value);
    return res;
}

size_t parse_non_negative(const std::string& value, const std::string& key)
{
    const int res = parse_int(value, key);
    if (res < 0)
        throw invalid_field_format("'" + key + "' must be non-negative: " + value);
    return static_cast<size_t>(res);
}

double parse_double(const std::string& value, const std::string& key)
{
    size_t pos = 0;
    double res = 0.0;
    try
    {
        res = std::stod(value, &pos);
    }
    catch (const std::logic_error&)
    {
        throw invalid_field_format("'" + key + "' is not a number: " + value);
    }
    if (pos != value.size())
        throw invalid_field_format("'" + key + "' is not a number: " + value);
    return res;
}

// Enumerations are coded 0..max_value.
template<class T>
T parse_enum(const std::string& value, const std::string& key, int max_value)
{
    const int code = parse_int(value, key);
    if (code < 0 || code > max_value)
        throw invalid_field_format("'" + key + "' has unknown value " + value);
    return static_cast<T>(code);
}

template<class T>
void set_field(std::optional<T>& field, const parsed_csv_row& row, const std::string& key, int max_value)
{
    if (const auto value = get_optional(row, key))
        field = parse_enum<T>(*value, key, max_value);
}

void set_field(accessibility& field, const parsed_csv_row& row, const std::string& key)
{
    if (const auto value = get_optional(row, key))
        field = parse_enum<accessibility>(*value, key, 2);
}

void set_time(time& field, const parsed_csv_row& row, const std::string& key)
{
    if (const auto value = get_optional(row, key))
        field = time(*value);
}

// Throw if not valid WGS84 decimal degrees.
double parse_coordinate(const std::string& value, const std::string& key, double limit)
{
    const double res = parse_double(value, key);
    if (res < -limit || res > limit)
        throw invalid_field_format("'" + key + "' is out of range: " + value);
    return res;
}

std::optional<double> get_latitude(const parsed_csv_row& row)
{
    if (const auto value = get_optional(row, "stop_lat"))
        return parse_coordinate(*value, "stop_lat", 90.0);
    return std::nullopt;
}

std::optional<double> get_longitude(const parsed_csv_row& row)
{
    if (const auto value = get_optional(row, "stop_lon"))
        return parse_coordinate(*value, "stop_lon", 180.0);
    return std::nullopt;
}

location_details make_location_details(const parsed_csv_row& row)
{
    auto type = stop_location_type::StopOrPlatform;
    if (const auto value = get_optional(row, "location_type"))
        type = parse_enum<stop_location_type>(*value, "location_type", 4);

    const auto parent = get_optional(row, "parent_station");

    switch (type)
    {
        case stop_location_type::StopOrPlatform:
        {
            stop_details details;
            details.stop_name = get_required(row, "stop_name");
            details.stop_lat = parse_coordinate(get_required(row, "stop_lat"), "stop_lat", 90.0);
            details.stop_lon = parse_coordinate(get_required(row, "stop_lon"), "stop_lon", 180.0);
            details.parent_station = parent;
            return details;
        }
        case stop_location_type::Station:
        {
            if (parent)
                throw invalid_field_format("station cannot have a parent_station: " + *parent);

            station_details details;
            details.stop_name = get_required(row, "stop_name");
            details.stop_lat = parse_coordinate(get_required(row, "stop_lat"), "stop_lat", 90.0);
            details.stop_lon = parse_coordinate(get_required(row, "stop_lon"), "stop_lon", 180.0);
            return details;
        }
        case stop_location_type::EntranceExit:
        {
            entrance_exit_details details;
            details.stop_name = get_required(row, "stop_name");
            details.stop_lat = parse_coordinate(get_required(row, "stop_lat"), "stop_lat", 90.0);
            details.stop_lon = parse_coordinate(get_required(row, "stop_lon"), "stop_lon", 180.0);
            details.parent_station = get_required(row, "parent_station");
            return details;
        }
        case stop_location_type::GenericNode:
            return generic_node_details{get_optional(row, "stop_name"), get_latitude(row), get_longitude(row),
                                        get_required(row, "parent_station")};
        case stop_location_type::BoardingArea:
            return boarding_area_details{get_optional(row, "stop_name"), get_latitude(row), get_longitude(row),
                                         get_required(row, "parent_station")};
    }
    throw invalid_field_format("unsupported location_type");
}

bool directory_exists(const std::string& path)
{
    struct stat info{};
    return stat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);
}
}

feed_reader::feed_reader(schedule& feed, const std::string& directory, event_handler* handler) :
    feed_(feed),
    gtfs_directory_(add_trailing_slash(directory)),
    handler_(handler)
{
}

result feed_reader::read(const read_config& config) noexcept
{
    if (!directory_exists(gtfs_directory_))
        return {result_code::ERROR_INVALID_GTFS_PATH, "Feed directory " + gtfs_directory_ + " does not exist"};

    if (config.stops)
        if (auto res = read_stops(); res != result_code::OK)
            return res;

    if (config.routes)
        if (auto res = read_routes(); res != result_code::OK)
            return res;

    if (config.trips)
        if (auto res = read_trips(); res != result_code::OK)
            return res;

    if (config.stop_times)
        if (auto res = read_stop_times(); res != result_code::OK)
            return res;

    if (config.stops && config.validate_stop_hierarchy)
        if (auto res = check_stop_hierarchy(); res != result_code::OK)
            return res;

    return result_code::OK;
}

result feed_reader::parse_csv(const std::string& filename,
                              const std::function<result(const parsed_csv_row&)>& add_entity) noexcept
{
    if (handler_)
        handler_->on_file_opened(filename);

    csv_parser parser(gtfs_directory_);
    auto res_header = parser.read_header(filename);
    if (res_header.code != result_code::OK)
        return res_header;

    size_t record_count = 0;
    parsed_csv_row record;
    result res_row;
    while ((res_row = parser.read_row(record)) != result_code::END_OF_FILE)
    {
        if (res_row != result_code::OK)
            return res_row;

        if (record.empty())
            continue;

        result res = add_entity(record);
        if (res != result_code::OK)
        {
            res.message = filename + ":" + std::to_string(parser.current_line()) + ": " + res.message;
            return res;
        }
        ++record_count;
    }

    if (handler_)
        handler_->on_table_loaded(filename, record_count);

    return {result_code::OK, {"Parsed " + filename}};
}

result feed_reader::read_stops()
{
    auto handler = [this](const parsed_csv_row& row) -> result {
        stop s;

        try
        {
            // Required:
            s.stop_id = get_required(row, "stop_id");
            s.details = make_location_details(row);

            // Optional:
            set_field(s.wheelchair_boarding, row, "wheelchair_boarding");
        }
        catch (const std::out_of_range& ex)
        {
            return {result_code::ERROR_REQUIRED_FIELD_ABSENT, ex.what()};
        }
        catch (const std::invalid_argument& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }
        catch (const invalid_field_format& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }

        // Optional:
        s.stop_code = get_optional(row, "stop_code");
        s.tts_stop_name = get_optional(row, "tts_stop_name");
        s.stop_desc = get_optional(row, "stop_desc");
        s.zone_id = get_optional(row, "zone_id");
        s.stop_url = get_optional(row, "stop_url");
        s.stop_timezone = get_optional(row, "stop_timezone");
        s.level_id = get_optional(row, "level_id");
        s.platform_code = get_optional(row, "platform_code");

        feed_.stops.emplace(s.stop_id, std::move(s));

        return result_code::OK;
    };
    return parse_csv(file_stops, handler);
}

result feed_reader::read_routes()
{
    auto handler = [this](const parsed_csv_row& row) -> result {
        route r;

        try
        {
            // Required fields:
            r.route_id = get_required(row, "route_id");
            r.route_type = get_route_type(parse_int(get_required(row, "route_type"), "route_type"));

            // Optional:
            if (const auto value = get_optional(row, "route_color"))
                r.route_color = parse_hex_color(*value);
            if (const auto value = get_optional(row, "route_text_color"))
                r.route_text_color = parse_hex_color(*value);
            if (const auto value = get_optional(row, "route_sort_order"))
                r.route_sort_order = parse_non_negative(*value, "route_sort_order");
            set_field(r.continuous_pickup, row, "continuous_pickup", 3);
            set_field(r.continuous_drop_off, row, "continuous_drop_off", 3);
        }
        catch (const std::out_of_range& ex)
        {
            return {result_code::ERROR_REQUIRED_FIELD_ABSENT, ex.what()};
        }
        catch (const std::invalid_argument& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }
        catch (const invalid_field_format& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }

        // Conditionally required:
        auto name = make_route_name(get_value_or_default(row, "route_short_name"),
                                    get_value_or_default(row, "route_long_name"));
        if (!name)
        {
            return {result_code::ERROR_REQUIRED_FIELD_ABSENT,
                    "'route_short_name' or 'route_long_name' must be specified"};
        }
        r.name = std::move(*name);
        r.agency_id = get_optional(row, "agency_id");

        r.route_desc = get_optional(row, "route_desc");
        r.route_url = get_optional(row, "route_url");
        r.network_id = get_optional(row, "network_id");

        feed_.routes.emplace(r.route_id, std::move(r));

        return result_code::OK;
    };
    return parse_csv(file_routes, handler);
}

result feed_reader::read_trips()
{
    auto handler = [this](const parsed_csv_row& row) -> result {
        trip t;
        try
        {
            // Required:
            t.route_id = get_required(row, "route_id");
            t.service_id = get_required(row, "service_id");
            t.trip_id = get_required(row, "trip_id");

            // Optional:
            set_field(t.direction_id, row, "direction_id", 1);
            set_field(t.wheelchair_accessible, row, "wheelchair_accessible");
            set_field(t.bikes_allowed, row, "bikes_allowed");
        }
        catch (const std::out_of_range& ex)
        {
            return {result_code::ERROR_REQUIRED_FIELD_ABSENT, ex.what()};
        }
        catch (const std::invalid_argument& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }
        catch (const invalid_field_format& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }

        // Optional:
        t.shape_id = get_optional(row, "shape_id");
        t.trip_headsign = get_optional(row, "trip_headsign");
        t.trip_short_name = get_optional(row, "trip_short_name");
        t.block_id = get_optional(row, "block_id");

        feed_.trips.emplace(t.trip_id, std::move(t));

        return result_code::OK;
    };
    return parse_csv(file_trips, handler);
}

result feed_reader::read_stop_times()
{
    auto handler = [this](const parsed_csv_row& row) -> result {
        stop_time st;

        try
        {
            // Required:
            st.trip_id = get_required(row, "trip_id");
            st.stop_sequence = parse_non_negative(get_required(row, "stop_sequence"), "stop_sequence");

            // Conditionally required:
            st.stop_id = get_optional(row, "stop_id");
            st.location_group_id = get_optional(row, "location_group_id");
            st.location_id = get_optional(row, "location_id");
            if (!st.stop_id && !st.location_group_id && !st.location_id)
                throw std::out_of_range("Required field 'stop_id' is absent");

            set_time(st.arrival_time, row, "arrival_time");
            set_time(st.departure_time, row, "departure_time");
            set_time(st.start_pickup_drop_off_window, row, "start_pickup_drop_off_window");
            set_time(st.end_pickup_drop_off_window, row, "end_pickup_drop_off_window");

            // Optional:
            set_field(st.pickup_type, row, "pickup_type", 3);
            set_field(st.drop_off_type, row, "drop_off_type", 3);
            set_field(st.continuous_pickup, row, "continuous_pickup", 3);
            set_field(st.continuous_drop_off, row, "continuous_drop_off", 3);
            set_field(st.timepoint, row, "timepoint", 1);

            if (const auto value = get_optional(row, "shape_dist_traveled"))
            {
                st.shape_dist_traveled = parse_double(*value, "shape_dist_traveled");
                if (*st.shape_dist_traveled < 0.0)
                    throw invalid_field_format("'shape_dist_traveled' must be non-negative: " + *value);
            }
        }
        catch (const std::out_of_range& ex)
        {
            return {result_code::ERROR_REQUIRED_FIELD_ABSENT, ex.what()};
        }
        catch (const std::invalid_argument& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }
        catch (const invalid_field_format& ex)
        {
            return {result_code::ERROR_INVALID_FIELD_FORMAT, ex.what()};
        }

        // Optional fields:
        st.stop_headsign = get_optional(row, "stop_headsign");
        st.pickup_booking_rule_id = get_optional(row, "pickup_booking_rule_id");
        st.drop_off_booking_rule_id = get_optional(row, "drop_off_booking_rule_id");

        feed_.add_stop_time(std::move(st));

        return result_code::OK;
    };
    return parse_csv(file_stop_times, handler);
}

result feed_reader::check_stop_hierarchy() const
{
    // Walk up from every stop, a parent chain that reaches a stop twice is a cycle.
    std::set<Id> acyclic;
    for (const auto& [stop_id, s] : feed_.stops)
    {
        std::set<Id> chain;
        std::optional<Id> current = stop_id;
        while (current && !acyclic.count(*current))
        {
            if (!chain.insert(*current).second)
            {
                return {result_code::ERROR_INVALID_STOP_HIERARCHY,
                        file_stops + ": parent_station references of stop " + stop_id + " form a cycle"};
            }

            const auto it = feed_.stops.find(*current);
            current = it == feed_.stops.end() ? std::nullopt : it->second.parent_station();
        }
        acyclic.insert(chain.begin(), chain.end());
    }
    return result_code::OK;
}
}
