#pragma once
#include <gtfs/access/result.h>
#include <gtfs/misc.h>

#include <fstream>
#include <vector>
#include <string>
#include <map>

namespace gtfsnav::gtfs::access
{
class csv_parser
{
public:
    csv_parser() = default;
    explicit csv_parser(const std::string & gtfs_directory);

    result read_header(const std::string & csv_filename);
    result read_row(std::map<std::string, std::string> & obj);

    // 1-based number of the last line read, the header being line 1
    size_t current_line() const { return line_number; }

    static std::vector<std::string> split_record(const std::string & record,
                                                 bool is_header = false);

private:
    std::vector<std::string> field_sequence;
    std::string gtfs_path;
    std::ifstream csv_stream;
    size_t line_number = 0;
};

}
