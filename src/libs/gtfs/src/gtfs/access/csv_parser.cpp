#include "csv_parser.h"

#include <algorithm>

namespace gtfsnav::gtfs::access
{
csv_parser::csv_parser(const std::string & gtfs_directory) : gtfs_path(add_trailing_slash(gtfs_directory)) {}

std::vector<std::string> csv_parser::split_record(const std::string & record, bool is_header)
{
    size_t start_index = 0;
    if (is_header)
    {
        // ignore UTF-8 BOM prefix:
        if (record.size() > 2 && record[0] == '\xef' && record[1] == '\xbb' && record[2] == '\xbf')
            start_index = 3;
    }

    std::vector<std::string> fields;
    fields.reserve(20);

    std::string token;
    token.reserve(record.size());

    bool is_inside_quotes = false;
    bool quotes_in_token = false;

    for (size_t i = start_index; i < record.size(); ++i)
    {
        const char c = record[i];
        if (c == quote)
        {
            is_inside_quotes = !is_inside_quotes;
            quotes_in_token = true;
            token += c;
            continue;
        }

        if (c == csv_separator && !is_inside_quotes)
        {
            fields.emplace_back(normalize(token, quotes_in_token));
            token.clear();
            quotes_in_token = false;
            continue;
        }

        if (c != '\t' && c != '\r')
            token += c;
    }

    fields.emplace_back(normalize(token, quotes_in_token));
    return fields;
}

result csv_parser::read_header(const std::string & csv_filename)
{
    if (csv_stream.is_open())
        csv_stream.close();

    line_number = 0;
    csv_stream.open(gtfs_path + csv_filename);
    if (!csv_stream.is_open())
        return {result_code::ERROR_FILE_ABSENT, "File " + csv_filename + " could not be opened"};

    std::string header;
    if (!getline(csv_stream, header) || header.empty() || header == "\r")
        return {result_code::ERROR_INVALID_FIELD_FORMAT, "Empty header in file " + csv_filename};

    line_number = 1;
    field_sequence = split_record(header, true);
    return result_code::OK;
}

result csv_parser::read_row(std::map<std::string, std::string> & obj)
{
    obj = {};
    std::string row;
    if (!getline(csv_stream, row))
        return {result_code::END_OF_FILE, {}};

    ++line_number;
    if (row.empty() || row == "\r")
        return result_code::OK;

    const std::vector<std::string> fields_values = split_record(row);

    // Rows may be shorter or longer than the header, extra values are dropped
    // and missing ones read as absent.
    const size_t fields_count = std::min(field_sequence.size(), fields_values.size());

    for (size_t i = 0; i < fields_count; ++i)
    {
        if (!fields_values[i].empty())
            obj[field_sequence[i]] = fields_values[i];
    }

    return result_code::OK;
}
}
