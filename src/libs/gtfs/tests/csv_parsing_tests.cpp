#include <catch2/catch.hpp>
#include "../src/gtfs/access/csv_parser.h"
#include "config.h"

using namespace gtfsnav::gtfs::access;

TEST_CASE("Record with empty values")
{
    const auto res = csv_parser::split_record(",, ,");
    REQUIRE(res.size() == 4);
    for (const auto & token : res)
        CHECK(token.empty());
}

TEST_CASE("Header with UTF BOM")
{
    const auto res = csv_parser::split_record("\xef\xbb\xbfstop_id, stop_name", true);
    REQUIRE(res.size() == 2);
    CHECK(res[0] == "stop_id");
    CHECK(res[1] == "stop_name");
}

TEST_CASE("BOM is kept outside of the header")
{
    const auto res = csv_parser::split_record("\xef\xbb\xbfA1");
    REQUIRE(res.size() == 1);
    CHECK(res[0].size() == 5);
}

TEST_CASE("Separator inside quotation marks")
{
    const auto res = csv_parser::split_record(R"csv(DADAN,"Doing Ave / D Ave N, (Demo)",,"36.909489")csv");
    REQUIRE(res.size() == 4);
    CHECK(res[1] == "Doing Ave / D Ave N, (Demo)");
    CHECK(res[2].empty());
    CHECK(res[3] == "36.909489");
}

TEST_CASE("Quotation marks inside an unquoted value")
{
    const auto res = csv_parser::split_record(R"(Stop "A", platform 2)");
    REQUIRE(res.size() == 2);
    CHECK(res[0] == R"(Stop "A")");
    CHECK(res[1] == "platform 2");
}

TEST_CASE("Escaped quotation marks")
{
    const auto res = csv_parser::split_record(R"("The ""Downtown"" line, northbound")");
    REQUIRE(res.size() == 1);
    CHECK(res[0] == R"(The "Downtown" line, northbound)");
}

TEST_CASE("Quoted empty value and quoted quote")
{
    SECTION("empty")
    {
        const auto res = csv_parser::split_record(",\"\"");
        REQUIRE(res.size() == 2);
        CHECK(res[1].empty());
    }
    SECTION("single quote")
    {
        const auto res = csv_parser::split_record(",\"\"\"\"");
        REQUIRE(res.size() == 2);
        CHECK(res[1] == "\"");
    }
}

TEST_CASE("Carriage returns and tabs are dropped")
{
    const auto res = csv_parser::split_record("AB1,\t8:00:00\r");
    REQUIRE(res.size() == 2);
    CHECK(res[1] == "8:00:00");
}

TEST_CASE("Rows are read by header name with line numbers")
{
    csv_parser parser(TEST_FOLDER_PATH "/resources/sample_feed");
    REQUIRE(parser.read_header("trips.txt") == result_code::OK);
    CHECK(parser.current_line() == 1);

    std::map<std::string, std::string> row;
    REQUIRE(parser.read_row(row) == result_code::OK);
    CHECK(parser.current_line() == 2);
    CHECK(row.at("trip_id") == "AB1");
    CHECK(row.at("trip_headsign") == "to Bullfrog");
    // empty values are not stored
    CHECK(row.count("trip_short_name") == 0);

    size_t rows = 1;
    while (parser.read_row(row) == result_code::OK)
        ++rows;
    CHECK(rows == 11);
}

TEST_CASE("Absent file")
{
    csv_parser parser(TEST_FOLDER_PATH "/resources/missing_table");
    const auto res = parser.read_header("stop_times.txt");
    CHECK(res == result_code::ERROR_FILE_ABSENT);
    CHECK(res.message.find("stop_times.txt") != std::string::npos);
}
