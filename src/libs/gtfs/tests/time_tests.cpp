#include <catch2/catch.hpp>
#include <gtfs/exceptions/invalid_field_format.h>
#include <gtfs/time.h>

using gtfsnav::gtfs::invalid_field_format;

TEST_CASE("Time in H:MM:SS format")
{
    gtfsnav::gtfs::time stop_time("6:05:00");
    REQUIRE(stop_time.is_provided());
    CHECK(stop_time.get_hh_mm_ss() == std::make_tuple(6, 5, 0));
    CHECK(stop_time.get_raw_time() == "6:05:00");
    CHECK(stop_time.get_total_seconds() == 6 * 60 * 60 + 5 * 60);
    CHECK(stop_time.to_string() == "06:05:00");
}

TEST_CASE("Hours past midnight are taken modulo 24")
{
    gtfsnav::gtfs::time stop_time("25:10:30");
    REQUIRE(stop_time.is_provided());
    CHECK(stop_time.get_hh_mm_ss() == std::make_tuple(1, 10, 30));
    CHECK(stop_time.get_raw_time() == "25:10:30");
    CHECK(stop_time.get_total_seconds() == 1 * 60 * 60 + 10 * 60 + 30);
}

TEST_CASE("Time from integers")
{
    gtfsnav::gtfs::time stop_time(14, 30, 0);
    CHECK(stop_time.is_provided());
    CHECK(stop_time.get_hh_mm_ss() == std::make_tuple(14, 30, 0));
    CHECK(stop_time.to_string() == "14:30:00");
    CHECK(stop_time == gtfsnav::gtfs::time("14:30:00"));
    CHECK(stop_time != gtfsnav::gtfs::time("14:30:01"));
}

TEST_CASE("Surrounding spaces are ignored")
{
    gtfsnav::gtfs::time stop_time(" 8:00:00 ");
    CHECK(stop_time.get_total_seconds() == 8 * 60 * 60);
}

TEST_CASE("Invalid time format")
{
    CHECK_THROWS_AS(gtfsnav::gtfs::time("12/10/00"), invalid_field_format);
    CHECK_THROWS_AS(gtfsnav::gtfs::time("12:10"), invalid_field_format);
    CHECK_THROWS_AS(gtfsnav::gtfs::time("12:10:00:00"), invalid_field_format);
    CHECK_THROWS_AS(gtfsnav::gtfs::time("12:60:00"), invalid_field_format);
    CHECK_THROWS_AS(gtfsnav::gtfs::time("12:10:75"), invalid_field_format);
    CHECK_THROWS_AS(gtfsnav::gtfs::time("ab:10:00"), invalid_field_format);
    CHECK_THROWS_AS(gtfsnav::gtfs::time("12::00"), invalid_field_format);
}

TEST_CASE("Time not provided")
{
    gtfsnav::gtfs::time stop_time("");
    CHECK(!stop_time.is_provided());
    CHECK(!gtfsnav::gtfs::time().is_provided());
}
