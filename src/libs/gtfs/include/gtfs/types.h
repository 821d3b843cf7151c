#pragma once
#include <string>
namespace gtfsnav::gtfs
{
// Custom types for GTFS fields --------------------------------------------------------------------
// Id of GTFS entity, a sequence of any UTF-8 characters. Used as type for ID GTFS fields.
using Id = std::string;
// A string of UTF-8 characters. Used as type for Text GTFS fields.
using Text = std::string;
// An IANA timezone name, e.g. America/New_York.
using Timezone = std::string;

using Message = std::string;
}
