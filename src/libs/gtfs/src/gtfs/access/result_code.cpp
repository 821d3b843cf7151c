#include <gtfs/access/result_code.h>

namespace gtfsnav::gtfs::access
{
const char* to_string(result_code code)
{
    switch (code)
    {
        case OK: return "ok";
        case END_OF_FILE: return "end of file";
        case ERROR_INVALID_GTFS_PATH: return "invalid GTFS path";
        case ERROR_FILE_ABSENT: return "file absent";
        case ERROR_REQUIRED_FIELD_ABSENT: return "required field absent";
        case ERROR_INVALID_FIELD_FORMAT: return "invalid field format";
        case ERROR_INVALID_STOP_HIERARCHY: return "invalid stop hierarchy";
    }
    return "unknown";
}
}
