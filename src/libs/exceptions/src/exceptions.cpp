#include <exceptions/exceptions.h>

#include <sstream>

namespace
{
const char* const location_marker = " @";

void add_message(std::ostringstream& oss, const std::string& message, const std::string& file, int line)
{
    oss << message << location_marker << file << ":" << line;
}
}// namespace

std::string make_message(const std::string& message, const std::string& file, int line)
{
    std::ostringstream oss;
    add_message(oss, message, file, line);
    return oss.str();
}

std::string strip_location(const std::string& what)
{
    const auto pos = what.rfind(location_marker);
    if (pos == std::string::npos)
        return what;
    return what.substr(0, pos);
}
