#include <gtfsnav/commands/command_path.h>

#include <algorithm>
#include <stdexcept>

namespace gtfsnav::commands
{
command_path::command_path(std::vector<std::string> segments) :
    segments_(std::move(segments))
{
}

command_path command_path::parse(const std::string& line)
{
    static const std::string whitespace = " \t\r\n";
    const auto first = line.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return {};
    const auto last = line.find_last_not_of(whitespace);
    const std::string trimmed = line.substr(first, last - first + 1);

    std::vector<std::string> segments;
    size_t start = 0;
    while (true)
    {
        const auto dot = trimmed.find('.', start);
        segments.push_back(trimmed.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    return command_path(std::move(segments));
}

const std::string& command_path::head() const
{
    if (segments_.empty())
        throw std::out_of_range("head of an empty command path");
    return segments_.front();
}

command_path command_path::drop(size_t count) const
{
    count = std::min(count, segments_.size());
    return command_path({segments_.begin() + static_cast<std::ptrdiff_t>(count), segments_.end()});
}

std::string command_path::join(size_t count) const
{
    count = std::min(count, segments_.size());
    std::string res;
    for (size_t i = 0; i < count; ++i)
    {
        if (i)
            res += '.';
        res += segments_[i];
    }
    return res;
}
}
