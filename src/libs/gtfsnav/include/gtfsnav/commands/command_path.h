#pragma once
#include <string>
#include <vector>

namespace gtfsnav::commands
{
/**
 * @brief an input line split at '.' into segments, consumed head first
 */
class command_path
{
public:
    command_path() = default;
    explicit command_path(std::vector<std::string> segments);

    // Surrounding whitespace of the line is dropped, a blank line has no segments.
    static command_path parse(const std::string& line);

    bool empty() const { return segments_.empty(); }
    size_t size() const { return segments_.size(); }

    const std::string& head() const;
    command_path tail() const { return drop(1); }
    command_path drop(size_t count) const;

    // The first count segments joined with '.'
    std::string join(size_t count) const;
    std::string to_string() const { return join(segments_.size()); }

    const std::vector<std::string>& segments() const { return segments_; }

private:
    std::vector<std::string> segments_;
};
}
