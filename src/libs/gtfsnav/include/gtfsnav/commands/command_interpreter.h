#pragma once
#include <gtfsnav/commands/command_path.h>
#include <gtfsnav/result.h>

namespace gtfsnav::commands
{
class command_interpreter
{
public:
    virtual ~command_interpreter() = default;

    // Consumes the head of path and hands the rest to the next level.
    virtual result interpret(const command_path& path) = 0;
};
}
