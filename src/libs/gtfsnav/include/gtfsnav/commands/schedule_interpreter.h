#pragma once
#include <gtfsnav/commands/command_interpreter.h>
#include <gtfsnav/commands/printer.h>
#include <gtfsnav/navigation/node.h>

namespace gtfsnav::commands
{
/**
 * @brief top level of a node: info, or one of its routes, stops and trips collections
 */
class schedule_interpreter : public command_interpreter
{
public:
    schedule_interpreter(navigation::node::ptr current, printer& out);

    result interpret(const command_path& path) override;

private:
    void info();
    void describe_entity();

    navigation::node::ptr node_;
    printer& printer_;
};
}
