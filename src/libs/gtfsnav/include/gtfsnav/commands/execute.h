#pragma once
#include <gtfsnav/commands/printer.h>
#include <gtfsnav/navigation/node.h>

#include <ostream>
#include <string>

namespace gtfsnav::commands
{
/**
 * @brief runs one command line against root, reports go to out and a failure's message to err
 * @return false when the command failed
 */
bool execute(const navigation::node::ptr& root, const std::string& line, printer& out, std::ostream& err);
}
