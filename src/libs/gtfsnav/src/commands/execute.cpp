#include <gtfsnav/commands/execute.h>
#include <gtfsnav/commands/command_path.h>
#include <gtfsnav/commands/schedule_interpreter.h>

#include <logging/logger.h>

namespace gtfsnav::commands
{
bool execute(const navigation::node::ptr& root, const std::string& line, printer& out, std::ostream& err)
{
    LOG(DEBUG) << "executing '" << line << "'";

    schedule_interpreter interpreter(root, out);
    if (auto res = interpreter.interpret(command_path::parse(line)); res != result_code::OK)
    {
        LOG(DEBUG) << "'" << line << "' failed with " << res.message();
        err << res.message() << std::endl;
        return false;
    }
    return true;
}
}
