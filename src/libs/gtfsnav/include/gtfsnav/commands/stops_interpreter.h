#pragma once
#include <gtfsnav/commands/collection_interpreter.h>

namespace gtfsnav::commands
{
class stops_interpreter : public collection_interpreter
{
public:
    stops_interpreter(navigation::node::ptr current, printer& out);

protected:
    void list() override;
    size_t count() const override;
    bool contains(const gtfs::Id& id) const override;
    const char* label() const override { return "Stops"; }
};
}
