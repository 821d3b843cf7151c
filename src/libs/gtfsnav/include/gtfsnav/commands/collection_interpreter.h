#pragma once
#include <gtfsnav/commands/command_interpreter.h>
#include <gtfsnav/commands/printer.h>
#include <gtfsnav/navigation/node.h>

#include <memory>

namespace gtfsnav::commands
{
/**
 * @brief list, info, or an entity id whose projection becomes the child node for the rest of the path
 */
class collection_interpreter : public command_interpreter
{
public:
    collection_interpreter(navigation::node::ptr current, printer& out, navigation::node_kind kind);

    result interpret(const command_path& path) override;

protected:
    virtual void list() = 0;
    virtual size_t count() const = 0;
    virtual bool contains(const gtfs::Id& id) const = 0;
    virtual const char* label() const = 0;

    const gtfs::schedule& get_schedule() const { return node_->get_schedule(); }

    navigation::node::ptr node_;
    printer& printer_;

private:
    result enter(const gtfs::Id& id, const command_path& rest);

    navigation::node_kind kind_;
};

std::unique_ptr<collection_interpreter> make_collection_interpreter(navigation::node_kind kind,
                                                                    navigation::node::ptr current,
                                                                    printer& out);
}
