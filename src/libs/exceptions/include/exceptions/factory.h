#ifndef EXCEPTIONS_FACTORY_H
#define EXCEPTIONS_FACTORY_H

#include <memory>

namespace exceptions
{
class exception_handler_if;
class factory
{
public:
    // Installs a terminate handler that logs the uncaught exception before aborting.
    static std::unique_ptr<exception_handler_if> create_exceptions_handler();
};
}  // namespace exceptions
#endif//EXCEPTIONS_FACTORY_H
