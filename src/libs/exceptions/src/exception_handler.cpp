#include "exception_handler.h"

#include <logging/logger.h>

#include <cstdlib>
#include <cxxabi.h>
#include <iostream>
#include <memory>
#include <string>
#include <typeinfo>

namespace exceptions
{
namespace
{
[[noreturn]] void log_and_abort()
{
    const std::exception_ptr eptr = std::current_exception();
    if (!eptr)
    {
        LOG(CRITICAL) << "terminate called without an active exception";
        std::abort();
    }

    const std::string type_name = current_exception_type_name();
    try
    {
        std::rethrow_exception(eptr);
    }
    catch (const std::exception& exc)
    {
        LOG(CRITICAL) << "Uncaught exception of type '" << type_name << "': " << exc.what();
    }
    catch (...)
    {
        LOG(CRITICAL) << "Uncaught instance of type '" << type_name << "'";
    }

    std::cerr.flush();
    std::abort();// forces abnormal termination
}
}

std::string current_exception_type_name()
{
    const std::type_info* type_info = abi::__cxa_current_exception_type();
    if (!type_info)
        return "unknown";

    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
            abi::__cxa_demangle(type_info->name(), nullptr, nullptr, &status), std::free);
    return status == 0 && demangled ? std::string(demangled.get()) : std::string(type_info->name());
}

exception_handler::exception_handler() :
    previous_(std::set_terminate(log_and_abort))
{
}

exception_handler::~exception_handler()
{
    std::set_terminate(previous_);
}

}// namespace exceptions
