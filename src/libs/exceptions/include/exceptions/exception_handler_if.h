#ifndef EXCEPTIONS_EXCEPTION_HANDLER_IF_H
#define EXCEPTIONS_EXCEPTION_HANDLER_IF_H

namespace exceptions
{
/**
 * @brief keeps process wide exception handling installed for as long as it lives
 */
class exception_handler_if
{
public:
    virtual ~exception_handler_if() = default;
};
}// namespace exceptions

#endif//EXCEPTIONS_EXCEPTION_HANDLER_IF_H
