#pragma once
#include <gtfsnav/result_code.h>

#include <memory>
#include <string>
#include <utility>

namespace gtfsnav
{
/**
 * @brief outcome of a projection or of a command
 *
 * A failure carries the id or command text it is about (the subject) and, when it
 * wraps a failure of a lower level, that failure as its cause. message() renders
 * the whole chain, outermost context first.
 */
class result
{
public:
    result() = default;
    result(result_code code) : code_(code) {} //NOLINT
    result(result_code code, std::string subject) : code_(code), subject_(std::move(subject)) {}
    result(result_code code, std::string subject, result cause);

    bool operator==(result_code code) const { return code_ == code; }
    bool operator!=(result_code code) const { return !(*this == code); }

    result_code code() const { return code_; }
    const std::string& subject() const { return subject_; }
    const result* cause() const { return cause_.get(); }

    // innermost failure of the chain, *this if nothing is wrapped
    const result& root_cause() const;

    std::string message() const;

private:
    result_code code_ = result_code::OK;
    std::string subject_;
    std::shared_ptr<const result> cause_;
};

}
