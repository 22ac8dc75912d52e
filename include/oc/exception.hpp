#pragma once
#include <stdexcept>
#include <string>

namespace oc {

////////////////
// validation error
////////////////

// thrown by every function in 'oc::validate' when its condition fails,
// catchable as std::invalid_argument
class validation_error : public std::invalid_argument {
    bool has_message_;

public:
    validation_error() : std::invalid_argument{""}, has_message_{false} {
    }

    validation_error(const std::string& msg)
        : std::invalid_argument{msg}, has_message_{true} {
    }

    [[nodiscard]] bool has_message() const noexcept {
        return has_message_;
    }
};

} /* namespace oc */
