#pragma once

#include <tkb/tkb_error.h>

#include <stdexcept>
#include <string>

namespace tkb {

/**
 * Error - exception thrown by the C++ core
 *
 * Carries the status code the C layer reports for it.
 */
class Error : public std::runtime_error {
public:
    Error(tkb_error_t code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    tkb_error_t code() const { return code_; }

private:
    tkb_error_t code_;
};

} // namespace tkb
