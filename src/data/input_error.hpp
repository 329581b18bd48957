#pragma once

#include <stdexcept>
#include <string>

namespace exit_code {
    constexpr int OK                   = 0;
    constexpr int USAGE                = 1;
    constexpr int FILE_NOT_FOUND       = 2;
    constexpr int MISSING_CAPABILITY   = 3;
    constexpr int MALFORMED_INPUT      = 4;
    constexpr int INSUFFICIENT_HISTORY = 5;
}  // namespace exit_code

// ---------------------------------------------------------------------------
// InputError — structural input failure; aborts the run with `code()`
// ---------------------------------------------------------------------------
class InputError : public std::runtime_error {
public:
    InputError(int code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};
