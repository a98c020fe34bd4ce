#pragma once

#include <stdexcept>
#include <string>

namespace identpick {

/// Raised when ICU cannot provide a service the library depends on
/// (normalization data missing, allocation failure). Never raised for label
/// content: every label, however malformed, has a defined result.
class UnicodeError : public std::runtime_error {
public:
    UnicodeError(const std::string& message, int icuStatus)
        : std::runtime_error(message), status_(icuStatus) {}

    /// The ICU UErrorCode that triggered the failure.
    int status() const { return status_; }

private:
    int status_;
};

} // namespace identpick
