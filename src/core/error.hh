#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rune {

    enum class ErrorKind {
        eResourceExhausted,
        eInvariantViolation,
        eTimeout,
        eDeviceLost,
        eDeviceUnsuitable,
        eApiFailure,
    };

    std::string_view to_string(ErrorKind kind);

    //____________________________________
    // Everything the engine throws. The kind tells the caller whether the
    // failure came from exhaustion, a logic bug or the device itself.
    class Error : public std::runtime_error {
        public:
            Error(ErrorKind kind, const std::string& msg);

            ErrorKind kind() const noexcept { return _kind; }

        private:
            ErrorKind _kind;
    };
}
