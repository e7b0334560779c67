#include "error.hh"

#include <fmt/core.h>

namespace rune {

    std::string_view to_string(ErrorKind kind) {
        switch( kind ) {
            case ErrorKind::eResourceExhausted:  return "resource exhausted";
            case ErrorKind::eInvariantViolation: return "invariant violation";
            case ErrorKind::eTimeout:            return "timeout";
            case ErrorKind::eDeviceLost:         return "device lost";
            case ErrorKind::eDeviceUnsuitable:   return "device unsuitable";
            case ErrorKind::eApiFailure:         return "api failure";
        }
        return "unknown";
    }

    Error::Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(fmt::format("[{}] {}", to_string(kind), msg))
        , _kind(kind) {}
}
