#include "bravejig/result.hpp"

namespace bravejig {

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:         return "none";
        case ErrorKind::Connection:   return "connection";
        case ErrorKind::Timeout:      return "timeout";
        case ErrorKind::Write:        return "write";
        case ErrorKind::Protocol:     return "protocol";
        case ErrorKind::Device:       return "device";
        case ErrorKind::Dfu:          return "dfu";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::Busy:         return "busy";
        case ErrorKind::Invalid:      return "invalid_argument";
    }
    return "unknown";
}

} // namespace bravejig
