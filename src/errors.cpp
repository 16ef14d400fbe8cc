#include "swiftdrop/errors.hpp"

namespace swiftdrop {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Crypto:
            return "crypto";
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

}  // namespace swiftdrop
