/*
 * MicrogridControl — Control error taxonomy (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/ControlError.hpp"

namespace mgc {

const char* errorCodeName(ErrorCode c) {
    switch (c) {
        case ErrorCode::NotFound:           return "NotFound";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::PreconditionFailed: return "PreconditionFailed";
        case ErrorCode::InvalidState:       return "InvalidState";
        case ErrorCode::DriverError:        return "DriverError";
        case ErrorCode::Unavailable:        return "Unavailable";
    }
    return "Unknown";
}

} // namespace mgc
