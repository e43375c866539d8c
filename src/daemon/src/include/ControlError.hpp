/*
 * MicrogridControl — Control error taxonomy
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <stdexcept>
#include <string>

#include "Types.hpp"

namespace mgc {

enum class ErrorCode {
    NotFound,            // unknown component or metric
    InvalidArgument,     // malformed request, unsupported capability
    PreconditionFailed,  // state-machine guard not met
    InvalidState,        // transition not valid from current lifecycle state
    DriverError,         // hardware call failed or timed out
    Unavailable          // component unreachable
};

const char* errorCodeName(ErrorCode c);

/*
 * Raised by the control core. Carries the failing component and, for
 * action-plan failures, the name of the step that did not complete.
 */
class ControlError : public std::runtime_error {
public:
    ControlError(ErrorCode code, ComponentId id, const std::string& msg, std::string step = {})
        : std::runtime_error(msg), code_(code), id_(id), step_(std::move(step)) {}

    ErrorCode          code()        const noexcept { return code_; }
    ComponentId        componentId() const noexcept { return id_; }
    const std::string& step()        const noexcept { return step_; }

private:
    ErrorCode   code_;
    ComponentId id_;
    std::string step_;
};

} // namespace mgc
