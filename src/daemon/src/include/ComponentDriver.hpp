/*
 * MicrogridControl — Driver capability interface
 * - Narrow seam between the control core and hardware adapters
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

namespace mgc {

/*
 * Implemented by hardware adapters. All calls must be safe to invoke from
 * several threads for different components; the core never issues two
 * concurrent calls for the same component.
 *
 * Commands return false and fill `err` on failure. Reads return an empty
 * optional when the component cannot be reached.
 */
class IComponentDriver {
public:
    virtual ~IComponentDriver() = default;

    /* Inventory discovery. */
    virtual std::vector<ComponentInfo> listComponents() = 0;

    virtual std::optional<Features>      getFeatures(ComponentId id) = 0;
    virtual std::optional<HardwareState> getHardwareState(ComponentId id) = 0;
    virtual std::optional<ErrorState>    getErrorState(ComponentId id) = 0;

    virtual bool setRelay(ComponentId id, RelayKind relay, bool closed, std::string& err) = 0;
    virtual bool setPower(ComponentId id, PowerKind kind, double magnitude, std::string& err) = 0;
    virtual bool ackError(ComponentId id, std::string& err) = 0;

    /* Begins precharging; completion is observed as a closed DC relay. */
    virtual bool startPrecharge(ComponentId id, std::string& err) = 0;
};

} // namespace mgc
