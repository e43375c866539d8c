/*
 * MicrogridControl — Time source
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include "Types.hpp"

namespace mgc {

/* Injected into the engines so expiry can be driven deterministically. */
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual TimePoint now() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

} // namespace mgc
