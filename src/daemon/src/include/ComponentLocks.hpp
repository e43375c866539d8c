/*
 * MicrogridControl — Per-component critical sections
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "Types.hpp"

namespace mgc {

/*
 * One mutex per registered component, kept for the lifetime of the session.
 * The table lock is only held for the lookup, never while a component lock
 * is awaited, and no caller ever holds two component locks.
 */
class ComponentLocks {
public:
    ComponentLocks() = default;
    ComponentLocks(const ComponentLocks&) = delete;
    ComponentLocks& operator=(const ComponentLocks&) = delete;

    /* Creates the mutex for `id`; a no-op when it already exists. */
    void add(ComponentId id);

    /* Throws ControlError(NotFound) for an id that was never added. */
    std::unique_lock<std::mutex> acquire(ComponentId id);

    size_t size() const;

private:
    std::mutex& mutexFor(ComponentId id);

    mutable std::mutex tableMtx_;
    std::unordered_map<ComponentId, std::unique_ptr<std::mutex>> locks_;
};

} // namespace mgc
