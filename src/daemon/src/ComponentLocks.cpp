/*
 * MicrogridControl — Per-component critical sections (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/ComponentLocks.hpp"
#include "include/ControlError.hpp"

#include <string>

namespace mgc {

void ComponentLocks::add(ComponentId id) {
    std::lock_guard<std::mutex> lock(tableMtx_);
    auto& slot = locks_[id];
    if (!slot) slot = std::make_unique<std::mutex>();
}

std::mutex& ComponentLocks::mutexFor(ComponentId id) {
    std::lock_guard<std::mutex> lock(tableMtx_);
    auto it = locks_.find(id);
    if (it == locks_.end()) {
        throw ControlError(ErrorCode::NotFound, id, "component " + std::to_string(id) + " not found");
    }
    return *it->second;
}

std::unique_lock<std::mutex> ComponentLocks::acquire(ComponentId id) {
    return std::unique_lock<std::mutex>(mutexFor(id));
}

size_t ComponentLocks::size() const {
    std::lock_guard<std::mutex> lock(tableMtx_);
    return locks_.size();
}

} // namespace mgc
