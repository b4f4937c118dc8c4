#include "phase_queue.h"

PhaseQueue::PhaseQueue()
    : _mutex(platform_mutex_create())
{
}

PhaseQueue::~PhaseQueue() {
    if (_mutex) {
        platform_mutex_destroy(_mutex);
        _mutex = nullptr;
    }
}

void PhaseQueue::push(const Phase& phase) {
    PlatformLock lock(_mutex);
    _items.push_back(phase);
}

bool PhaseQueue::tryPop(Phase& out) {
    PlatformLock lock(_mutex);
    if (_items.empty()) {
        return false;
    }
    out = _items.front();
    _items.pop_front();
    return true;
}

size_t PhaseQueue::size() const {
    PlatformLock lock(_mutex);
    return _items.size();
}
