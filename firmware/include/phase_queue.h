#pragma once
#include <stdint.h>
#include <stddef.h>
#include <deque>
#include "phase.h"
#include "platform_mutex.h"

// =====================================================
// Phase Queue
// =====================================================
// Unbounded FIFO carrying phase notifications from the
// host side (any task, any number of producers) to the
// controller task (single consumer).
//
// push() never fails and only blocks for the short time
// another task holds the lock; tryPop() never waits for
// data. If the mutex could not be created the queue runs
// unlocked, which is only safe with a single task.
// =====================================================

class PhaseQueue {
public:
    PhaseQueue();
    ~PhaseQueue();

    PhaseQueue(const PhaseQueue&) = delete;
    PhaseQueue& operator=(const PhaseQueue&) = delete;

    void push(const Phase& phase);

    // Remove the oldest phase into out. Returns false if empty.
    bool tryPop(Phase& out);

    size_t size() const;

private:
    platform_mutex_t _mutex;
    std::deque<Phase> _items;
};
