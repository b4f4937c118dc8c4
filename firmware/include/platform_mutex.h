#pragma once
#include <stdbool.h>

// =====================================================
// Platform Mutex Abstraction
// =====================================================
// Non-recursive mutual exclusion between tasks.
// Board: FreeRTOS mutex semaphore. Native: std::mutex.
// =====================================================

typedef struct platform_mutex* platform_mutex_t;

// Create a mutex. Returns nullptr if out of memory.
platform_mutex_t platform_mutex_create();

// Release all resources held by the mutex (must be unlocked)
void platform_mutex_destroy(platform_mutex_t mutex);

// Block until the mutex is owned by the caller
void platform_mutex_lock(platform_mutex_t mutex);

void platform_mutex_unlock(platform_mutex_t mutex);

// Scoped lock helper for C++ callers
class PlatformLock {
public:
    explicit PlatformLock(platform_mutex_t mutex) : _mutex(mutex) {
        if (_mutex) platform_mutex_lock(_mutex);
    }
    ~PlatformLock() {
        if (_mutex) platform_mutex_unlock(_mutex);
    }

    PlatformLock(const PlatformLock&) = delete;
    PlatformLock& operator=(const PlatformLock&) = delete;

private:
    platform_mutex_t _mutex;
};
