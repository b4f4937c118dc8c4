// Platform mutex implementation for native (host) builds
#include "platform_mutex.h"
#include <mutex>
#include <new>

struct platform_mutex {
    std::mutex m;
};

platform_mutex_t platform_mutex_create() {
    return new (std::nothrow) platform_mutex();
}

void platform_mutex_destroy(platform_mutex_t mutex) {
    delete mutex;
}

void platform_mutex_lock(platform_mutex_t mutex) {
    mutex->m.lock();
}

void platform_mutex_unlock(platform_mutex_t mutex) {
    mutex->m.unlock();
}
