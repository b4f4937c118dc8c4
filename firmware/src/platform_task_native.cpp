// Platform task implementation for native (host) builds
#include "platform_task.h"
#include <system_error>
#include <thread>

bool platform_task_start(const char* name,
                         platform_task_entry_t entry,
                         void* arg,
                         uint32_t stackBytes,
                         uint32_t priority) {
    (void)name;
    (void)stackBytes;
    (void)priority;
    if (!entry) {
        return false;
    }

    try {
        std::thread(entry, arg).detach();
    } catch (const std::system_error&) {
        return false;
    }
    return true;
}
