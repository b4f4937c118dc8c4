// Platform task implementation for Arduino-ESP32 (FreeRTOS)
#include "platform_task.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <new>

struct TaskStart {
    platform_task_entry_t entry;
    void* arg;
};

// FreeRTOS tasks must not return: run the entry, then delete self
static void taskTrampoline(void* param) {
    TaskStart* start = static_cast<TaskStart*>(param);
    platform_task_entry_t entry = start->entry;
    void* arg = start->arg;
    delete start;

    entry(arg);
    vTaskDelete(nullptr);
}

bool platform_task_start(const char* name,
                         platform_task_entry_t entry,
                         void* arg,
                         uint32_t stackBytes,
                         uint32_t priority) {
    if (!entry) {
        return false;
    }

    TaskStart* start = new (std::nothrow) TaskStart{entry, arg};
    if (!start) {
        return false;
    }
    // Stack depth is given in bytes on ESP-IDF
    BaseType_t ok = xTaskCreate(taskTrampoline, name, stackBytes, start,
                                (UBaseType_t)priority, nullptr);
    if (ok != pdPASS) {
        delete start;
        return false;
    }
    return true;
}
