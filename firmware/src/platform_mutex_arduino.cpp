// Platform mutex implementation for Arduino-ESP32 (FreeRTOS)
#include "platform_mutex.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <new>

struct platform_mutex {
    SemaphoreHandle_t handle;
};

platform_mutex_t platform_mutex_create() {
    SemaphoreHandle_t handle = xSemaphoreCreateMutex();
    if (!handle) {
        return nullptr;
    }
    platform_mutex_t mutex = new (std::nothrow) platform_mutex{handle};
    if (!mutex) {
        vSemaphoreDelete(handle);
    }
    return mutex;
}

void platform_mutex_destroy(platform_mutex_t mutex) {
    if (!mutex) {
        return;
    }
    vSemaphoreDelete(mutex->handle);
    delete mutex;
}

void platform_mutex_lock(platform_mutex_t mutex) {
    xSemaphoreTake(mutex->handle, portMAX_DELAY);
}

void platform_mutex_unlock(platform_mutex_t mutex) {
    xSemaphoreGive(mutex->handle);
}
