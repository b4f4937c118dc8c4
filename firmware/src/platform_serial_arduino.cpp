// Platform serial implementation for Arduino framework
#include "platform_serial.h"
#include "platform_mutex.h"
#include <Arduino.h>

// Serializes whole lines between the main loop and the
// LED task. Stays nullptr (unlocked) if creation failed.
static platform_mutex_t g_txMutex = nullptr;

void platform_serial_begin(uint32_t baud) {
    if (!g_txMutex) {
        g_txMutex = platform_mutex_create();
    }
    Serial.begin(baud);
}

int platform_serial_available() {
    return Serial.available();
}

int platform_serial_read() {
    if (Serial.available() > 0) {
        return Serial.read();
    }
    return -1;
}

void platform_serial_println(const char* line) {
    PlatformLock lock(g_txMutex);
    Serial.print(line);
    Serial.print("\r\n");
}

void platform_serial_flush() {
    PlatformLock lock(g_txMutex);
    Serial.flush();
}
