// Platform timing implementation for Arduino framework
#include "platform_timing.h"
#include <Arduino.h>

void platform_timing_init() {
    // Arduino timing is automatically initialized
    // No explicit initialization needed
}

uint32_t platform_millis() {
    return millis();
}

void platform_delay_ms(uint32_t ms) {
    // On ESP32 delay() is vTaskDelay(), other tasks keep running
    delay(ms);
}
