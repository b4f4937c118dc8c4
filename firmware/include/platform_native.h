#pragma once
#include <stdint.h>
#include <string>

// =====================================================
// Native Backend Hooks
// =====================================================
// Only available when linking the native platform
// backend (unit tests). Lets tests feed the serial input
// and inspect everything written to the serial output.
// =====================================================

// Append bytes to the serial receive buffer
void platform_native_serial_feed(const char* data);

// Return and clear everything printed so far
std::string platform_native_serial_take_output();

// Total number of milliseconds passed to platform_delay_ms()
uint32_t platform_native_delayed_ms();
