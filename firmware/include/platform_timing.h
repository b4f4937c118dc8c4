#pragma once
#include <stdint.h>

// =====================================================
// Platform Timing Abstraction
// =====================================================
// This abstraction layer keeps the controller and host
// link independent of the Arduino core, so the same code
// runs on the board and in native unit tests.
//
// Usage:
//   - Include this header instead of Arduino.h for timing
//   - Call platform_timing_init() once at startup
//   - Use platform_millis(), platform_delay_ms()
// =====================================================

// Initialize timing system (call once at startup)
void platform_timing_init();

// Get milliseconds since startup (wraps every ~49 days)
uint32_t platform_millis();

// Blocking delay in milliseconds. Inside a task this yields
// the CPU to other tasks for the duration.
void platform_delay_ms(uint32_t ms);
