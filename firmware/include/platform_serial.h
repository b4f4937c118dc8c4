#pragma once
#include <stdint.h>
#include <stddef.h>

// =====================================================
// Platform Serial/USB Abstraction
// =====================================================
// Line-oriented serial port shared by the host link (main
// loop) and the event log (any task). Output is written
// in whole lines only, so replies and log lines from
// different tasks never interleave.
// Arduino: Serial (USB CDC on ESP32-S3).
// Native: in-memory buffers (see platform_native.h).
//
// Usage:
//   - Call platform_serial_begin() once at startup
//   - Use platform_serial_* functions instead of Serial.*
// =====================================================

// Initialize serial/USB communication
// baud: baud rate (ignored for USB CDC, kept for compatibility)
void platform_serial_begin(uint32_t baud);

// Check if data is available to read
// Returns: number of bytes available (0 if none)
int platform_serial_available();

// Read a single byte from serial buffer
// Returns: byte value (0-255) or -1 if no data available
int platform_serial_read();

// Write one complete line followed by \r\n. Safe to call
// from any task.
void platform_serial_println(const char* line);

// Flush output buffer (wait for transmission to complete)
void platform_serial_flush();
