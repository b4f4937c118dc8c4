#pragma once
// =====================================================
// Board Configuration
// =====================================================
// Central location for all hardware pin definitions and
// task parameters. Override any value via build flags:
//   -DSTRIP_CHANNEL0_PIN=18
// =====================================================

#include <stdint.h>

// =====================================================
// Light Strip Data Pins
// =====================================================
// The host selects a strip output by channel number.
// Channel 0: primary strip connector
// Channel 1: secondary strip connector

#ifndef STRIP_CHANNEL0_PIN
#define STRIP_CHANNEL0_PIN 18
#endif

#ifndef STRIP_CHANNEL1_PIN
#define STRIP_CHANNEL1_PIN 5
#endif

#define STRIP_CHANNEL_COUNT 2

// Upper bound accepted from the host (RAM for pixel buffers)
#ifndef STRIP_MAX_PIXELS
#define STRIP_MAX_PIXELS 1024
#endif

// =====================================================
// Host Serial Port
// =====================================================

#ifndef HOST_SERIAL_BAUD
#define HOST_SERIAL_BAUD 115200
#endif

// =====================================================
// Controller Task
// =====================================================

#ifndef LED_TASK_STACK_BYTES
#define LED_TASK_STACK_BYTES 4096
#endif

#ifndef LED_TASK_PRIORITY
#define LED_TASK_PRIORITY 2
#endif
