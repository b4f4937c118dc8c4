#pragma once
#include <stdint.h>
#include "color.h"

// =====================================================
// Pixel Device Interface
// =====================================================
// An opened light strip. Pixel memory lives in the
// device; nothing reaches the LEDs until show().
// Indices outside [0, pixelCount()) are ignored by
// setPixel() and read back as black.
// =====================================================

struct IPixelDevice {
    virtual ~IPixelDevice() = default;

    virtual uint16_t pixelCount() const = 0;

    virtual void setPixel(uint16_t index, Rgb color) = 0;
    virtual Rgb getPixel(uint16_t index) const = 0;
    virtual void fill(Rgb color) = 0;

    // Latch pixel memory to the LEDs
    virtual void show() = 0;
};

// =====================================================
// Pixel Driver Interface
// =====================================================
// Opens strips on a numbered output channel. A driver
// that is not available (no strip library or hardware
// support in this build) reports it through available()
// instead of failing at open().
// =====================================================

struct IPixelDriver {
    virtual ~IPixelDriver() = default;

    // Capability query: can this build drive a strip at all
    virtual bool available() const = 0;

    // Open pixelCount pixels on channel.
    // Returns nullptr for unknown channels, pixelCount == 0
    // or when the device cannot be allocated.
    virtual IPixelDevice* open(int8_t channel, uint16_t pixelCount) = 0;

    // Release a device returned by open() (nullptr is ignored)
    virtual void close(IPixelDevice* device) = 0;
};

// Factory function for the board's driver (platform-specific)
IPixelDriver* createPixelDriver();
