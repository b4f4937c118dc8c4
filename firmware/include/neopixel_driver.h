#pragma once
#include <stdint.h>
#include <vector>
#include "pixel_driver.h"

class Adafruit_NeoPixel;

// =====================================================
// NeoPixel Strip Driver
// =====================================================
// WS2812-style strips through the Adafruit NeoPixel
// library (GRB, 800 kHz). Channels map to data pins:
//   channel 0 -> STRIP_CHANNEL0_PIN
//   channel 1 -> STRIP_CHANNEL1_PIN
// Pixel memory is mirrored locally so getPixel() returns
// exactly what was set (the library applies brightness
// scaling to its own buffer).
// =====================================================

class NeoPixelStrip : public IPixelDevice {
public:
    NeoPixelStrip(Adafruit_NeoPixel* pixels, uint16_t count);
    ~NeoPixelStrip() override;

    NeoPixelStrip(const NeoPixelStrip&) = delete;
    NeoPixelStrip& operator=(const NeoPixelStrip&) = delete;

    uint16_t pixelCount() const override { return (uint16_t)_colors.size(); }

    void setPixel(uint16_t index, Rgb color) override;
    Rgb getPixel(uint16_t index) const override;
    void fill(Rgb color) override;
    void show() override;

private:
    Adafruit_NeoPixel* _pixels;
    std::vector<Rgb> _colors;
};

class NeoPixelDriver : public IPixelDriver {
public:
    bool available() const override { return true; }
    IPixelDevice* open(int8_t channel, uint16_t pixelCount) override;
    void close(IPixelDevice* device) override;

    // Data pin for a channel, -1 if the channel is unknown
    static int16_t pinForChannel(int8_t channel);
};
