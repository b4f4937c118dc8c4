#pragma once
#include <stdint.h>

// =====================================================
// RGB Color
// =====================================================
// 8-bit per channel color as sent to the strip.
// =====================================================

struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

constexpr Rgb COLOR_BLACK     = {0x00, 0x00, 0x00};
constexpr Rgb COLOR_WHITE     = {0xFF, 0xFF, 0xFF};
constexpr Rgb COLOR_RED       = {0xFF, 0x00, 0x00};
constexpr Rgb COLOR_GREEN     = {0x00, 0xFF, 0x00};
constexpr Rgb COLOR_BLUE      = {0x00, 0x00, 0xFF};
constexpr Rgb COLOR_GOLD      = {0xFF, 0xD7, 0x00};
constexpr Rgb COLOR_DARK_TEAL = {0x00, 0x40, 0x40};
constexpr Rgb COLOR_CYAN      = {0x00, 0xC0, 0xFF};

// Convert hue/saturation/value to RGB.
// h is taken modulo 1.0 (any finite value is accepted),
// s and v are clamped to [0, 1]. Each channel is
// round(component * 255).
Rgb hsvToRgb(float h, float s = 1.0f, float v = 1.0f);
