#pragma once
#include <stdint.h>

// =====================================================
// Strip Configuration
// =====================================================
// Snapshot of the host's light strip options. The host
// owns the values; the controller receives a copy inside
// every Reconfigure notification.
// =====================================================

struct StripConfig {
    static constexpr int8_t NO_CHANNEL = -1;
    static constexpr int16_t NO_PIXEL = -1;

    int8_t channel = NO_CHANNEL;         // strip output, NO_CHANNEL = none
    uint16_t pixelCount = 0;
    int16_t leftButtonPixel = NO_PIXEL;  // NO_PIXEL = none
    int16_t rightButtonPixel = NO_PIXEL;

    bool hasChannel() const { return channel >= 0; }

    // True if index addresses a pixel of this strip
    bool isValidPixel(int16_t index) const {
        return index >= 0 && index < static_cast<int32_t>(pixelCount);
    }

    bool operator==(const StripConfig& other) const {
        return channel == other.channel &&
               pixelCount == other.pixelCount &&
               leftButtonPixel == other.leftButtonPixel &&
               rightButtonPixel == other.rightButtonPixel;
    }
    bool operator!=(const StripConfig& other) const { return !(*this == other); }
};
