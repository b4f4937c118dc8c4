#pragma once
#include <stdint.h>
#include "color.h"

// =====================================================
// Blinker
// =====================================================
// Two-step (on/off) blink pattern for a single pixel,
// clocked by the caller: advance() is given the time
// that passed since the previous call. The color it
// produces is overlaid on the strip by the controller.
//
// After reset() the blinker is in the off step with no
// time elapsed, so the first toggle happens offMs later.
// =====================================================

class Blinker {
public:
    Blinker();

    // Set colors and step durations (does not reset timing)
    void configure(Rgb onColor, Rgb offColor, uint32_t onMs, uint32_t offMs);

    void setEnabled(bool enabled) { _enabled = enabled; }
    bool isEnabled() const { return _enabled; }

    // Back to the off step, no time elapsed
    void reset();

    // Advance by deltaMs. Returns true if the on/off step
    // toggled (the overlay color changed). A disabled
    // blinker never toggles.
    bool advance(uint32_t deltaMs);

    bool isOn() const { return _isOn; }
    Rgb color() const { return _isOn ? _onColor : _offColor; }

    uint32_t onMs() const { return _onMs; }
    uint32_t offMs() const { return _offMs; }

private:
    Rgb _onColor;
    Rgb _offColor;
    uint32_t _onMs;
    uint32_t _offMs;
    bool _enabled;
    bool _isOn;
    uint32_t _elapsedMs;
};
