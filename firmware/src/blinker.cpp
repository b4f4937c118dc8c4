#include "blinker.h"

Blinker::Blinker()
    : _onColor(COLOR_WHITE)
    , _offColor(COLOR_BLACK)
    , _onMs(500)
    , _offMs(500)
    , _enabled(false)
    , _isOn(false)
    , _elapsedMs(0)
{
}

void Blinker::configure(Rgb onColor, Rgb offColor, uint32_t onMs, uint32_t offMs) {
    _onColor = onColor;
    _offColor = offColor;
    _onMs = onMs;
    _offMs = offMs;
}

void Blinker::reset() {
    _isOn = false;
    _elapsedMs = 0;
}

bool Blinker::advance(uint32_t deltaMs) {
    if (!_enabled) {
        return false;
    }

    _elapsedMs += deltaMs;
    uint32_t stepMs = _isOn ? _onMs : _offMs;
    if (_elapsedMs < stepMs) {
        return false;
    }

    // At most one toggle per call; the remainder carries
    // into the next step so the period does not drift.
    _elapsedMs -= stepMs;
    _isOn = !_isOn;
    uint32_t nextMs = _isOn ? _onMs : _offMs;
    if (_elapsedMs > nextMs) {
        _elapsedMs = nextMs;
    }
    return true;
}
