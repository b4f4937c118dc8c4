#include "neopixel_driver.h"
#include "board_config.h"
#include "event_log.h"
#include <Adafruit_NeoPixel.h>
#include <new>

static const char* TAG = "strip";

// Data pin for each strip channel
static const int16_t CHANNEL_PINS[STRIP_CHANNEL_COUNT] = {
    STRIP_CHANNEL0_PIN,
    STRIP_CHANNEL1_PIN
};

// =====================================================
// NeoPixelStrip
// =====================================================

NeoPixelStrip::NeoPixelStrip(Adafruit_NeoPixel* pixels, uint16_t count)
    : _pixels(pixels)
    , _colors(count, COLOR_BLACK)
{
}

NeoPixelStrip::~NeoPixelStrip() {
    delete _pixels;
    _pixels = nullptr;
}

void NeoPixelStrip::setPixel(uint16_t index, Rgb color) {
    if (index >= _colors.size()) {
        return;
    }
    _colors[index] = color;
}

Rgb NeoPixelStrip::getPixel(uint16_t index) const {
    if (index >= _colors.size()) {
        return COLOR_BLACK;
    }
    return _colors[index];
}

void NeoPixelStrip::fill(Rgb color) {
    for (size_t i = 0; i < _colors.size(); i++) {
        _colors[i] = color;
    }
}

void NeoPixelStrip::show() {
    for (uint16_t i = 0; i < _colors.size(); i++) {
        const Rgb& c = _colors[i];
        _pixels->setPixelColor(i, c.r, c.g, c.b);
    }
    _pixels->show();
}

// =====================================================
// NeoPixelDriver
// =====================================================

int16_t NeoPixelDriver::pinForChannel(int8_t channel) {
    if (channel < 0 || channel >= STRIP_CHANNEL_COUNT) {
        return -1;
    }
    return CHANNEL_PINS[channel];
}

IPixelDevice* NeoPixelDriver::open(int8_t channel, uint16_t pixelCount) {
    int16_t pin = pinForChannel(channel);
    if (pin < 0) {
        log_error(TAG, "Unknown strip channel %d", channel);
        return nullptr;
    }
    if (pixelCount == 0 || pixelCount > STRIP_MAX_PIXELS) {
        log_error(TAG, "Unsupported pixel count %u", (unsigned)pixelCount);
        return nullptr;
    }

    Adafruit_NeoPixel* pixels =
        new (std::nothrow) Adafruit_NeoPixel(pixelCount, pin, NEO_GRB + NEO_KHZ800);
    if (!pixels) {
        return nullptr;
    }
    // The library leaves numPixels() at 0 if its buffer allocation failed
    if (pixels->numPixels() != pixelCount) {
        log_error(TAG, "Out of memory for %u pixels", (unsigned)pixelCount);
        delete pixels;
        return nullptr;
    }

    pixels->begin();
    pixels->setBrightness(255);  // Colors are sent as rendered
    pixels->clear();
    pixels->show();

    NeoPixelStrip* strip = new (std::nothrow) NeoPixelStrip(pixels, pixelCount);
    if (!strip) {
        delete pixels;
        return nullptr;
    }
    log_info(TAG, "Strip ready on pin %d", pin);
    return strip;
}

void NeoPixelDriver::close(IPixelDevice* device) {
    delete device;
}

// Factory function for the board's pixel driver
IPixelDriver* createPixelDriver() {
    static NeoPixelDriver driver;
    return &driver;
}
