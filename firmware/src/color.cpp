#include "color.h"
#include <math.h>

static float clampUnit(float x) {
    if (x < 0.0f) return 0.0f;
    if (x > 1.0f) return 1.0f;
    return x;
}

static uint8_t toChannel(float x) {
    return static_cast<uint8_t>(lroundf(clampUnit(x) * 255.0f));
}

Rgb hsvToRgb(float h, float s, float v) {
    s = clampUnit(s);
    v = clampUnit(v);

    if (s == 0.0f) {
        uint8_t c = toChannel(v);
        return {c, c, c};
    }

    h = h - floorf(h);  // wrap into [0, 1)

    int sector = static_cast<int>(h * 6.0f);
    float f = h * 6.0f - sector;
    float p = v * (1.0f - s);
    float q = v * (1.0f - s * f);
    float t = v * (1.0f - s * (1.0f - f));

    switch (sector % 6) {
        case 0:  return {toChannel(v), toChannel(t), toChannel(p)};
        case 1:  return {toChannel(q), toChannel(v), toChannel(p)};
        case 2:  return {toChannel(p), toChannel(v), toChannel(t)};
        case 3:  return {toChannel(p), toChannel(q), toChannel(v)};
        case 4:  return {toChannel(t), toChannel(p), toChannel(v)};
        default: return {toChannel(v), toChannel(p), toChannel(q)};
    }
}
