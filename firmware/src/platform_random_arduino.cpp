// Platform random implementation for Arduino framework
#include "platform_random.h"
#include <Arduino.h>

static constexpr long UNIT_RESOLUTION = 1000000;

void platform_random_seed(uint32_t seed) {
    randomSeed(seed);
}

float platform_random_unit() {
    return random(UNIT_RESOLUTION) / (float)UNIT_RESOLUTION;
}

int32_t platform_random_range(int32_t lo, int32_t hi) {
    if (hi <= lo) {
        return lo;
    }
    return (int32_t)random(lo, (long)hi + 1);
}
