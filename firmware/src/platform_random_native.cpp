// Platform random implementation for native (host) builds
#include "platform_random.h"
#include <random>

static std::mt19937 g_rng(12345u);

void platform_random_seed(uint32_t seed) {
    g_rng.seed(seed);
}

float platform_random_unit() {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    float x = dist(g_rng);
    // uniform_real_distribution<float> may round up to 1.0
    return x < 1.0f ? x : 0.0f;
}

int32_t platform_random_range(int32_t lo, int32_t hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_int_distribution<int32_t> dist(lo, hi);
    return dist(g_rng);
}
