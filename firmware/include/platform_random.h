#pragma once
#include <stdint.h>

// =====================================================
// Platform Random Abstraction
// =====================================================
// Pseudo-random numbers for animations. Not suitable for
// anything security related.
// =====================================================

// Reseed the generator (tests use a fixed seed)
void platform_random_seed(uint32_t seed);

// Uniform float in [0, 1)
float platform_random_unit();

// Uniform integer in [lo, hi] (inclusive)
int32_t platform_random_range(int32_t lo, int32_t hi);
