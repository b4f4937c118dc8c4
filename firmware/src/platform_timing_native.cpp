// Platform timing implementation for native (host) builds
#include "platform_timing.h"
#include "platform_native.h"
#include <atomic>
#include <chrono>
#include <thread>

static std::chrono::steady_clock::time_point g_start = std::chrono::steady_clock::now();
static std::atomic<uint32_t> g_delayedMs(0);

void platform_timing_init() {
    g_start = std::chrono::steady_clock::now();
}

uint32_t platform_millis() {
    auto elapsed = std::chrono::steady_clock::now() - g_start;
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

void platform_delay_ms(uint32_t ms) {
    g_delayedMs += ms;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

uint32_t platform_native_delayed_ms() {
    return g_delayedMs.load();
}
