// Platform serial implementation for native (host) builds.
// Input and output are in-memory buffers driven by tests.
#include "platform_serial.h"
#include "platform_native.h"
#include <deque>
#include <mutex>
#include <string>

static std::mutex g_serialMutex;
static std::deque<char> g_input;
static std::string g_output;

void platform_serial_begin(uint32_t baud) {
    (void)baud;
}

int platform_serial_available() {
    std::lock_guard<std::mutex> lock(g_serialMutex);
    return (int)g_input.size();
}

int platform_serial_read() {
    std::lock_guard<std::mutex> lock(g_serialMutex);
    if (g_input.empty()) {
        return -1;
    }
    char c = g_input.front();
    g_input.pop_front();
    return (unsigned char)c;
}

void platform_serial_println(const char* line) {
    std::lock_guard<std::mutex> lock(g_serialMutex);
    g_output += line;
    g_output += "\r\n";
}

void platform_serial_flush() {
}

void platform_native_serial_feed(const char* data) {
    std::lock_guard<std::mutex> lock(g_serialMutex);
    for (const char* p = data; *p; ++p) {
        g_input.push_back(*p);
    }
}

std::string platform_native_serial_take_output() {
    std::lock_guard<std::mutex> lock(g_serialMutex);
    std::string out;
    out.swap(g_output);
    return out;
}
