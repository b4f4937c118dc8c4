#pragma once
// =====================================================
// Application Class
// =====================================================
// Wires the host link (serial commands from the photo
// booth) to the LED controller task.
//
// Usage:
//   Application app;
//   app.init();
//   while (true) { app.loop(); }
// =====================================================

#include <stdint.h>
#include "host_link.h"
#include "led_controller.h"

class Application {
public:
    Application();

    // Initialize all components (call once at startup)
    void init();

    // Main loop iteration (call repeatedly)
    void loop();

private:
    LedController _controller;
    HostLink _hostLink;

    // Serial polling interval; host commands are rare
    static constexpr uint32_t POLL_INTERVAL_MS = 5;
};
