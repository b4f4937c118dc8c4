#include "application.h"
#include "board_config.h"
#include "event_log.h"
#include "fw_config.h"
#include "platform_timing.h"

Application::Application()
    : _controller(createPixelDriver())
    , _hostLink(_controller)
{
}

void Application::init() {
    // Initialize platform abstractions
    platform_timing_init();

    // Host commands and event log share the serial port
    _hostLink.begin(HOST_SERIAL_BAUD);
    log_info("app", "%s %s starting", FW_NAME, FW_VERSION_STRING);

    // The controller idles until the host sends CONFIG
    if (!_controller.start()) {
        log_error("app", "LED controller not running");
    }
}

void Application::loop() {
    _hostLink.poll();
    platform_delay_ms(POLL_INTERVAL_MS);
}
