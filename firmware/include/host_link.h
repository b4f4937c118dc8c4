#pragma once
#include <stdint.h>
#include <stddef.h>
#include "led_controller.h"

// =====================================================
// Host Link
// =====================================================
// Line-based command handler on the serial port. The
// photo-booth host sends one command per phase entry:
//
//   HELLO
//   CONFIG <channel|NONE> <pixel_count> <left|NONE> <right|NONE>
//   PHASE <name> [capture_count]
//
// Replies are single JSON lines ({"event":"ack",...} or
// {"event":"error","msg":...}). Commands are forwarded to
// the controller's host-side API and never block on it.
//
// Usage:
//   HostLink link(controller);
//   link.begin();
//   Call link.poll() inside loop()
// =====================================================

class HostLink {
public:
    explicit HostLink(LedController& controller);

    // Initialize serial (adjust baud if needed)
    void begin(unsigned long baud);

    // Call periodically to process input and output responses
    void poll();

    // Process one complete command line (no line terminator)
    void handleLine(const char* line);

private:
    static constexpr size_t CMD_BUF_SIZE = 96;
    static constexpr size_t REPLY_BUF_SIZE = 160;

    LedController& _controller;
    char _buf[CMD_BUF_SIZE];
    size_t _len;
    bool _overflow;

    // commands
    void cmdHello();
    void cmdConfig(char* args);
    void cmdPhase(char* args);

    // utils
    void reply(const char* line);
    void replyError(const char* msg);
    static bool parseOptionalIndex(const char* token, int32_t& out);
    static bool parseUnsigned(const char* token, uint32_t& out);
};
