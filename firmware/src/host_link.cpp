#include "host_link.h"
#include "fw_config.h"
#include "board_config.h"
#include "platform_serial.h"
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

// ========= util =========
bool HostLink::parseUnsigned(const char* token, uint32_t& out) {
    if (!token || *token == '\0') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long value = strtoul(token, &end, 10);
    if (*end != '\0' || token[0] == '-') return false;
    // unsigned long is 64 bits on native builds
    if (errno == ERANGE || value > 0xFFFFFFFFUL) return false;
    out = (uint32_t)value;
    return true;
}

// "NONE" (or -1) means no index
bool HostLink::parseOptionalIndex(const char* token, int32_t& out) {
    if (!token) return false;
    if (strcasecmp(token, "NONE") == 0 || strcmp(token, "-1") == 0) {
        out = -1;
        return true;
    }
    uint32_t value = 0;
    if (!parseUnsigned(token, value) || value > 0x7FFF) return false;
    out = (int32_t)value;
    return true;
}

// Copy token into out, replacing characters that would
// break the JSON string it is embedded in
static void copyJsonSafe(char* out, size_t outSize, const char* token) {
    size_t i = 0;
    for (; token[i] && i + 1 < outSize; i++) {
        char c = token[i];
        out[i] = (c == '"' || c == '\\') ? '\'' : c;
    }
    out[i] = '\0';
}

void HostLink::reply(const char* line) {
    platform_serial_println(line);
    platform_serial_flush();
}

void HostLink::replyError(const char* msg) {
    char line[REPLY_BUF_SIZE];
    snprintf(line, sizeof(line), "{\"event\":\"error\",\"msg\":\"%s\"}", msg);
    reply(line);
}

HostLink::HostLink(LedController& controller)
    : _controller(controller)
    , _len(0)
    , _overflow(false)
{
}

void HostLink::begin(unsigned long baud)
{
    platform_serial_begin(baud);

    // Drop anything received while the port was coming up
    while (platform_serial_available() > 0) {
        platform_serial_read();
    }

    // Reset command buffer state
    _len = 0;
    _overflow = false;
}

// Call inside loop()
void HostLink::poll()
{
    while (platform_serial_available() > 0)
    {
        int c = platform_serial_read();
        if (c < 0) break;  // No data available

        // Support \r\n / \n as line endings
        if (c == '\r')
            continue;

        if (c == '\n')
        {
            _buf[_len] = '\0';
            if (_overflow)
            {
                replyError("line too long");
            }
            else if (_len > 0)
            {
                handleLine(_buf);
            }
            _len = 0;
            _overflow = false;
        }
        else if (_len < CMD_BUF_SIZE - 1)
        {
            _buf[_len++] = (char)c;
        }
        else
        {
            // Too long, discard the rest of this line
            _overflow = true;
        }
    }
}

void HostLink::handleLine(const char* line)
{
    // Skip leading whitespace
    while (*line == ' ' || *line == '\t')
        line++;
    if (*line == '\0')
        return;

    // Copy into a modifiable buffer for strtok
    char tmp[CMD_BUF_SIZE];
    strncpy(tmp, line, CMD_BUF_SIZE - 1);
    tmp[CMD_BUF_SIZE - 1] = '\0';

    char* cmd = strtok(tmp, " \t");
    if (!cmd)
        return;

    char* args = strtok(nullptr, "");

    if (strcasecmp(cmd, "HELLO") == 0)
    {
        cmdHello();
    }
    else if (strcasecmp(cmd, "CONFIG") == 0)
    {
        cmdConfig(args);
    }
    else if (strcasecmp(cmd, "PHASE") == 0)
    {
        cmdPhase(args);
    }
    else
    {
        char msg[CMD_BUF_SIZE + 24];
        char safeCmd[CMD_BUF_SIZE];
        copyJsonSafe(safeCmd, sizeof(safeCmd), cmd);
        snprintf(msg, sizeof(msg), "unknown command: %s", safeCmd);
        replyError(msg);
    }
}

void HostLink::cmdHello()
{
    char line[REPLY_BUF_SIZE];
    snprintf(line, sizeof(line),
             "{\"event\":\"hello\",\"name\":\"%s\",\"fw\":\"%s\","
             "\"build\":\"%s %s\",\"hash\":\"%s\"}",
             FW_NAME, FW_VERSION_STRING, FW_BUILD_DATE, FW_BUILD_TIME, FW_BUILD_HASH);
    reply(line);
}

// CONFIG <channel|NONE> <pixel_count> <left|NONE> <right|NONE>
void HostLink::cmdConfig(char* args)
{
    if (!args) {
        replyError("CONFIG args");
        return;
    }
    char* tokChannel = strtok(args, " \t");
    char* tokCount = strtok(nullptr, " \t");
    char* tokLeft = strtok(nullptr, " \t");
    char* tokRight = strtok(nullptr, " \t");
    if (!tokChannel || !tokCount || !tokLeft || !tokRight || strtok(nullptr, " \t")) {
        replyError("CONFIG args");
        return;
    }

    int32_t channel = -1;
    if (!parseOptionalIndex(tokChannel, channel) || channel >= STRIP_CHANNEL_COUNT) {
        replyError("invalid channel");
        return;
    }

    uint32_t count = 0;
    if (!parseUnsigned(tokCount, count) || count > (uint32_t)STRIP_MAX_PIXELS) {
        replyError("invalid pixel_count");
        return;
    }

    int32_t left = -1;
    int32_t right = -1;
    if (!parseOptionalIndex(tokLeft, left) || !parseOptionalIndex(tokRight, right)) {
        replyError("invalid button pixel");
        return;
    }

    StripConfig config;
    config.channel = (int8_t)channel;
    config.pixelCount = (uint16_t)count;
    config.leftButtonPixel = (int16_t)left;
    config.rightButtonPixel = (int16_t)right;

    bool changed = _controller.applyConfiguration(config);

    reply(changed ? "{\"event\":\"ack\",\"cmd\":\"CONFIG\",\"changed\":true}"
                  : "{\"event\":\"ack\",\"cmd\":\"CONFIG\",\"changed\":false}");
}

// PHASE <name> [capture_count]
void HostLink::cmdPhase(char* args)
{
    if (!args) {
        replyError("PHASE args");
        return;
    }
    char* tokName = strtok(args, " \t");
    char* tokCount = strtok(nullptr, " \t");
    if (!tokName || strtok(nullptr, " \t")) {
        replyError("PHASE args");
        return;
    }

    Phase::Kind kind;
    if (!Phase::parseKind(tokName, kind)) {
        replyError("unknown phase");
        return;
    }

    Phase phase(kind);
    if (kind == Phase::Kind::Chosen) {
        uint32_t captures = 0;
        if (tokCount && (!parseUnsigned(tokCount, captures) || captures > 255)) {
            replyError("invalid capture_count");
            return;
        }
        phase = Phase::chosen((uint8_t)captures);
    } else if (tokCount) {
        replyError("PHASE args");
        return;
    }

    _controller.switchState(phase);

    char line[REPLY_BUF_SIZE];
    snprintf(line, sizeof(line), "{\"event\":\"ack\",\"cmd\":\"PHASE\",\"phase\":\"%s\"}",
             phase.name());
    reply(line);
}
